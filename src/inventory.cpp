#include "megadl/inventory.hpp"

#include "megadl/detail/text.hpp"
#include "megadl/errors.hpp"
#include "megadl/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace megadl {

namespace {

constexpr double kKiB = 1024.0;

struct SizeAnnotation {
    std::string_view path;
    double size_mb{0.0};
};

// Splits "path (12.3 MB)" into the path and the size in MB.
std::optional<SizeAnnotation> splitSizeAnnotation(std::string_view line) {
    line = detail::trim(line);
    if (line.empty() || line.back() != ')') {
        return std::nullopt;
    }
    const auto open = line.rfind('(');
    if (open == std::string_view::npos) {
        return std::nullopt;
    }

    const auto inner = detail::trim(line.substr(open + 1, line.size() - open - 2));
    const auto space = inner.find(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }

    const std::string number{inner.substr(0, space)};
    const auto unit = detail::trim(inner.substr(space + 1));
    char* end = nullptr;
    const double value = std::strtod(number.c_str(), &end);
    if (end == number.c_str() || *end != '\0' || value < 0.0) {
        return std::nullopt;
    }

    try {
        return SizeAnnotation{detail::trim(line.substr(0, open)), normalizeToMb(value, unit)};
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

bool endsWithNoCase(const std::string& text, const std::string& suffix) {
    if (suffix.size() > text.size()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

double normalizeToMb(double value, std::string_view unit) {
    if (unit == "MB") {
        return value;
    }
    if (unit == "GB") {
        return value * kKiB;
    }
    if (unit == "KB") {
        return value / kKiB;
    }
    if (unit == "B") {
        return value / (kKiB * kKiB);
    }
    throw std::invalid_argument(fmt::format("Unsupported size unit: '{}'", unit));
}

std::vector<RemoteEntry> parseListing(std::string_view output) {
    std::vector<RemoteEntry> entries;
    for (const auto line : detail::splitLines(output)) {
        const auto annotated = splitSizeAnnotation(line);
        if (!annotated) {
            if (!detail::trim(line).empty()) {
                logger()->debug("Skipping listing line without size: '{}'", line);
            }
            continue;
        }

        std::string joined;
        std::string_view last;
        std::string_view rest = annotated->path;
        while (!rest.empty()) {
            const auto slash = rest.find('/');
            const auto segment = rest.substr(0, slash);
            if (!segment.empty()) {
                if (!joined.empty()) {
                    joined.push_back('/');
                }
                joined.append(segment);
                last = segment;
            }
            if (slash == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(slash + 1);
        }

        if (last.empty()) {
            logger()->debug("Skipping listing line without a name: '{}'", line);
            continue;
        }
        entries.push_back({shellQuote(joined), std::string(last), annotated->size_mb});
    }
    return entries;
}

InventoryLister::InventoryLister(TransferAgent& agent, std::vector<std::string> extensions)
    : agent_(agent), extensions_(std::move(extensions)) {}

std::vector<RemoteEntry> InventoryLister::listAllFiles() {
    const auto result = agent_.findFiles();
    if (!result.succeeded()) {
        throw ListingError(fmt::format("Listing remote files failed ({}, exit code {}): {}",
                                       toString(result.outcome),
                                       result.exit_code ? std::to_string(*result.exit_code) : std::string{"none"},
                                       result.error_message.empty() ? result.output : result.error_message));
    }

    auto entries = parseListing(result.output);
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [this](const RemoteEntry& entry) { return !accepted(entry); }),
                  entries.end());
    logger()->info("Listed {} remote files", entries.size());
    return entries;
}

bool InventoryLister::accepted(const RemoteEntry& entry) const {
    if (extensions_.empty()) {
        return true;
    }
    return std::any_of(extensions_.begin(), extensions_.end(),
                       [&entry](const std::string& ext) { return endsWithNoCase(entry.display_name, ext); });
}

} // namespace megadl
