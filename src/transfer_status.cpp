#include "megadl/transfer_status.hpp"

#include "megadl/detail/text.hpp"

#include <array>
#include <cstdlib>
#include <utility>

namespace megadl {

namespace {

constexpr std::array<std::pair<std::string_view, TransferState>, 8> kStates{{
    {"QUEUED", TransferState::Queued},
    {"ACTIVE", TransferState::Active},
    {"PAUSED", TransferState::Paused},
    {"RETRYING", TransferState::Retrying},
    {"COMPLETING", TransferState::Completing},
    {"COMPLETED", TransferState::Completed},
    {"CANCELLED", TransferState::Cancelled},
    {"FAILED", TransferState::Failed},
}};

std::vector<std::string_view> splitFields(std::string_view line, std::string_view delimiter) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            return fields;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + delimiter.size();
    }
}

bool isHeader(const std::vector<std::string_view>& fields) {
    return fields.size() == 3
        && detail::trim(fields[0]) == "DESTINYPATH"
        && detail::trim(fields[1]) == "STATE"
        && detail::trim(fields[2]) == "PROGRESS";
}

} // namespace

std::vector<TransferStatusRecord> parseTransferStatus(std::string_view raw) {
    const std::string_view delimiter{kStatusDelimiter};
    const auto lines = detail::splitLines(raw);

    std::size_t index = 0;
    while (index < lines.size() && lines[index].find(delimiter) == std::string_view::npos) {
        ++index;
    }
    if (index == lines.size() || !isHeader(splitFields(lines[index], delimiter))) {
        return {};
    }

    std::vector<TransferStatusRecord> records;
    for (++index; index < lines.size(); ++index) {
        const auto fields = splitFields(lines[index], delimiter);
        if (fields.size() != 3) {
            continue;
        }
        const auto state = parseTransferState(fields[1]);
        if (!state) {
            continue;
        }
        records.push_back({std::string(detail::trim(fields[0])), *state, std::string(detail::trim(fields[2]))});
    }
    return records;
}

std::optional<TransferState> parseTransferState(std::string_view text) {
    const auto name = detail::trim(text);
    for (const auto& [label, state] : kStates) {
        if (label == name) {
            return state;
        }
    }
    return std::nullopt;
}

const char* toString(TransferState state) {
    for (const auto& [label, value] : kStates) {
        if (value == state) {
            return label.data();
        }
    }
    return "UNKNOWN";
}

std::optional<double> progressPercent(std::string_view progress) {
    const auto percent = progress.find('%');
    if (percent == std::string_view::npos) {
        return std::nullopt;
    }

    std::size_t begin = percent;
    while (begin > 0) {
        const char c = progress[begin - 1];
        if ((c >= '0' && c <= '9') || c == '.') {
            --begin;
        } else {
            break;
        }
    }
    if (begin == percent) {
        return std::nullopt;
    }

    const std::string number{progress.substr(begin, percent - begin)};
    char* end = nullptr;
    const double value = std::strtod(number.c_str(), &end);
    if (end == number.c_str()) {
        return std::nullopt;
    }
    return value;
}

} // namespace megadl
