#include "megadl/file_utils.hpp"

#include "megadl/errors.hpp"
#include "megadl/logging.hpp"

#include <random>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace megadl {

namespace {

constexpr int kCreateAttempts = 8;

// rename() cannot cross filesystems; copy next to the target under a hidden
// name first so the destination never shows a half-written file.
void moveAcrossDevices(const fs::path& from, const fs::path& to) {
    const fs::path staging = to.parent_path() / ("." + to.filename().string() + ".megadl-part");
    std::error_code ec;
    fs::copy_file(from, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(staging, ec);
        throw Error("Failed to copy '" + from.string() + "' to '" + to.string() + "': " + ec.message());
    }
    fs::rename(staging, to, ec);
    if (ec) {
        fs::remove(staging, ec);
        throw Error("Failed to move '" + staging.string() + "' to '" + to.string() + "': " + ec.message());
    }
    fs::remove(from, ec);
    if (ec) {
        logger()->warn("Moved '{}' but could not remove the source: {}", from.string(), ec.message());
    }
}

} // namespace

bool isAgentTempName(const fs::path& path) {
    const auto name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

TempFolder::TempFolder() : TempFolder(fs::temp_directory_path()) {}

TempFolder::TempFolder(const fs::path& parent) {
    for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
        fs::path candidate = parent / randomFolderName();
        std::error_code ec;
        // create_directory reports false when the name is already taken
        if (fs::create_directory(candidate, ec)) {
            path_ = std::move(candidate);
            logger()->info("Tmp folder for download: {}", path_.string());
            return;
        }
        if (ec) {
            throw Error("Cannot create tmp folder under '" + parent.string() + "': " + ec.message());
        }
    }
    throw Error("Cannot find a free tmp folder name under '" + parent.string() + "'");
}

TempFolder::~TempFolder() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        logger()->error("Failed to delete tmp folder '{}': {}", path_.string(), ec.message());
    } else {
        logger()->debug("Deleted tmp folder {}", path_.string());
    }
}

bool folderExists(const fs::path& folder) {
    std::error_code ec;
    return fs::is_directory(folder, ec);
}

bool folderContainsFile(const fs::path& folder, const std::string& file_name) {
    std::error_code ec;
    fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return false;
    }
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return false;
        }
        if (it->path().filename() == file_name && it->is_regular_file(ec)) {
            return true;
        }
    }
    return false;
}

std::size_t moveFilesToDestination(const fs::path& source, const fs::path& destination) {
    // Collect first, moving while iterating invalidates the iterator.
    std::vector<fs::path> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(source, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (isAgentTempName(it->path())) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw Error("Failed to list '" + source.string() + "': " + ec.message());
    }

    std::size_t moved = 0;
    for (const auto& file : files) {
        const fs::path target = destination / file.filename();
        logger()->info("Moving '{}'", file.filename().string());

        fs::rename(file, target, ec);
        if (ec == std::errc::cross_device_link) {
            moveAcrossDevices(file, target);
        } else if (ec) {
            throw Error("Failed to move '" + file.string() + "' to '" + target.string() + "': " + ec.message());
        }

        logger()->info("Moved '{}'", file.filename().string());
        ++moved;
    }
    return moved;
}

void purgeFolderContents(const fs::path& folder) {
    std::error_code ec;
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        logger()->warn("Could not list tmp folder '{}': {}", folder.string(), ec.message());
    }

    for (const auto& entry : entries) {
        std::error_code remove_ec;
        fs::remove_all(entry, remove_ec);
        if (remove_ec) {
            logger()->warn("Could not remove tmp file '{}': {}", entry.string(), remove_ec.message());
        } else {
            logger()->info("Removed tmp file {}", entry.string());
        }
    }
}

std::string randomFolderName(std::size_t length) {
    static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string name;
    name.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        name.push_back(kAlphabet[pick(engine)]);
    }
    return name;
}

} // namespace megadl
