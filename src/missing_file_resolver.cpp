#include "megadl/missing_file_resolver.hpp"

#include "megadl/file_utils.hpp"
#include "megadl/logging.hpp"

namespace megadl {

std::vector<WorkItem> resolveMissing(const std::vector<RemoteEntry>& entries,
                                     const std::filesystem::path& destination) {
    std::vector<WorkItem> missing;
    for (const auto& entry : entries) {
        if (folderContainsFile(destination, entry.display_name)) {
            continue;
        }
        logger()->info("File missing: {}", entry.display_name);
        missing.push_back({entry.remote_path, entry.display_name, entry.size_mb});
    }
    if (missing.empty()) {
        logger()->info("No file is missing");
    }
    return missing;
}

} // namespace megadl
