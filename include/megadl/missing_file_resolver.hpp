#pragma once

#include "inventory.hpp"

#include <filesystem>
#include <vector>

namespace megadl {

struct WorkItem {
    std::string remote_path;
    std::string display_name;
    double size_mb{0.0};
};

// Entries whose display name is not found anywhere below `destination`,
// in inventory order.
std::vector<WorkItem> resolveMissing(const std::vector<RemoteEntry>& entries,
                                     const std::filesystem::path& destination);

} // namespace megadl
