#pragma once

#include "transfer_agent.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace megadl {

struct RemoteEntry {
    std::string remote_path; // shell-quoted, ready for the agent's get
    std::string display_name;
    double size_mb{0.0};
};

// Converts a size in B, KB, MB or GB into MB.
// Throws std::invalid_argument for any other unit.
double normalizeToMb(double value, std::string_view unit);

// Parses the agent's recursive listing, one "dir/sub/name (12.3 MB)" per line.
// Lines without a size annotation are skipped.
std::vector<RemoteEntry> parseListing(std::string_view output);

class InventoryLister {
public:
    // `extensions` such as ".mkv"; empty keeps every file.
    explicit InventoryLister(TransferAgent& agent, std::vector<std::string> extensions = {});

    // Throws ListingError unless the listing command exits with 0.
    std::vector<RemoteEntry> listAllFiles();

private:
    [[nodiscard]] bool accepted(const RemoteEntry& entry) const;

    TransferAgent& agent_;
    std::vector<std::string> extensions_;
};

} // namespace megadl
