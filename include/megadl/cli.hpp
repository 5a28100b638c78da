#pragma once

#include "download_session.hpp"
#include "ip_changer.hpp"
#include "mega_cmd_agent.hpp"
#include "transfer_agent.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace megadl {

struct CliOptions {
    std::vector<std::string> links;
    std::filesystem::path target_folder;
    std::chrono::seconds max_download_time{3600};
    RouterConfig router;
    AgentConfig agent;
    double large_file_threshold_mb{1024.0};
    double ip_rotation_threshold_mb{5120.0};
    std::chrono::seconds poll_interval{5};
    std::vector<std::string> extensions;
    bool force_logout{false};
    bool verbose{false};
    bool show_progress{true};
    bool help{false};
    std::optional<std::filesystem::path> log_file;

    // Session settings for one of `links`.
    [[nodiscard]] SessionOptions sessionFor(const std::string& link) const;
};

// Throws std::invalid_argument on unknown flags, missing values or missing
// required options. MEGADL_ROUTER_PASSWORD fills an absent --password.
CliOptions parseCommandLine(int argc, const char* const* argv);

void printUsage(std::ostream& out, const char* program_name);

// False when the agent still holds a session: `force_logout` was not given
// or the logout failed.
[[nodiscard]] bool clearStaleSession(TransferAgent& agent, bool force_logout);

} // namespace megadl
