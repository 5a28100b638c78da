#pragma once

#include "transfer_agent.hpp"

#include <chrono>
#include <string>

namespace megadl {

struct AgentConfig {
    // Prepended to every mega-* command, e.g. "/opt/megacmd/bin/".
    std::string command_prefix;
    std::chrono::seconds command_timeout{60};
    std::chrono::seconds login_timeout{180};
    std::chrono::seconds listing_timeout{600};
    // Settle time after the background server is (re)started.
    std::chrono::seconds server_start_delay{5};
};

// TransferAgent backed by the MEGAcmd command line tools.
class MegaCmdAgent final : public TransferAgent {
public:
    explicit MegaCmdAgent(AgentConfig config = {});

    void login(const std::string& link) override;
    bool logout() override;
    [[nodiscard]] bool isLoggedIn() override;

    ProcessResult get(const std::string& remote,
                      const std::filesystem::path& destination,
                      std::chrono::seconds timeout) override;
    ProcessResult queueGet(const std::string& remote,
                           const std::filesystem::path& destination) override;

    ProcessResult findFiles() override;
    ProcessResult transfers(bool show_completed) override;
    void cancelTransfers() override;

    void killServer() override;
    void restartServer() override;

    [[nodiscard]] std::string transfersCommand(bool show_completed) const;

private:
    [[nodiscard]] std::string tool(const char* name) const;

    AgentConfig config_;
};

} // namespace megadl
