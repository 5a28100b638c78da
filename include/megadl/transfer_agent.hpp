#pragma once

#include "process_runner.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace megadl {

// Command line transfer agent the session drives. Methods returning a
// ProcessResult hand back raw output; callers parse and classify it.
class TransferAgent {
public:
    virtual ~TransferAgent() = default;

    // Throws SpawnError when the agent cannot be reached, Error when the
    // login is refused.
    virtual void login(const std::string& link) = 0;
    // Never throws; returns false when the agent reported a failure.
    virtual bool logout() = 0;
    [[nodiscard]] virtual bool isLoggedIn() = 0;

    // `remote` must already be quoted for the shell.
    virtual ProcessResult get(const std::string& remote,
                              const std::filesystem::path& destination,
                              std::chrono::seconds timeout) = 0;
    // Queues the transfer in the agent's background server and returns.
    virtual ProcessResult queueGet(const std::string& remote,
                                   const std::filesystem::path& destination) = 0;

    // Recursive listing of non-empty files, one "path (size unit)" per line.
    virtual ProcessResult findFiles() = 0;
    // Pipe-delimited DESTINYPATH/STATE/PROGRESS table.
    virtual ProcessResult transfers(bool show_completed) = 0;
    virtual void cancelTransfers() = 0;

    virtual void killServer() = 0;
    virtual void restartServer() = 0;
};

} // namespace megadl
