#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace megadl {

enum class RunOutcome {
    Completed,
    TimedOut,
    SpawnError,
};

struct ProcessResult {
    // Unset when the command timed out or could not be spawned.
    std::optional<int> exit_code;
    std::string output;
    RunOutcome outcome{RunOutcome::SpawnError};
    std::string error_message;

    [[nodiscard]] bool succeeded() const {
        return outcome == RunOutcome::Completed && exit_code && *exit_code == 0;
    }
};

// Runs `command` through /bin/sh in its own process group, stdout and stderr
// merged. When `timeout` elapses the whole group is terminated and reaped.
ProcessResult runCommand(const std::string& command, std::chrono::milliseconds timeout);

// Single-quotes `text` for /bin/sh.
std::string shellQuote(const std::string& text);

const char* toString(RunOutcome outcome);

} // namespace megadl
