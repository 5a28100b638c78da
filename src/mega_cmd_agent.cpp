#include "megadl/mega_cmd_agent.hpp"

#include "megadl/errors.hpp"
#include "megadl/logging.hpp"
#include "megadl/transfer_status.hpp"

#include <thread>
#include <utility>

#include <fmt/format.h>

namespace megadl {

namespace {

void logFailure(const char* what, const ProcessResult& result) {
    logger()->warn("{} failed ({}, exit code {}): {}",
                   what,
                   toString(result.outcome),
                   result.exit_code ? std::to_string(*result.exit_code) : std::string{"none"},
                   result.error_message.empty() ? result.output : result.error_message);
}

} // namespace

MegaCmdAgent::MegaCmdAgent(AgentConfig config) : config_(std::move(config)) {}

void MegaCmdAgent::login(const std::string& link) {
    const auto result = runCommand(fmt::format("{} {}", tool("mega-login"), shellQuote(link)),
                                   config_.login_timeout);
    if (result.outcome == RunOutcome::SpawnError) {
        throw SpawnError("mega-login could not be started: " + result.error_message);
    }
    if (!result.succeeded()) {
        throw Error(fmt::format("Login to {} failed ({}): {}", link, toString(result.outcome), result.output));
    }
    logger()->info("Logged in to: {}", link);
}

bool MegaCmdAgent::logout() {
    const auto result = runCommand(tool("mega-logout"), config_.command_timeout);
    if (!result.succeeded()) {
        logFailure("mega-logout", result);
        return false;
    }
    logger()->info("Logged out");
    return true;
}

bool MegaCmdAgent::isLoggedIn() {
    return runCommand(tool("mega-ls"), config_.command_timeout).succeeded();
}

ProcessResult MegaCmdAgent::get(const std::string& remote,
                                const std::filesystem::path& destination,
                                std::chrono::seconds timeout) {
    const auto command = fmt::format("{} {} {}", tool("mega-get"), remote, shellQuote(destination.string()));
    logger()->info("command: {}", command);
    return runCommand(command, timeout);
}

ProcessResult MegaCmdAgent::queueGet(const std::string& remote, const std::filesystem::path& destination) {
    const auto command = fmt::format("{} -q {} {}", tool("mega-get"), remote, shellQuote(destination.string()));
    logger()->info("command: {}", command);
    return runCommand(command, config_.command_timeout);
}

ProcessResult MegaCmdAgent::findFiles() {
    return runCommand(fmt::format("{} --type=f --size=+0 -l", tool("mega-find")), config_.listing_timeout);
}

ProcessResult MegaCmdAgent::transfers(bool show_completed) {
    return runCommand(transfersCommand(show_completed), config_.command_timeout);
}

void MegaCmdAgent::cancelTransfers() {
    const auto result = runCommand(fmt::format("{} -c -a", tool("mega-transfers")), config_.command_timeout);
    if (!result.succeeded()) {
        logFailure("Cancelling transfers", result);
    }
}

void MegaCmdAgent::killServer() {
    // pkill exits with 1 when nothing matched, which is fine here
    const auto result = runCommand("pkill -f mega-cmd-server", config_.command_timeout);
    if (result.outcome != RunOutcome::Completed) {
        logFailure("Stopping mega-cmd-server", result);
    } else {
        logger()->info("Stopped mega-cmd-server");
    }
}

void MegaCmdAgent::restartServer() {
    const auto command = fmt::format("nohup {} >/dev/null 2>&1 &", tool("mega-cmd-server"));
    const auto result = runCommand(command, config_.command_timeout);
    if (result.outcome == RunOutcome::SpawnError) {
        throw SpawnError("mega-cmd-server could not be started: " + result.error_message);
    }
    std::this_thread::sleep_for(config_.server_start_delay);
    logger()->info("Restarted mega-cmd-server");
}

std::string MegaCmdAgent::transfersCommand(bool show_completed) const {
    auto command = fmt::format("{} --col-separator={} --output-cols={}",
                               tool("mega-transfers"),
                               shellQuote(kStatusDelimiter),
                               kStatusColumns);
    if (show_completed) {
        command.append(" --show-completed");
    }
    return command;
}

std::string MegaCmdAgent::tool(const char* name) const {
    return config_.command_prefix + name;
}

} // namespace megadl
