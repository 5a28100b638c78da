#include "megadl/cli.hpp"
#include "megadl/detail/curl_utils.hpp"
#include "megadl/download_session.hpp"
#include "megadl/errors.hpp"
#include "megadl/logging.hpp"
#include "megadl/mega_cmd_agent.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/color.h>

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitLinkFailed = 2;

// Returns false when the link could not be processed.
bool processLink(megadl::TransferAgent& agent,
                 megadl::IpChanger& ip_changer,
                 const megadl::CliOptions& options,
                 const std::string& link) {
    try {
        megadl::DownloadSession session(agent, ip_changer, options.sessionFor(link));
        if (megadl::classifyLink(link) == megadl::LinkKind::File) {
            session.downloadFile();
            return true;
        }
        const auto report = session.downloadFolder();
        return report.failed == 0 && report.timed_out == 0;
    } catch (const megadl::TimeoutError& ex) {
        megadl::logger()->warn("{} (will be retried on the next run)", ex.what());
    } catch (const megadl::Error& ex) {
        megadl::logger()->error("Aborting {}: {}", link, ex.what());
    } catch (const std::exception& ex) {
        megadl::logger()->error("Unexpected error for {}: {}", link, ex.what());
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    megadl::CliOptions options;
    try {
        options = megadl::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        megadl::printUsage(std::cerr, argv[0]);
        return kExitUsage;
    }
    if (options.help) {
        megadl::printUsage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }

    try {
        auto level = options.verbose ? spdlog::level::debug
                                     : megadl::logLevelFromEnv().value_or(spdlog::level::info);
        megadl::configureLogging(level, options.log_file);
        megadl::detail::ensureCurlInitialized();

        megadl::MegaCmdAgent agent(options.agent);
        if (!megadl::clearStaleSession(agent, options.force_logout)) {
            fmt::print(stderr, fg(fmt::color::red) | fmt::emphasis::bold,
                       "Session ongoing, aborting... (use --force-logout to end it)\n");
            return kExitUsage;
        }

        auto ip_changer = megadl::makeIpChanger(options.router);
        megadl::logger()->info("Using {} router for IP changes", megadl::toString(options.router.type));

        bool all_ok = true;
        for (const auto& link : options.links) {
            if (!processLink(agent, *ip_changer, options, link)) {
                all_ok = false;
            }
        }
        return all_ok ? EXIT_SUCCESS : kExitLinkFailed;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
