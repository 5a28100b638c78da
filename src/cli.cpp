#include "megadl/cli.hpp"

#include "megadl/logging.hpp"

#include <stdexcept>
#include <string>

namespace megadl {

namespace {

class ArgReader {
public:
    ArgReader(int argc, const char* const* argv) : argc_(argc), argv_(argv) {}

    [[nodiscard]] bool done() const { return index_ >= argc_; }
    std::string next() { return argv_[index_++]; }

    std::string value(const std::string& option) {
        if (done()) {
            throw std::invalid_argument("Missing value for " + option);
        }
        return next();
    }

private:
    int argc_;
    const char* const* argv_;
    int index_{1};
};

long parsePositiveInteger(const std::string& option, const std::string& text) {
    long value = 0;
    std::size_t used = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + text);
    }
    if (used != text.size() || value <= 0) {
        throw std::invalid_argument("Invalid number for " + option + ": " + text);
    }
    return value;
}

double parsePositiveMb(const std::string& option, const std::string& text) {
    double value = 0.0;
    std::size_t used = 0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid size for " + option + ": " + text);
    }
    if (used != text.size() || value <= 0.0) {
        throw std::invalid_argument("Invalid size for " + option + ": " + text);
    }
    return value;
}

} // namespace

SessionOptions CliOptions::sessionFor(const std::string& link) const {
    SessionOptions options;
    options.link = link;
    options.destination = target_folder;
    options.max_download_time = max_download_time;
    options.large_file_threshold_mb = large_file_threshold_mb;
    options.ip_rotation_threshold_mb = ip_rotation_threshold_mb;
    options.poll_interval = poll_interval;
    options.extensions = extensions;
    options.show_progress = show_progress;
    return options;
}

CliOptions parseCommandLine(int argc, const char* const* argv) {
    CliOptions options;
    ArgReader args(argc, argv);

    while (!args.done()) {
        const std::string option = args.next();

        if (option == "-l" || option == "--link") {
            options.links.push_back(args.value(option));
        } else if (option == "-t" || option == "--target-folder") {
            options.target_folder = args.value(option);
        } else if (option == "-m" || option == "--max-download-time") {
            options.max_download_time = std::chrono::seconds(parsePositiveInteger(option, args.value(option)));
        } else if (option == "-r" || option == "--router") {
            options.router.type = parseRouterType(args.value(option));
        } else if (option == "--router-address") {
            options.router.address = args.value(option);
        } else if (option == "-p" || option == "--password") {
            options.router.password = args.value(option);
        } else if (option == "--vpn-provider") {
            options.router.vpn_provider = args.value(option);
        } else if (option == "--large-file-threshold") {
            options.large_file_threshold_mb = parsePositiveMb(option, args.value(option));
        } else if (option == "--ip-threshold") {
            options.ip_rotation_threshold_mb = parsePositiveMb(option, args.value(option));
        } else if (option == "--poll-interval") {
            options.poll_interval = std::chrono::seconds(parsePositiveInteger(option, args.value(option)));
        } else if (option == "-e" || option == "--extension") {
            auto extension = args.value(option);
            if (!extension.empty() && extension.front() != '.') {
                extension.insert(extension.begin(), '.');
            }
            options.extensions.push_back(std::move(extension));
        } else if (option == "--megacmd-prefix") {
            options.agent.command_prefix = args.value(option);
        } else if (option == "--log-file") {
            options.log_file = std::filesystem::path(args.value(option));
        } else if (option == "-f" || option == "--force-logout") {
            options.force_logout = true;
        } else if (option == "-v" || option == "--verbose") {
            options.verbose = true;
        } else if (option == "--no-progress") {
            options.show_progress = false;
        } else if (option == "-h" || option == "--help") {
            options.help = true;
            return options;
        } else {
            throw std::invalid_argument("Unknown option: " + option);
        }
    }

    if (options.links.empty()) {
        throw std::invalid_argument("At least one --link is required");
    }
    if (options.target_folder.empty()) {
        throw std::invalid_argument("--target-folder is required");
    }
    if (options.router.password.empty()) {
        options.router.password = envValue("MEGADL_ROUTER_PASSWORD").value_or("");
    }
    if (options.router.type == RouterType::Glinet && options.router.password.empty()) {
        throw std::invalid_argument("The glinet router needs --password or MEGADL_ROUTER_PASSWORD");
    }
    return options;
}

bool clearStaleSession(TransferAgent& agent, bool force_logout) {
    if (!agent.isLoggedIn()) {
        return true;
    }
    if (!force_logout) {
        logger()->error("A MEGAcmd session is already active");
        return false;
    }
    logger()->warn("Ending the running MEGAcmd session");
    if (!agent.logout()) {
        logger()->error("Could not end the running MEGAcmd session");
        return false;
    }
    return true;
}

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " -t <folder> -l <link> [-l <link> ...] [options]\n"
        << "Looks for files of the share links missing in the target folder and downloads them,\n"
        << "changing the public IP address whenever the download quota is reached.\n"
        << "Options:\n"
        << "  -l, --link <url>                share link, repeatable\n"
        << "  -t, --target-folder <dir>       destination folder, must exist\n"
        << "  -m, --max-download-time <s>     per-file limit in seconds (default: 3600)\n"
        << "  -r, --router <fritzbox|glinet>  IP rotation backend (default: fritzbox)\n"
        << "      --router-address <host>     router address (default: vendor default)\n"
        << "  -p, --password <pw>             router password (or MEGADL_ROUTER_PASSWORD)\n"
        << "      --vpn-provider <name>       GL.iNet WireGuard provider (default: Mullvad)\n"
        << "      --large-file-threshold <MB> quota-aware polling above this size (default: 1024)\n"
        << "      --ip-threshold <MB>         rotate the IP after this volume (default: 5120)\n"
        << "      --poll-interval <s>         transfer status poll period (default: 5)\n"
        << "  -e, --extension <ext>           only download files with this extension, repeatable\n"
        << "      --megacmd-prefix <path>     directory prefix for the mega-* commands\n"
        << "      --log-file <file>           also write the log to this file\n"
        << "      --no-progress               do not draw progress bars\n"
        << "  -f, --force-logout              end a running MEGAcmd session first\n"
        << "  -v, --verbose                   debug logging\n"
        << "  -h, --help                      show this message" << std::endl;
}

} // namespace megadl
