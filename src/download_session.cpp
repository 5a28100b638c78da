#include "megadl/download_session.hpp"

#include "megadl/errors.hpp"
#include "megadl/inventory.hpp"
#include "megadl/logging.hpp"
#include "megadl/progress_reporter.hpp"
#include "megadl/transfer_status.hpp"

#include <algorithm>
#include <optional>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace megadl {

namespace {

using Clock = std::chrono::steady_clock;

SessionOptions validated(SessionOptions options) {
    if (options.link.empty()) {
        throw PreconditionError("No share link given");
    }
    if (!folderExists(options.destination)) {
        throw PreconditionError("Destination folder does not exist: " + options.destination.string());
    }
    logger()->info("######## Download job started for {} ########", options.link);
    return options;
}

std::filesystem::path tmpParent(const SessionOptions& options) {
    return options.tmp_parent ? *options.tmp_parent : std::filesystem::temp_directory_path();
}

std::optional<TransferStatusRecord> findRecord(const ProcessResult& result,
                                               const std::string& filename,
                                               const std::filesystem::path& tmp_folder) {
    const auto records = parseTransferStatus(result.output);
    const auto it = std::find_if(records.begin(), records.end(), [&](const TransferStatusRecord& record) {
        return ProgressReporter::matches(record, filename, tmp_folder);
    });
    if (it == records.end()) {
        return std::nullopt;
    }
    return *it;
}

std::string describe(const ProcessResult& result) {
    if (result.outcome != RunOutcome::Completed) {
        return fmt::format("{}: {}", toString(result.outcome), result.error_message);
    }
    return fmt::format("exit code {}", result.exit_code.value_or(-1));
}

} // namespace

LinkKind classifyLink(std::string_view link) {
    if (link.find("/file/") != std::string_view::npos || link.find("#!") != std::string_view::npos) {
        return LinkKind::File;
    }
    return LinkKind::Folder;
}

const char* toString(DownloadOutcome outcome) {
    switch (outcome) {
    case DownloadOutcome::NoError:
        return "NO_ERROR";
    case DownloadOutcome::TimeoutExceeded:
        return "TIMEOUT_EXCEEDED";
    case DownloadOutcome::DownloadFailed:
        return "DOWNLOAD_FAILED";
    }
    return "UNKNOWN";
}

const char* toString(SessionPhase phase) {
    switch (phase) {
    case SessionPhase::LoggedOut:
        return "LOGGED_OUT";
    case SessionPhase::LoggedIn:
        return "LOGGED_IN";
    case SessionPhase::Discovering:
        return "DISCOVERING";
    case SessionPhase::Transferring:
        return "TRANSFERRING";
    case SessionPhase::Moving:
        return "MOVING";
    }
    return "UNKNOWN";
}

ScopedLogin::ScopedLogin(TransferAgent& agent, std::string link, bool login_now)
    : agent_(agent), link_(std::move(link)) {
    if (!login_now) {
        return;
    }
    try {
        agent_.login(link_);
    } catch (...) {
        // The destructor will not run, release here.
        agent_.logout();
        throw;
    }
    logged_in_ = true;
}

ScopedLogin::~ScopedLogin() { agent_.logout(); }

DownloadSession::DownloadSession(TransferAgent& agent, IpChanger& ip_changer, SessionOptions options)
    : agent_(agent),
      ip_changer_(ip_changer),
      options_(validated(std::move(options))),
      kind_(classifyLink(options_.link)),
      tmp_(tmpParent(options_)),
      login_(agent_, options_.link, kind_ == LinkKind::Folder) {
    phase_ = SessionPhase::LoggedIn;
}

DownloadSession::~DownloadSession() {
    phase_ = SessionPhase::LoggedOut;
    logger()->info("######## Download job ended for {} ########", options_.link);
}

FolderReport DownloadSession::downloadFolder() {
    phase_ = SessionPhase::Discovering;
    InventoryLister lister(agent_, options_.extensions);
    const auto items = resolveMissing(lister.listAllFiles(), options_.destination);

    FolderReport report;
    report.queued = items.size();
    for (const auto& item : items) {
        finishItem(item, downloadItem(item), report);
    }

    phase_ = SessionPhase::LoggedIn;
    logger()->info("{} of {} missing files downloaded ({} timed out, {} failed)",
                   report.downloaded, report.queued, report.timed_out, report.failed);
    return report;
}

void DownloadSession::downloadFile() {
    rotateIp();

    const auto outcome = blockingTransfer(shellQuote(options_.link), std::string{}, 0.0);
    switch (outcome) {
    case DownloadOutcome::NoError: {
        phase_ = SessionPhase::Moving;
        const auto moved = moveFilesToDestination(tmp_.path(), options_.destination);
        purgeFolderContents(tmp_.path());
        phase_ = SessionPhase::LoggedIn;
        if (moved == 0) {
            throw DownloadFailure("Download of " + options_.link + " produced no file");
        }
        return;
    }
    case DownloadOutcome::TimeoutExceeded:
        purgeFolderContents(tmp_.path());
        phase_ = SessionPhase::LoggedIn;
        throw TimeoutError("Timeout exceeded for downloading " + options_.link);
    case DownloadOutcome::DownloadFailed:
        break;
    }
    purgeFolderContents(tmp_.path());
    phase_ = SessionPhase::LoggedIn;
    throw DownloadFailure("Download of " + options_.link + " failed");
}

DownloadOutcome DownloadSession::downloadItem(const WorkItem& item) {
    logger()->info("Downloading '{}' ({:.1f} MB)", item.display_name, item.size_mb);
    if (item.size_mb > options_.large_file_threshold_mb) {
        return downloadWithQuotaPolling(item);
    }
    return downloadWithThreshold(item);
}

DownloadOutcome DownloadSession::downloadWithQuotaPolling(const WorkItem& item) {
    phase_ = SessionPhase::Transferring;

    const auto queued = agent_.queueGet(item.remote_path, tmp_.path());
    if (!queued.succeeded()) {
        logger()->error("Could not queue '{}' ({})", item.display_name, describe(queued));
        return DownloadOutcome::DownloadFailed;
    }

    ProgressLine line(item.display_name, item.size_mb);
    const auto deadline = Clock::now() + options_.max_download_time;
    while (true) {
        if (Clock::now() >= deadline) {
            line.finish();
            logger()->warn("Timeout exceeded for downloading '{}'", item.display_name);
            agent_.cancelTransfers();
            return DownloadOutcome::TimeoutExceeded;
        }
        std::this_thread::sleep_for(options_.poll_interval);

        const auto active_list = agent_.transfers(false);
        if (!active_list.succeeded()) {
            logger()->warn("Could not read the transfer list ({}), polling again", describe(active_list));
            continue;
        }
        if (const auto active = findRecord(active_list, item.display_name, tmp_.path())) {
            if (active->state == TransferState::Retrying) {
                line.finish();
                logger()->warn("Download quota exceeded while fetching '{}'", item.display_name);
                restartAfterQuota();
                continue;
            }
            if (options_.show_progress) {
                if (const auto percent = progressPercent(active->progress)) {
                    line.update(*percent);
                }
            }
            continue;
        }

        const auto finished_list = agent_.transfers(true);
        if (!finished_list.succeeded()) {
            logger()->warn("Could not read the finished transfers ({}), polling again", describe(finished_list));
            continue;
        }
        const auto finished = findRecord(finished_list, item.display_name, tmp_.path());
        if (finished && finished->state == TransferState::Completing) {
            continue;
        }
        line.finish();
        if (finished && finished->state == TransferState::Completed) {
            return DownloadOutcome::NoError;
        }
        logger()->error("Transfer of '{}' ended in state {}",
                        item.display_name,
                        finished ? toString(finished->state) : "UNKNOWN");
        agent_.cancelTransfers();
        return DownloadOutcome::DownloadFailed;
    }
}

DownloadOutcome DownloadSession::downloadWithThreshold(const WorkItem& item) {
    if (cumulative_mb_ + item.size_mb >= options_.ip_rotation_threshold_mb) {
        logger()->info("{:.1f} MB downloaded since the last IP change, rotating before '{}'",
                       cumulative_mb_, item.display_name);
        rotateIp();
    }
    return blockingTransfer(item.remote_path, item.display_name, item.size_mb);
}

DownloadOutcome DownloadSession::blockingTransfer(const std::string& remote, const std::string& name, double size_mb) {
    phase_ = SessionPhase::Transferring;
    const auto deadline = Clock::now() + options_.max_download_time;

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            logger()->warn("Timeout exceeded for downloading {}", name.empty() ? options_.link : name);
            agent_.cancelTransfers();
            return DownloadOutcome::TimeoutExceeded;
        }

        ProcessResult result;
        {
            std::optional<ProgressReporter> reporter;
            if (options_.show_progress) {
                reporter.emplace(agent_, name, tmp_.path(), size_mb, options_.progress_period);
                reporter->start();
            }
            result = agent_.get(remote, tmp_.path(), remaining);
        }
        logger()->info("mega-get finished: {}", describe(result));

        if (result.outcome == RunOutcome::TimedOut) {
            logger()->warn("Timeout exceeded for downloading {}", name.empty() ? options_.link : name);
            // the agent's server keeps the transfer alive otherwise
            agent_.cancelTransfers();
            return DownloadOutcome::TimeoutExceeded;
        }
        if (result.outcome == RunOutcome::SpawnError) {
            logger()->error("mega-get could not be run: {}", result.error_message);
            return DownloadOutcome::DownloadFailed;
        }
        if (result.exit_code == kQuotaExceededExitCode) {
            logger()->warn("Download quota exceeded while fetching {}", name.empty() ? options_.link : name);
            purgeFolderContents(tmp_.path());
            rotateIp();
            continue;
        }
        return result.succeeded() ? DownloadOutcome::NoError : DownloadOutcome::DownloadFailed;
    }
}

void DownloadSession::finishItem(const WorkItem& item, DownloadOutcome outcome, FolderReport& report) {
    switch (outcome) {
    case DownloadOutcome::NoError:
        phase_ = SessionPhase::Moving;
        try {
            moveFilesToDestination(tmp_.path(), options_.destination);
            purgeFolderContents(tmp_.path());
            cumulative_mb_ += item.size_mb;
            ++report.downloaded;
        } catch (const Error& ex) {
            logger()->error("Could not move '{}' to {}: {}", item.display_name, options_.destination.string(), ex.what());
            purgeFolderContents(tmp_.path());
            ++report.failed;
        }
        break;
    case DownloadOutcome::TimeoutExceeded:
        purgeFolderContents(tmp_.path());
        ++report.timed_out;
        break;
    case DownloadOutcome::DownloadFailed:
        logger()->error("Download of '{}' from {} failed, continuing with the next file",
                        item.display_name, options_.link);
        purgeFolderContents(tmp_.path());
        ++report.failed;
        break;
    }
    phase_ = SessionPhase::LoggedIn;
}

void DownloadSession::rotateIp() {
    login_.whileLoggedOut([this] { ip_changer_.changeIp(); });
    cumulative_mb_ = 0.0;
}

void DownloadSession::restartAfterQuota() {
    agent_.killServer();
    ip_changer_.changeIp();
    agent_.restartServer();
    cumulative_mb_ = 0.0;
}

} // namespace megadl
