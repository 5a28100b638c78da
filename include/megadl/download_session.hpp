#pragma once

#include "file_utils.hpp"
#include "ip_changer.hpp"
#include "missing_file_resolver.hpp"
#include "transfer_agent.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace megadl {

// Exit code of older mega-get builds when the transfer quota is exhausted.
inline constexpr int kQuotaExceededExitCode = 11;

enum class DownloadOutcome {
    NoError,
    TimeoutExceeded,
    DownloadFailed,
};

enum class SessionPhase {
    LoggedOut,
    LoggedIn,
    Discovering,
    Transferring,
    Moving,
};

enum class LinkKind {
    File,
    Folder,
};

// "https://mega.nz/file/..." and "#!..." links name a single file,
// everything else is treated as a folder.
LinkKind classifyLink(std::string_view link);

const char* toString(DownloadOutcome outcome);
const char* toString(SessionPhase phase);

struct SessionOptions {
    std::string link;
    std::filesystem::path destination;
    std::chrono::seconds max_download_time{3600};
    // Items above this size go through the quota-aware polling path.
    double large_file_threshold_mb{1024.0};
    // Volume after which the IP is rotated before the next transfer.
    double ip_rotation_threshold_mb{5120.0};
    std::chrono::milliseconds poll_interval{5000};
    std::chrono::milliseconds progress_period{1000};
    std::vector<std::string> extensions;
    // Parent of the session's tmp folder; the system temp dir when unset.
    std::optional<std::filesystem::path> tmp_parent;
    bool show_progress{true};
};

struct FolderReport {
    std::size_t queued{0};
    std::size_t downloaded{0};
    std::size_t timed_out{0};
    std::size_t failed{0};
};

// Agent login held for the lifetime of a session. The destructor logs out
// exactly once, whether or not the login succeeded.
class ScopedLogin {
public:
    ScopedLogin(TransferAgent& agent, std::string link, bool login_now);
    ~ScopedLogin();

    ScopedLogin(const ScopedLogin&) = delete;
    ScopedLogin& operator=(const ScopedLogin&) = delete;

    // Logs out, runs `fn`, logs back in.
    template <typename Fn>
    void whileLoggedOut(Fn&& fn) {
        if (!logged_in_) {
            fn();
            return;
        }
        agent_.logout();
        logged_in_ = false;
        fn();
        agent_.login(link_);
        logged_in_ = true;
    }

private:
    TransferAgent& agent_;
    std::string link_;
    bool logged_in_{false};
};

// One run against one share link: owns the tmp folder and the agent login,
// downloads what the destination is missing and releases both on every exit
// path.
class DownloadSession {
public:
    // Throws PreconditionError when the destination folder does not exist.
    DownloadSession(TransferAgent& agent, IpChanger& ip_changer, SessionOptions options);
    ~DownloadSession();

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    // Folder link: best effort over every missing file. Per-item failures are
    // counted, ChangeIpError and ListingError propagate.
    FolderReport downloadFolder();

    // File link: throws TimeoutError or DownloadFailure when the file could
    // not be fetched.
    void downloadFile();

    [[nodiscard]] SessionPhase phase() const { return phase_; }
    [[nodiscard]] const std::filesystem::path& tmpFolder() const { return tmp_.path(); }
    [[nodiscard]] double cumulativeDownloadedMb() const { return cumulative_mb_; }
    [[nodiscard]] const SessionOptions& options() const { return options_; }

private:
    DownloadOutcome downloadItem(const WorkItem& item);
    DownloadOutcome downloadWithQuotaPolling(const WorkItem& item);
    DownloadOutcome downloadWithThreshold(const WorkItem& item);
    DownloadOutcome blockingTransfer(const std::string& remote, const std::string& name, double size_mb);
    void finishItem(const WorkItem& item, DownloadOutcome outcome, FolderReport& report);
    void rotateIp();
    void restartAfterQuota();

    TransferAgent& agent_;
    IpChanger& ip_changer_;
    SessionOptions options_;
    LinkKind kind_;
    SessionPhase phase_{SessionPhase::LoggedOut};
    TempFolder tmp_;
    ScopedLogin login_;
    double cumulative_mb_{0.0};
};

} // namespace megadl
