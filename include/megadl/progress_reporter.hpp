#pragma once

#include "transfer_agent.hpp"
#include "transfer_status.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace megadl {

struct Progress {
    std::string filename;
    double size_mb{0.0};
    double percent{0.0};
    double downloaded_mb{0.0};
    double speed_mb_per_s{0.0};
};

// Redraws one progress line in place with '\r'.
class ProgressLine {
public:
    explicit ProgressLine(std::string filename, double size_mb);

    void update(double percent);
    // Ends the line if anything was drawn.
    void finish();

    [[nodiscard]] Progress current() const { return progress_; }

    static std::string format(const Progress& progress);

private:
    Progress progress_;
    std::chrono::steady_clock::time_point started_;
    bool drawn_{false};
};

// Polls the agent's transfer list on its own thread while a blocking
// transfer runs and draws the matching record's progress. It stops by
// itself once a seen record disappears; stop() ends it in any case.
class ProgressReporter {
public:
    ProgressReporter(TransferAgent& agent,
                     std::string filename,
                     std::filesystem::path tmp_folder,
                     double size_mb,
                     std::chrono::milliseconds period);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void start();
    void stop();

    // Record below `tmp_folder` for `filename`; any record below `tmp_folder`
    // when the name is not known up front.
    [[nodiscard]] static bool matches(const TransferStatusRecord& record,
                                      const std::string& filename,
                                      const std::filesystem::path& tmp_folder);

private:
    void run();
    bool waitForNextPoll();

    TransferAgent& agent_;
    std::string filename_;
    std::filesystem::path tmp_folder_;
    std::chrono::milliseconds period_;
    ProgressLine line_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_{false};
};

} // namespace megadl
