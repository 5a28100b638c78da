#include "megadl/progress_reporter.hpp"

#include "megadl/logging.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <fmt/format.h>

namespace megadl {

ProgressLine::ProgressLine(std::string filename, double size_mb)
    : started_(std::chrono::steady_clock::now()) {
    progress_.filename = std::move(filename);
    progress_.size_mb = size_mb;
}

void ProgressLine::update(double percent) {
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

    progress_.percent = std::clamp(percent, 0.0, 100.0);
    progress_.downloaded_mb = progress_.size_mb * progress_.percent / 100.0;
    progress_.speed_mb_per_s = elapsed > 0.0 ? progress_.downloaded_mb / elapsed : 0.0;

    std::cout << '\r' << format(progress_) << std::flush;
    drawn_ = true;
}

void ProgressLine::finish() {
    if (drawn_) {
        std::cout << '\n' << std::flush;
        drawn_ = false;
    }
}

std::string ProgressLine::format(const Progress& progress) {
    std::string display_name = progress.filename;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    constexpr int bar_width = 30;
    const double ratio = std::clamp(progress.percent / 100.0, 0.0, 1.0);
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    if (progress.size_mb > 0.0) {
        return fmt::format("{:<20} [{}] {:5.1f}% ({:.1f}/{:.1f} MB) {:.2f} MB/s",
                           display_name,
                           bar,
                           progress.percent,
                           progress.downloaded_mb,
                           progress.size_mb,
                           progress.speed_mb_per_s);
    }
    return fmt::format("{:<20} [{}] {:5.1f}%", display_name, bar, progress.percent);
}

ProgressReporter::ProgressReporter(TransferAgent& agent,
                                   std::string filename,
                                   std::filesystem::path tmp_folder,
                                   double size_mb,
                                   std::chrono::milliseconds period)
    : agent_(agent),
      filename_(std::move(filename)),
      tmp_folder_(std::move(tmp_folder)),
      period_(period),
      line_(filename_, size_mb) {}

ProgressReporter::~ProgressReporter() { stop(); }

void ProgressReporter::start() {
    if (worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this] { run(); });
}

void ProgressReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool ProgressReporter::matches(const TransferStatusRecord& record,
                               const std::string& filename,
                               const std::filesystem::path& tmp_folder) {
    const auto prefix = tmp_folder.string();
    if (!prefix.empty() && record.destination_path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (!filename.empty()) {
        return std::filesystem::path(record.destination_path).filename() == filename;
    }
    return !prefix.empty();
}

void ProgressReporter::run() {
    bool seen = false;
    while (waitForNextPoll()) {
        try {
            const auto result = agent_.transfers(false);
            if (!result.succeeded()) {
                continue;
            }
            const auto records = parseTransferStatus(result.output);
            const auto it = std::find_if(records.begin(), records.end(), [this](const TransferStatusRecord& record) {
                return matches(record, filename_, tmp_folder_);
            });

            if (it == records.end()) {
                if (seen) {
                    break;
                }
                continue;
            }
            seen = true;
            if (const auto percent = progressPercent(it->progress)) {
                line_.update(*percent);
            }
        } catch (const std::exception& ex) {
            logger()->debug("Progress poll failed: {}", ex.what());
        }
    }
    line_.finish();
}

// False once a stop was requested.
bool ProgressReporter::waitForNextPoll() {
    std::unique_lock<std::mutex> lock(mutex_);
    return !wake_.wait_for(lock, period_, [this] { return stop_requested_; });
}

} // namespace megadl
