#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace megadl {

inline constexpr const char* kStatusDelimiter = "|||";
inline constexpr const char* kStatusColumns = "DESTINYPATH,STATE,PROGRESS";

enum class TransferState {
    Queued,
    Active,
    Paused,
    Retrying,
    Completing,
    Completed,
    Cancelled,
    Failed,
};

struct TransferStatusRecord {
    std::string destination_path;
    TransferState state{TransferState::Queued};
    std::string progress;
};

// Parses the agent's transfer table. The first line holding the delimiter
// must be the DESTINYPATH|||STATE|||PROGRESS header, otherwise nothing is
// returned. Malformed rows and unknown states are dropped.
std::vector<TransferStatusRecord> parseTransferStatus(std::string_view raw);

std::optional<TransferState> parseTransferState(std::string_view text);
const char* toString(TransferState state);

// "42.5%" or "42.50% of 1.2 GB" -> 42.5
std::optional<double> progressPercent(std::string_view progress);

} // namespace megadl
