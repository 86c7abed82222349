#pragma once

#include <cstdint>
#include <string>

namespace turbofetch {

enum class TransferState {
    Idle,
    Planning,
    Fetching,
    Verifying,
    Done,
    Failed,
    Cancelled,
};

struct Progress {
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    TransferState state{TransferState::Idle};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
};

[[nodiscard]] const char* toString(TransferState state);

} // namespace turbofetch
