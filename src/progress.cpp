#include "turbofetch/progress.hpp"

namespace turbofetch {

const char* toString(TransferState state) {
    switch (state) {
    case TransferState::Idle:
        return "idle";
    case TransferState::Planning:
        return "planning";
    case TransferState::Fetching:
        return "fetching";
    case TransferState::Verifying:
        return "verifying";
    case TransferState::Done:
        return "done";
    case TransferState::Failed:
        return "failed";
    case TransferState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace turbofetch
