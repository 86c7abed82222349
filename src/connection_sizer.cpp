#include "turbofetch/connection_sizer.hpp"

#include <algorithm>
#include <cmath>

namespace turbofetch {

namespace {
constexpr double kBeta = 5.6;
constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;
constexpr double kReferenceSpeedMbps = 100.0;
} // namespace

int sizeConnections(std::uint64_t file_size_bytes, double link_speed_mbps,
                    ConnectionCount requested) {
    if (!requested.isAuto()) {
        return std::clamp(requested.value(), 1, kMaxConnections);
    }

    const double size_mb = static_cast<double>(file_size_bytes) / kBytesPerMegabyte;
    const double speed = std::max(0.0, link_speed_mbps);
    const double raw = kBeta * std::log2(1.0 + size_mb) * std::sqrt(speed / kReferenceSpeedMbps);

    // Clamp in floating point first so huge inputs cannot overflow the cast.
    const double bounded = std::clamp(std::ceil(raw), static_cast<double>(kMinAutoConnections),
                                      static_cast<double>(kMaxConnections));
    return static_cast<int>(bounded);
}

} // namespace turbofetch
