#include "turbofetch/range_planner.hpp"

#include <algorithm>

namespace turbofetch {

std::vector<ByteRange> planRanges(std::uint64_t total_size, int connections) {
    if (total_size == 0) {
        return {ByteRange::wholeBody()};
    }

    const auto parts = static_cast<std::uint64_t>(std::max(1, connections));
    const std::uint64_t chunk_size = (total_size + parts - 1) / parts;

    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<std::size_t>(std::min(parts, total_size)));

    std::uint64_t start = 0;
    std::uint64_t remaining = total_size;
    while (remaining > 0) {
        const std::uint64_t current = std::min(chunk_size, remaining);
        ranges.push_back({start, start + current - 1, false});
        start += current;
        remaining -= current;
    }
    return ranges;
}

TransferPlan buildPlan(std::uint64_t total_size, double link_speed_mbps, ConnectionCount requested) {
    TransferPlan plan;
    plan.total_size = total_size;
    if (total_size == 0) {
        plan.ranges = planRanges(0, 1);
    } else {
        plan.ranges = planRanges(total_size, sizeConnections(total_size, link_speed_mbps, requested));
    }
    plan.worker_count = static_cast<int>(plan.ranges.size());
    return plan;
}

} // namespace turbofetch
