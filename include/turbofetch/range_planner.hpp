#pragma once

#include "byte_range.hpp"
#include "connection_sizer.hpp"

#include <cstdint>
#include <vector>

namespace turbofetch {

[[nodiscard]] std::vector<ByteRange> planRanges(std::uint64_t total_size, int connections);

[[nodiscard]] TransferPlan buildPlan(std::uint64_t total_size, double link_speed_mbps,
                                     ConnectionCount requested);

} // namespace turbofetch
