#pragma once

#include <cstdint>
#include <vector>

namespace turbofetch {

// Inclusive [start, end] byte interval. The plan for an empty or unknown-size
// resource holds a single whole-body range {0, 0}, which is fetched without a
// Range header. It is flagged separately so a genuine one-byte range at offset
// zero is still requested as bytes=0-0.
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    bool whole_body{false};

    static ByteRange wholeBody() { return ByteRange{0, 0, true}; }

    [[nodiscard]] bool isWholeBody() const { return whole_body; }
    // Zero for the whole-body range, whose length is not known up front.
    [[nodiscard]] std::uint64_t size() const { return whole_body ? 0 : end - start + 1; }

    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end && whole_body == other.whole_body;
    }
    bool operator!=(const ByteRange& other) const { return !(*this == other); }
};

struct TransferPlan {
    std::uint64_t total_size{0};
    std::vector<ByteRange> ranges;
    int worker_count{1};
};

} // namespace turbofetch
