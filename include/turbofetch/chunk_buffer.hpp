#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace turbofetch {

inline constexpr std::uint64_t kDefaultFlushThreshold = 128ULL * 1024 * 1024;
inline constexpr std::uint64_t kDefaultMaxBufferBytes = 256ULL * 1024 * 1024;
inline constexpr double kAvailableMemoryFraction = 0.30;

// Per-worker staging area for one byte range. Not thread-safe; a buffer
// belongs to exactly one worker.
class ChunkBuffer {
public:
    enum class Status {
        Staged,   // accepted, nothing to write yet
        Flushed,  // accepted, `block` must be written at the current position
        Rejected, // not accepted, caller writes the data itself
    };

    struct Result {
        Status status{Status::Staged};
        std::vector<char> block;
    };

    // `available_memory` is sampled by the caller once; capacity is
    // min(max_buffer_bytes, 30% of it).
    ChunkBuffer(std::uint64_t range_size, std::uint64_t flush_threshold,
                std::uint64_t max_buffer_bytes, std::uint64_t available_memory);

    [[nodiscard]] Result write(const char* data, std::size_t size);

    // Releases whatever is still staged (the tail of the range).
    [[nodiscard]] std::vector<char> drain();

    // Accounts bytes the caller wrote around the buffer after a rejection.
    void recordBypass(std::size_t size);

    [[nodiscard]] std::uint64_t capacity() const { return capacity_; }
    [[nodiscard]] std::uint64_t flushThreshold() const { return flush_threshold_; }
    [[nodiscard]] std::uint64_t stagedSize() const { return staged_.size(); }
    [[nodiscard]] std::uint64_t cumulativeFlushed() const { return cumulative_flushed_; }
    [[nodiscard]] std::uint64_t received() const { return cumulative_flushed_ + staged_.size(); }
    [[nodiscard]] std::uint64_t remaining() const { return range_size_ - received(); }

    static std::uint64_t memoryCeiling(std::uint64_t max_buffer_bytes,
                                       std::uint64_t available_memory);

private:
    std::vector<char> release();

    std::uint64_t range_size_;
    std::uint64_t capacity_;
    std::uint64_t flush_threshold_;
    std::uint64_t cumulative_flushed_{0};
    std::vector<char> staged_;
};

} // namespace turbofetch
