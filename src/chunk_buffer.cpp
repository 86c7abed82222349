#include "turbofetch/chunk_buffer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace turbofetch {

std::uint64_t ChunkBuffer::memoryCeiling(std::uint64_t max_buffer_bytes,
                                         std::uint64_t available_memory) {
    // An unknown amount of free memory leaves only the configured cap.
    if (available_memory == 0) {
        return max_buffer_bytes;
    }
    const auto fraction = static_cast<std::uint64_t>(static_cast<double>(available_memory) *
                                                     kAvailableMemoryFraction);
    return std::min(max_buffer_bytes, fraction);
}

ChunkBuffer::ChunkBuffer(std::uint64_t range_size, std::uint64_t flush_threshold,
                         std::uint64_t max_buffer_bytes, std::uint64_t available_memory)
    : range_size_(range_size),
      capacity_(memoryCeiling(max_buffer_bytes, available_memory)),
      flush_threshold_(std::max<std::uint64_t>(1, std::min(flush_threshold, capacity_))) {}

ChunkBuffer::Result ChunkBuffer::write(const char* data, std::size_t size) {
    Result result;
    if (size == 0) {
        return result;
    }

    if (size > remaining() || staged_.size() + size > capacity_) {
        result.status = Status::Rejected;
        return result;
    }

    if (staged_.empty()) {
        staged_.reserve(static_cast<std::size_t>(std::min(flush_threshold_, remaining())));
    }
    staged_.insert(staged_.end(), data, data + size);

    if (staged_.size() >= flush_threshold_ || remaining() == 0 || staged_.size() >= capacity_) {
        result.status = Status::Flushed;
        result.block = release();
    }
    return result;
}

std::vector<char> ChunkBuffer::drain() { return release(); }

void ChunkBuffer::recordBypass(std::size_t size) {
    if (!staged_.empty()) {
        throw std::logic_error("ChunkBuffer bypassed while bytes are still staged");
    }
    cumulative_flushed_ += size;
}

std::vector<char> ChunkBuffer::release() {
    std::vector<char> block;
    block.swap(staged_);
    cumulative_flushed_ += block.size();
    return block;
}

} // namespace turbofetch
