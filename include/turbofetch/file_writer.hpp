#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

namespace turbofetch {

// Creates (or truncates) `path` and sizes it to `size` bytes. With
// `pre_allocate` the blocks are reserved with posix_fallocate, otherwise the
// file is extended sparsely. Called once before any worker starts.
void prepareOutputFile(const std::string& path, std::uint64_t size, bool pre_allocate);

// Buffered mode: workers hand over whole blocks that land at disjoint offsets.
// Each flush maps only the window it writes and unmaps it right away.
class MappedFileWriter {
public:
    MappedFileWriter(std::string path, std::uint64_t total_size);

    void flush(const char* data, std::size_t size, std::uint64_t offset);

    // Grows the file to total_size if it is shorter. Safe to call concurrently.
    void ensureExtent(int fd);

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
    std::uint64_t total_size_;
    std::mutex extend_mutex_;
};

// Direct mode: every read is written straight through one shared handle under
// one lock.
class DirectFileWriter {
public:
    // `truncate` starts from an empty file; otherwise the existing file is
    // opened for update.
    explicit DirectFileWriter(std::string path, bool truncate = false);
    ~DirectFileWriter();

    DirectFileWriter(const DirectFileWriter&) = delete;
    DirectFileWriter& operator=(const DirectFileWriter&) = delete;

    void write(const char* data, std::size_t size, std::uint64_t offset);

    // Flushes and closes the handle; reports errors the destructor would hide.
    void close();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::string path_;
    std::unique_ptr<FILE, FileDeleter> file_{};
    std::mutex file_mutex_;
};

} // namespace turbofetch
