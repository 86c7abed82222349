#include "turbofetch/file_writer.hpp"

#include "turbofetch/errors.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace turbofetch {

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

class MappedRegion {
public:
    MappedRegion(void* address, std::size_t length) : address_(address), length_(length) {}
    ~MappedRegion() {
        if (address_ != MAP_FAILED) {
            ::munmap(address_, length_);
        }
    }

    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    [[nodiscard]] bool valid() const { return address_ != MAP_FAILED; }
    [[nodiscard]] char* data() const { return static_cast<char*>(address_); }
    [[nodiscard]] std::size_t length() const { return length_; }

private:
    void* address_;
    std::size_t length_;
};

std::string errnoMessage(const std::string& what, const std::string& path, int error) {
    return fmt::format("{} {}: {}", what, path, std::strerror(error));
}

} // namespace

void prepareOutputFile(const std::string& path, std::uint64_t size, bool pre_allocate) {
    FileDescriptor fd{::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644)};
    if (!fd.valid()) {
        throw DownloadError(errnoMessage("Cannot create destination file", path, errno));
    }
    if (size == 0) {
        return;
    }

    if (pre_allocate) {
        const int rc = ::posix_fallocate(fd.get(), 0, static_cast<off_t>(size));
        if (rc == 0) {
            return;
        }
        if (rc != EOPNOTSUPP && rc != EINVAL) {
            throw DownloadError(errnoMessage("Cannot pre-allocate destination file", path, rc));
        }
        spdlog::debug("posix_fallocate unsupported for {}, extending sparsely", path);
    }

    if (::ftruncate(fd.get(), static_cast<off_t>(size)) == -1) {
        throw DownloadError(errnoMessage("Cannot resize destination file", path, errno));
    }
}

MappedFileWriter::MappedFileWriter(std::string path, std::uint64_t total_size)
    : path_(std::move(path)), total_size_(total_size) {}

void MappedFileWriter::ensureExtent(int fd) {
    std::lock_guard<std::mutex> lock(extend_mutex_);
    struct stat st {};
    if (::fstat(fd, &st) == -1) {
        throw DownloadError(errnoMessage("Cannot stat destination file", path_, errno));
    }
    if (static_cast<std::uint64_t>(st.st_size) < total_size_) {
        if (::ftruncate(fd, static_cast<off_t>(total_size_)) == -1) {
            throw DownloadError(errnoMessage("Cannot resize destination file", path_, errno));
        }
    }
}

void MappedFileWriter::flush(const char* data, std::size_t size, std::uint64_t offset) {
    if (size == 0) {
        return;
    }
    if (offset + size > total_size_) {
        throw DownloadError(fmt::format("Block [{}, {}) lies beyond the {} byte file", offset,
                                        offset + size, total_size_));
    }

    FileDescriptor fd{::open(path_.c_str(), O_RDWR)};
    if (!fd.valid()) {
        throw DownloadError(errnoMessage("Cannot open destination file", path_, errno));
    }
    ensureExtent(fd.get());

    // mmap offsets must be page aligned; map from the page holding `offset`.
    static const auto page_size = static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
    const std::uint64_t map_offset = offset - offset % page_size;
    const auto map_length = static_cast<std::size_t>(offset - map_offset + size);

    MappedRegion region{::mmap(nullptr, map_length, PROT_READ | PROT_WRITE, MAP_SHARED, fd.get(),
                               static_cast<off_t>(map_offset)),
                        map_length};
    if (!region.valid()) {
        throw DownloadError(errnoMessage("Cannot map destination file", path_, errno));
    }

    std::memcpy(region.data() + (offset - map_offset), data, size);
    if (::msync(region.data(), region.length(), MS_SYNC) == -1) {
        throw DownloadError(errnoMessage("Cannot sync destination file", path_, errno));
    }
}

DirectFileWriter::DirectFileWriter(std::string path, bool truncate) : path_(std::move(path)) {
    file_.reset(std::fopen(path_.c_str(), truncate ? "wb+" : "rb+"));
    if (!file_) {
        throw DownloadError(errnoMessage("Cannot open destination file", path_, errno));
    }
}

DirectFileWriter::~DirectFileWriter() = default;

void DirectFileWriter::write(const char* data, std::size_t size, std::uint64_t offset) {
    if (size == 0) {
        return;
    }

    std::lock_guard<std::mutex> file_lock(file_mutex_);
    FILE* file = file_.get();
    if (!file) {
        throw DownloadError(fmt::format("Destination file {} is closed", path_));
    }

    if (fseeko(file, static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw DownloadError(errnoMessage("Failed to seek output file", path_, errno));
    }

    const size_t written = std::fwrite(data, 1, size, file);
    if (written != size) {
        throw DownloadError(errnoMessage("Failed to write output file", path_, errno));
    }
}

void DirectFileWriter::close() {
    std::lock_guard<std::mutex> file_lock(file_mutex_);
    FILE* file = file_.release();
    if (!file) {
        return;
    }
    const bool flushed = std::fflush(file) == 0;
    const int flush_errno = errno;
    if (std::fclose(file) != 0 || !flushed) {
        throw DownloadError(errnoMessage("Failed to close output file", path_,
                                         flushed ? errno : flush_errno));
    }
}

} // namespace turbofetch
