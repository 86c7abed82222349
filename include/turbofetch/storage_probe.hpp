#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace turbofetch {

inline constexpr std::uint64_t kFreeSpaceMargin = 1ULL * 1024 * 1024 * 1024;

// Local machine facts the planner consults before any body byte is fetched.
class StorageProbe {
public:
    virtual ~StorageProbe() = default;

    // True when `path`'s filesystem can hold `required_bytes` plus a margin.
    virtual bool hasAvailableSpace(const std::string& path, std::uint64_t required_bytes) = 0;
    virtual bool isRamBacked(const std::string& path) = 0;
    virtual std::uint64_t availableMemory() = 0;
};

using StorageProbePtr = std::shared_ptr<StorageProbe>;

class SystemStorageProbe final : public StorageProbe {
public:
    bool hasAvailableSpace(const std::string& path, std::uint64_t required_bytes) override;
    bool isRamBacked(const std::string& path) override;
    std::uint64_t availableMemory() override;
};

// Filesystem type of the longest mount point in `mounts` (/proc/mounts
// format) that contains `path`; empty when none matches.
[[nodiscard]] std::string filesystemTypeFor(const std::string& path, const std::string& mounts);
[[nodiscard]] bool isRamFilesystemType(const std::string& fs_type);

} // namespace turbofetch
