#include "turbofetch/storage_probe.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace turbofetch {

namespace fs = std::filesystem;

namespace {

// Nearest ancestor of `path` that exists, so a destination whose directories
// are not created yet still resolves to a real filesystem.
fs::path existingAncestor(const fs::path& path) {
    std::error_code ec;
    fs::path current = fs::absolute(path, ec);
    if (ec) {
        current = path;
    }
    while (!current.empty() && !fs::exists(current, ec)) {
        const fs::path parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }
    return current.empty() ? fs::path{"."} : current;
}

// /proc/mounts escapes blanks in mount points as octal (\040).
std::string unescapeMountPoint(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string digits = field.substr(i + 1, 3);
            if (digits.size() == 3 && digits.find_first_not_of("01234567") == std::string::npos) {
                out.push_back(static_cast<char>(std::stoi(digits, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

bool mountContains(const std::string& mount_point, const std::string& path) {
    if (mount_point == "/") {
        return true;
    }
    if (path.compare(0, mount_point.size(), mount_point) != 0) {
        return false;
    }
    return path.size() == mount_point.size() || path[mount_point.size()] == '/';
}

} // namespace

std::string filesystemTypeFor(const std::string& path, const std::string& mounts) {
    std::istringstream lines(mounts);
    std::string line;
    std::string best_type;
    std::size_t best_length = 0;
    bool matched = false;

    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string mount_point;
        std::string fs_type;
        if (!(fields >> device >> mount_point >> fs_type)) {
            continue;
        }
        mount_point = unescapeMountPoint(mount_point);
        if (!mountContains(mount_point, path)) {
            continue;
        }
        if (!matched || mount_point.size() >= best_length) {
            matched = true;
            best_length = mount_point.size();
            best_type = fs_type;
        }
    }
    return best_type;
}

bool isRamFilesystemType(const std::string& fs_type) {
    return fs_type == "tmpfs" || fs_type == "ramfs" || fs_type == "devtmpfs";
}

bool SystemStorageProbe::hasAvailableSpace(const std::string& path, std::uint64_t required_bytes) {
    const fs::path target = existingAncestor(path);
    std::error_code ec;
    const fs::space_info info = fs::space(target, ec);
    if (ec) {
        spdlog::warn("Cannot query free space of {}: {}; assuming enough", target.string(),
                     ec.message());
        return true;
    }
    return info.available >= required_bytes + kFreeSpaceMargin;
}

bool SystemStorageProbe::isRamBacked(const std::string& path) {
    std::ifstream file("/proc/mounts");
    if (!file) {
        spdlog::debug("/proc/mounts unavailable, treating {} as disk backed", path);
        return false;
    }
    std::stringstream mounts;
    mounts << file.rdbuf();

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(existingAncestor(path), ec);
    if (ec) {
        resolved = existingAncestor(path);
    }
    const std::string fs_type = filesystemTypeFor(resolved.string(), mounts.str());
    spdlog::debug("{} is on a {} filesystem", resolved.string(),
                  fs_type.empty() ? "unknown" : fs_type);
    return isRamFilesystemType(fs_type);
}

std::uint64_t SystemStorageProbe::availableMemory() {
    std::ifstream meminfo("/proc/meminfo");
    std::string key;
    std::uint64_t value = 0;
    std::string unit;
    while (meminfo >> key >> value) {
        std::getline(meminfo, unit);
        if (key == "MemAvailable:") {
            return value * 1024;
        }
    }

    const long pages = ::sysconf(_SC_AVPHYS_PAGES);
    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (pages < 0 || page_size < 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(page_size);
}

} // namespace turbofetch
