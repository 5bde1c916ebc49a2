/**
 * @file filesafety.cpp
 * @brief Mount table queries and deletion safety checks
 *
 * The purge engine needs to know where the filesystem containing a scanned
 * path begins (its search root), and the delete executor refuses paths that
 * must never be unlinked by a cleanup tool.
 */

#include "filesafety.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <sys/vfs.h>

/**
 * @brief Critical system paths that should never be deleted
 */
const std::unordered_set<std::string> FileSafety::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/tmp", "/home"
};

namespace {

/**
 * @brief Decodes the octal escapes /proc/mounts uses (\040 for space, ...)
 */
std::string unescapeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7') {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 +
                        (field[i + 3] - '0');
            out.push_back(static_cast<char>(value));
            i += 3;
        } else {
            out.push_back(field[i]);
        }
    }
    return out;
}

} // namespace

/**
 * @brief Checks whether a path is safe to unlink
 *
 * Checks are performed in order of severity:
 * 1. System paths
 * 2. User home directory
 * 3. Mount points
 * 4. Virtual kernel filesystems like /proc, /sys
 *
 * @param path The filesystem path to check
 * @param mounts Mount table to check mount points against
 *
 * @return DeletionStatus indicating whether deletion is allowed or blocked
 */
FileSafety::DeletionStatus FileSafety::checkDeletion(
    const std::string& path, const std::vector<MountInfo>& mounts) {
    // 1. System paths
    if (isSystemPath(path)) {
        return DeletionStatus::BlockedSystemPath;
    }

    // 2. User home
    if (isUserHome(path)) {
        return DeletionStatus::BlockedHome;
    }

    // 3. Mount points
    if (isMountPoint(path, mounts)) {
        return DeletionStatus::BlockedMountPoint;
    }

    // 4. Virtual filesystems (proc, sys, etc.)
    if (isProtectedFilesystem(path)) {
        return DeletionStatus::BlockedVirtualFS;
    }

    return DeletionStatus::Allowed;
}

std::string FileSafety::getStatusMessage(DeletionStatus status, const std::string& path) {
    switch (status) {
        case DeletionStatus::Allowed:
            return "Deletion allowed";
        case DeletionStatus::BlockedSystemPath:
            return "Cannot delete system directory: " + path;
        case DeletionStatus::BlockedHome:
            return "Cannot delete your home directory: " + path;
        case DeletionStatus::BlockedMountPoint:
            return "Cannot delete mount point: " + path;
        case DeletionStatus::BlockedVirtualFS:
            return "Cannot delete on virtual/system filesystem: " + path;
        default:
            return "Unknown status";
    }
}

bool FileSafety::isSystemPath(const std::string& path) {
    return CRITICAL_PATHS.count(path) > 0;
}

/**
 * @note Returns false if the HOME environment variable is not set
 */
bool FileSafety::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    return home && path == std::string(home);
}

bool FileSafety::isMountPoint(const std::string& path,
                              const std::vector<MountInfo>& mounts) {
    for (const auto& mount : mounts) {
        if (mount.mountpoint == path) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Checks if a path resides on a virtual kernel filesystem
 *
 * Uses statfs() on the parent directory (the path itself may be a dangling
 * entry) and compares the filesystem magic against kernel pseudo
 * filesystems. tmpfs and ramfs hold ordinary user files and are allowed.
 *
 * @return true if the path is on a protected filesystem or if statfs() fails
 *
 * Protected filesystem types checked:
 * - procfs (0x9fa0)
 * - sysfs (0x62656572)
 * - devpts (0x1cd1)
 * - securityfs (0x73636673)
 * - cgroup (0x27e0eb) and cgroup2 (0x63677270)
 * - debugfs (0x64626720)
 */
bool FileSafety::isProtectedFilesystem(const std::string& path) {
    struct statfs fs_info;

    std::string probe = std::filesystem::path(path).parent_path().string();
    if (probe.empty()) {
        probe = path;
    }

    if (statfs(probe.c_str(), &fs_info) != 0) {
        return true;  // On error, assume protected
    }

    // See: /usr/include/linux/magic.h
    const long PROTECTED_FS[] = {
        0x9fa0,       // PROC_SUPER_MAGIC
        0x62656572,   // SYSFS_MAGIC
        0x1cd1,       // DEVPTS_SUPER_MAGIC
        0x73636673,   // SECURITYFS_MAGIC
        0x27e0eb,     // CGROUP_SUPER_MAGIC
        0x63677270,   // CGROUP2_SUPER_MAGIC
        0x64626720,   // DEBUGFS_MAGIC
    };

    for (auto magic : PROTECTED_FS) {
        if (static_cast<long>(fs_info.f_type) == magic) {
            return true;
        }
    }

    return false;
}

bool FileSafety::isVirtualFsType(const std::string& fstype) {
    static const std::unordered_set<std::string> VIRTUAL_FS = {
        "proc", "sysfs", "devpts", "securityfs", "cgroup", "cgroup2",
        "debugfs", "tracefs", "pstore", "bpf", "configfs", "fusectl",
        "mqueue", "hugetlbfs", "binfmt_misc", "autofs"
    };
    return VIRTUAL_FS.count(fstype) > 0;
}

std::vector<FileSafety::MountInfo> FileSafety::getMountPoints() {
    std::ifstream mounts_file("/proc/mounts");

    if (!mounts_file.is_open()) {
        return {};  // Return empty on error
    }

    return parseMountTable(mounts_file);
}

/**
 * @brief Parses "device mountpoint fstype options dump pass" lines
 *
 * Blank or truncated lines are skipped.
 */
std::vector<FileSafety::MountInfo> FileSafety::parseMountTable(std::istream& in) {
    std::vector<MountInfo> mounts;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        MountInfo info;
        std::string options, dump, pass;

        if (!(iss >> info.device >> info.mountpoint >> info.fstype)) {
            continue;
        }
        iss >> options >> dump >> pass;

        info.device = unescapeMountField(info.device);
        info.mountpoint = unescapeMountField(info.mountpoint);

        mounts.push_back(info);
    }

    return mounts;
}

std::string FileSafety::mountPointFor(const std::string& path,
                                      const std::vector<MountInfo>& mounts) {
    std::string best;
    for (const auto& mount : mounts) {
        const std::string& mp = mount.mountpoint;
        bool contains = false;
        if (mp == "/") {
            contains = !path.empty() && path[0] == '/';
        } else if (path.compare(0, mp.size(), mp) == 0) {
            contains = path.size() == mp.size() || path[mp.size()] == '/';
        }
        if (contains && mp.size() > best.size()) {
            best = mp;
        }
    }
    return best;
}

std::string FileSafety::findFilesystemRoot(const std::string& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    // Climb the resolved path; a symlinked component would end the climb early
    fs::path current = fs::canonical(path, ec);
    if (ec) {
        throw PathError(path, ec.message());
    }

    struct stat sb {};
    if (::lstat(current.c_str(), &sb) != 0) {
        throw PathError(current.string(), std::strerror(errno));
    }
    const dev_t device = sb.st_dev;

    while (current.has_parent_path() && current.parent_path() != current) {
        fs::path parent = current.parent_path();
        struct stat parent_sb {};
        if (::lstat(parent.c_str(), &parent_sb) != 0 || parent_sb.st_dev != device) {
            break;
        }
        current = parent;
    }

    return current.string();
}
