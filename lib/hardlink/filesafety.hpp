#ifndef FILESAFETY_HPP
#define FILESAFETY_HPP

#include <istream>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Mount table queries and safety checks for purge operations
 */
class FileSafety {
public:
    enum class DeletionStatus {
        Allowed,
        BlockedSystemPath,
        BlockedHome,
        BlockedMountPoint,
        BlockedVirtualFS
    };

    struct MountInfo {
        std::string device;
        std::string mountpoint;
        std::string fstype;
    };

    /**
     * @brief Check if deletion is allowed for a path
     * @param path Full path to check
     * @param mounts Mount table, read once per batch by the caller
     * @return DeletionStatus indicating if/why deletion is blocked
     */
    static DeletionStatus checkDeletion(const std::string& path,
                                        const std::vector<MountInfo>& mounts);

    /**
     * @brief Get human-readable message for deletion status
     */
    static std::string getStatusMessage(DeletionStatus status, const std::string& path);

    /**
     * @brief Check if path is a system directory
     */
    static bool isSystemPath(const std::string& path);

    /**
     * @brief Check if path is user's home directory
     */
    static bool isUserHome(const std::string& path);

    /**
     * @brief Check if path is a mount point
     */
    static bool isMountPoint(const std::string& path,
                             const std::vector<MountInfo>& mounts);

    /**
     * @brief Check if path is on a virtual kernel filesystem
     */
    static bool isProtectedFilesystem(const std::string& path);

    /**
     * @brief Check if a mount table fstype names a kernel pseudo filesystem
     */
    static bool isVirtualFsType(const std::string& fstype);

    /**
     * @brief Get all mount points from /proc/mounts
     */
    static std::vector<MountInfo> getMountPoints();

    /**
     * @brief Parse mount table lines in /proc/mounts format
     */
    static std::vector<MountInfo> parseMountTable(std::istream& in);

    /**
     * @brief Mount point whose subtree contains path (longest match)
     * @return Empty string if no mount entry matches
     */
    static std::string mountPointFor(const std::string& path,
                                     const std::vector<MountInfo>& mounts);

    /**
     * @brief Highest ancestor of path that is on the same device
     *
     * Climbs parent directories while st_dev stays the same, so the result
     * is the mount boundary containing path.
     *
     * @throws PathError if path itself cannot be stat()ed
     */
    static std::string findFilesystemRoot(const std::string& path);

private:
    static const std::unordered_set<std::string> CRITICAL_PATHS;
};

#endif // FILESAFETY_HPP
