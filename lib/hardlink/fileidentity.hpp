/**
 * @file fileidentity.hpp
 * @brief On-disk identity and per-path facts gathered by lstat()
 *
 * This header defines the value types shared by every walk in the library:
 * the (device, inode) pair that identifies on-disk data and the DiskEntry
 * facts captured for one discovered path.
 */

#ifndef FILEIDENTITY_HPP
#define FILEIDENTITY_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

/**
 * @struct FileIdentity
 * @brief (device, inode) pair uniquely identifying on-disk data
 *
 * All paths sharing a FileIdentity refer to identical bytes. Removing every
 * one of them frees the identity's disk usage exactly once.
 */
struct FileIdentity {
  std::uint64_t device = 0;
  std::uint64_t inode = 0;

  bool operator==(const FileIdentity &other) const {
    return device == other.device && inode == other.inode;
  }
  bool operator!=(const FileIdentity &other) const { return !(*this == other); }
  bool operator<(const FileIdentity &other) const {
    if (device != other.device)
      return device < other.device;
    return inode < other.inode;
  }

  /** @brief "dev:ino" form used in logs and in the persisted registry */
  std::string toString() const {
    return std::to_string(device) + ":" + std::to_string(inode);
  }
};

struct FileIdentityHash {
  std::size_t operator()(const FileIdentity &id) const noexcept {
    std::size_t h1 = std::hash<std::uint64_t>{}(id.device);
    std::size_t h2 = std::hash<std::uint64_t>{}(id.inode);
    return h1 ^ (h2 << 1);
  }
};

/**
 * @enum EntryKind
 * @brief Entry type as reported by lstat(), symlinks are never followed
 */
enum class EntryKind { File, Directory, Symlink, Other };

/** @brief Lower-case name used in the persisted tree ("file", "dir", ...) */
const char *entryKindName(EntryKind kind);

/**
 * @brief Parses a name produced by entryKindName()
 * @return false if the name is unknown
 */
bool parseEntryKind(const std::string &name, EntryKind &kind);

/**
 * @struct DiskEntry
 * @brief Facts captured for one discovered path
 *
 * diskUsage is st_blocks x 512, falling back to st_size when the filesystem
 * reports no allocated blocks. linkCount is the filesystem-wide st_nlink.
 */
struct DiskEntry {
  FileIdentity identity;
  EntryKind kind = EntryKind::Other;
  std::uint64_t size = 0;
  std::uint64_t diskUsage = 0;
  std::uint64_t linkCount = 1;

  bool isDirectory() const { return kind == EntryKind::Directory; }
  bool isRegularFile() const { return kind == EntryKind::File; }

  /** @brief Byte figure used for aggregation (logical or allocated) */
  std::uint64_t usage(bool apparent) const { return apparent ? size : diskUsage; }
};

/**
 * @brief lstat()s a path and fills a DiskEntry
 *
 * @param path Path to inspect, never followed if it is a symlink
 * @param out Receives the captured facts on success
 * @param ec Receives errno on failure
 * @return true on success
 */
bool readDiskEntry(const std::filesystem::path &path, DiskEntry &out,
                   std::error_code &ec);

#endif // FILEIDENTITY_HPP
