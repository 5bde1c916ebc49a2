#include "fileidentity.hpp"

#include <cerrno>
#include <sys/stat.h>

const char *entryKindName(EntryKind kind) {
  switch (kind) {
  case EntryKind::File:
    return "file";
  case EntryKind::Directory:
    return "dir";
  case EntryKind::Symlink:
    return "symlink";
  case EntryKind::Other:
    return "other";
  }
  return "other";
}

bool parseEntryKind(const std::string &name, EntryKind &kind) {
  if (name == "file") {
    kind = EntryKind::File;
  } else if (name == "dir") {
    kind = EntryKind::Directory;
  } else if (name == "symlink") {
    kind = EntryKind::Symlink;
  } else if (name == "other") {
    kind = EntryKind::Other;
  } else {
    return false;
  }
  return true;
}

bool readDiskEntry(const std::filesystem::path &path, DiskEntry &out,
                   std::error_code &ec) {
  struct stat sb {};
  if (::lstat(path.c_str(), &sb) != 0) {
    ec = std::error_code(errno, std::generic_category());
    return false;
  }

  out.identity.device = static_cast<std::uint64_t>(sb.st_dev);
  out.identity.inode = static_cast<std::uint64_t>(sb.st_ino);
  out.size = static_cast<std::uint64_t>(sb.st_size);
  out.linkCount = static_cast<std::uint64_t>(sb.st_nlink);

  // st_blocks is always in 512-byte units
  if (sb.st_blocks > 0) {
    out.diskUsage = static_cast<std::uint64_t>(sb.st_blocks) * 512u;
  } else {
    out.diskUsage = out.size;
  }

  if (S_ISDIR(sb.st_mode)) {
    out.kind = EntryKind::Directory;
  } else if (S_ISLNK(sb.st_mode)) {
    out.kind = EntryKind::Symlink;
  } else if (S_ISREG(sb.st_mode)) {
    out.kind = EntryKind::File;
  } else {
    out.kind = EntryKind::Other;
  }

  ec.clear();
  return true;
}
