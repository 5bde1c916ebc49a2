/**
 * @file purgeengine.cpp
 * @brief Implementation of the global purge discovery walk
 */

#include "purgeengine.hpp"
#include "utils.hpp"

#include <algorithm>
#include <future>

namespace fs = std::filesystem;

namespace {

// "/dev/sda1 on /" for the mount holding path
std::string describeMount(const std::string &path,
                          const std::vector<FileSafety::MountInfo> &mounts) {
  const std::string mountpoint = FileSafety::mountPointFor(path, mounts);
  for (auto it = mounts.rbegin(); it != mounts.rend(); ++it) {
    if (it->mountpoint == mountpoint)
      return it->device + " on " + mountpoint;
  }
  return "unknown mount";
}

} // namespace

std::size_t PurgePlan::pathCount() const {
  std::size_t count = 0;
  for (const auto &item : inodes) {
    count += item.second.paths.size();
  }
  return count;
}

std::uint64_t PurgePlan::estimatedBytes() const {
  std::uint64_t bytes = 0;
  for (const auto &item : inodes) {
    bytes += item.second.diskUsage;
  }
  return bytes;
}

std::vector<std::string> PurgePlan::allPaths() const {
  std::vector<std::string> paths;
  paths.reserve(pathCount());
  for (const auto &item : inodes) {
    paths.insert(paths.end(), item.second.paths.begin(),
                 item.second.paths.end());
  }
  return paths;
}

std::vector<FileIdentity> PurgePlan::incomplete() const {
  std::vector<FileIdentity> result;
  for (const auto &item : inodes) {
    if (!item.second.complete())
      result.push_back(item.first);
  }
  return result;
}

/**
 * @brief Finds every path of the targeted identities below the search root
 *
 * Processing steps:
 * 1. Resolve the search root through symlinks and lstat() it; failure or a
 *    non-directory is a PathError
 * 2. Walk (serially, or fanned out over the root's subdirectories)
 * 3. Merge per-worker path lists as sorted unions
 * 4. Report missing and incomplete identities
 */
PurgePlan PurgeEngine::discover(const std::vector<PurgeTarget> &targets,
                                const PurgeOptions &options) {
  if (options.searchRoot.empty())
    throw PathError("<search root>", "no search root given");

  std::error_code ec;
  fs::path root = fs::canonical(options.searchRoot, ec);
  if (ec)
    throw PathError(options.searchRoot, ec.message());

  DiskEntry rootEntry;
  if (!readDiskEntry(root, rootEntry, ec))
    throw PathError(root.string(), ec.message());
  if (!rootEntry.isDirectory())
    throw PathError(root.string(), "not a directory");

  PurgePlan plan;
  plan.searchRoot = root.string();

  TargetMap targetMap;
  for (const auto &target : targets) {
    targetMap.emplace(target.identity, target);
  }
  if (targetMap.empty()) {
    m_log.info("purge-found", "No files to purge");
    return plan;
  }

  const std::vector<FileSafety::MountInfo> mounts = FileSafety::getMountPoints();
  m_log.info("purge-start", "Searching " + plan.searchRoot + " (" +
                                describeMount(plan.searchRoot, mounts) +
                                ") for " + std::to_string(targetMap.size()) +
                                " identities");

  // Kernel pseudo filesystems can only be reached without xdev
  std::vector<std::string> skipMounts;
  for (const auto &mount : mounts) {
    if (FileSafety::isVirtualFsType(mount.fstype) &&
        mount.mountpoint != plan.searchRoot) {
      skipMounts.push_back(mount.mountpoint);
    }
  }
  std::sort(skipMounts.begin(), skipMounts.end());

  WalkContext context;
  context.options = &options;
  context.targets = &targetMap;
  context.skipMounts = &skipMounts;
  context.rootDevice = rootEntry.identity.device;

  if (options.workers <= 1) {
    walkFrom(root, context);
  } else {
    std::vector<fs::path> subdirs;
    visitDirectory(root, subdirs, context);

    const std::size_t taskCount =
        std::min<std::size_t>(options.workers, subdirs.size());

    std::vector<std::future<WalkContext>> futures;
    futures.reserve(taskCount);
    for (std::size_t worker = 0; worker < taskCount; ++worker) {
      futures.push_back(std::async(std::launch::async, [&, worker]() {
        WalkContext local;
        local.options = context.options;
        local.targets = context.targets;
        local.skipMounts = context.skipMounts;
        local.rootDevice = context.rootDevice;
        for (std::size_t k = worker; k < subdirs.size(); k += taskCount) {
          walkFrom(subdirs[k], local);
        }
        return local;
      }));
    }

    for (auto &future : futures) {
      WalkContext local = future.get();
      mergeInto(context.found, local.found);
      context.entries += local.entries;
      context.boundaries += local.boundaries;
      context.errors.merge(local.errors);
      context.cancelled = context.cancelled || local.cancelled;
    }
  }

  plan.inodes = std::move(context.found);
  plan.entriesVisited = context.entries;
  plan.boundariesSkipped = context.boundaries;
  plan.errors = context.errors;
  plan.cancelled = context.cancelled;

  finish(plan, targetMap);
  return plan;
}

bool PurgeEngine::shouldDescend(const fs::path &dir, const DiskEntry &entry,
                                WalkContext &context) const {
  if (context.options->xdev && entry.identity.device != context.rootDevice) {
    ++context.boundaries;
    return false;
  }
  if (std::binary_search(context.skipMounts->begin(),
                         context.skipMounts->end(), dir.string())) {
    m_log.debug("boundary-skip", "Skipped virtual filesystem: " + dir.string());
    return false;
  }
  return true;
}

void PurgeEngine::visitDirectory(const fs::path &dir,
                                 std::vector<fs::path> &subdirs,
                                 WalkContext &context) const {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    context.errors.add(dir.string() + ": " + ec.message());
    m_log.debug("entry-error", "No permission to: " + dir.string() + " (" +
                                   ec.message() + ")");
    return;
  }

  fs::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      context.errors.add(dir.string() + ": " + ec.message());
      break;
    }
    if (cancelRequested(context.options->cancel)) {
      context.cancelled = true;
      return;
    }

    const fs::path &entryPath = it->path();
    DiskEntry entry;
    std::error_code statEc;
    if (!readDiskEntry(entryPath, entry, statEc)) {
      // Vanished entries are not worth reporting
      if (statEc != std::errc::no_such_file_or_directory) {
        context.errors.add(entryPath.string() + ": " + statEc.message());
      }
      continue;
    }
    ++context.entries;

    if (entry.isDirectory()) {
      if (shouldDescend(entryPath, entry, context))
        subdirs.push_back(entryPath);
      continue;
    }
    if (!entry.isRegularFile())
      continue;

    auto target = context.targets->find(entry.identity);
    if (target == context.targets->end())
      continue;

    PurgeInode &inode = context.found[entry.identity];
    if (inode.paths.empty()) {
      inode.identity = entry.identity;
      inode.diskUsage = target->second.diskUsage != 0
                            ? target->second.diskUsage
                            : entry.diskUsage;
    }
    inode.linkCount = std::max(inode.linkCount, entry.linkCount);
    inode.paths.push_back(entryPath.string());
  }
}

void PurgeEngine::walkFrom(const fs::path &start, WalkContext &context) const {
  std::vector<fs::path> stack{start};
  std::vector<fs::path> subdirs;

  while (!stack.empty() && !context.cancelled) {
    fs::path dir = std::move(stack.back());
    stack.pop_back();

    subdirs.clear();
    visitDirectory(dir, subdirs, context);
    for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
      stack.push_back(std::move(*it));
    }
  }
}

void PurgeEngine::mergeInto(std::map<FileIdentity, PurgeInode> &into,
                            std::map<FileIdentity, PurgeInode> &from) {
  for (auto &item : from) {
    auto existing = into.find(item.first);
    if (existing == into.end()) {
      into.emplace(item.first, std::move(item.second));
      continue;
    }
    PurgeInode &inode = existing->second;
    inode.linkCount = std::max(inode.linkCount, item.second.linkCount);
    inode.paths.insert(inode.paths.end(), item.second.paths.begin(),
                       item.second.paths.end());
  }
}

void PurgeEngine::finish(PurgePlan &plan, const TargetMap &targets) {
  for (auto &item : plan.inodes) {
    auto &paths = item.second.paths;
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
  }

  for (const auto &target : targets) {
    if (plan.inodes.count(target.first) == 0)
      plan.missing.push_back(target.first);
  }
  std::sort(plan.missing.begin(), plan.missing.end());

  if (!plan.errors.empty()) {
    m_log.warn("entry-error",
               plan.errors.describe("entries could not be read during purge"));
  }
  if (plan.cancelled) {
    m_log.warn("purge-cancelled", "Purge search cancelled, plan is partial");
  }
  if (!plan.missing.empty()) {
    std::string sample;
    for (std::size_t i = 0; i < plan.missing.size() && i < 5; ++i) {
      sample += (i == 0 ? "" : ", ") + plan.missing[i].toString();
    }
    m_log.warn("purge-missing",
               std::to_string(plan.missing.size()) +
                   " identities no longer exist and are dropped (" + sample +
                   ")");
  }
  for (const auto &identity : plan.incomplete()) {
    const PurgeInode &inode = plan.inodes.at(identity);
    m_log.warn("purge-incomplete",
               "Only " + std::to_string(inode.paths.size()) + " of " +
                   std::to_string(inode.linkCount) + " links of " +
                   identity.toString() + " found within " + plan.searchRoot +
                   ", space will not be freed");
  }

  m_log.info("purge-found",
             "Purge found " + std::to_string(plan.pathCount()) +
                 " paths for " + std::to_string(plan.inodes.size()) +
                 " identities, est. freed " + formatMiB(plan.estimatedBytes()));
}

PurgePlan PurgeEngine::planContained(const ScanResult &scan) {
  PurgePlan plan;
  plan.searchRoot = scan.rootPath;

  for (const InodeRecord *record : scan.registry.records()) {
    if (record->kind != EntryKind::File || !record->allLinksSeen())
      continue;

    PurgeInode inode;
    inode.identity = record->identity;
    inode.paths = record->paths;
    inode.diskUsage = record->diskUsage;
    inode.linkCount = record->linkCount;
    plan.inodes.emplace(record->identity, std::move(inode));
  }

  m_log.info("purge-found",
             "Contained purge: " + std::to_string(plan.pathCount()) +
                 " paths for " + std::to_string(plan.inodes.size()) +
                 " identities with every link inside " + scan.rootPath);
  return plan;
}

std::vector<std::string> PurgeEngine::planSymlinks(const ScanResult &scan) {
  std::vector<std::string> paths;
  if (scan.tree.empty())
    return paths;

  scan.tree.walk(scan.tree.root(),
                 [&](NodeHandle handle, const std::string &path) {
                   if (scan.tree.node(handle).entry.kind == EntryKind::Symlink)
                     paths.push_back(path);
                 });
  std::sort(paths.begin(), paths.end());
  return paths;
}

std::string PurgeEngine::defaultSearchRoot(const ScanResult &scan) {
  return FileSafety::findFilesystemRoot(scan.rootPath);
}
