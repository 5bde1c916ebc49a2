/**
 * @file purgeengine.hpp
 * @brief Filesystem-wide discovery of every hardlink to selected identities
 *
 * Unix only reclaims the space of a file once its last directory entry is
 * gone. The PurgeEngine therefore walks a search root that is usually much
 * larger than the scanned directory (by default the whole filesystem the
 * scan lives on) and collects every path still referring to the targeted
 * identities. The result is a PurgePlan that is shown for confirmation and
 * then handed to the DeleteExecutor.
 */

#ifndef PURGEENGINE_HPP
#define PURGEENGINE_HPP

#include "cancellation.hpp"
#include "errors.hpp"
#include "fileidentity.hpp"
#include "filesafety.hpp"
#include "ilogsink.hpp"
#include "scanresult.hpp"
#include "selectionmodel.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @struct PurgeInode
 * @brief One targeted identity with every path found for it
 */
struct PurgeInode {
  FileIdentity identity;

  /** @brief All matching paths, sorted and unique */
  std::vector<std::string> paths;

  /** @brief Captured once: every link shares the same data */
  std::uint64_t diskUsage = 0;

  /** @brief st_nlink observed during the purge walk */
  std::uint64_t linkCount = 0;

  /** @brief true if the walk found as many paths as the filesystem has links */
  bool complete() const { return paths.size() >= linkCount; }
};

/**
 * @struct PurgeOptions
 * @brief Walk policy for PurgeEngine::discover()
 */
struct PurgeOptions {
  /** @brief Directory to search; see PurgeEngine::defaultSearchRoot() */
  std::string searchRoot;

  /** @brief Do not descend into directories on another device */
  bool xdev = false;

  /** @brief Number of worker threads; 1 walks on the calling thread */
  unsigned workers = 1;

  const CancellationToken *cancel = nullptr;
};

/**
 * @struct PurgePlan
 * @brief Everything to delete, known before any deletion happens
 */
struct PurgePlan {
  std::string searchRoot;

  /** @brief Found identities, ordered by identity */
  std::map<FileIdentity, PurgeInode> inodes;

  /** @brief Targets found nowhere (deleted externally since the scan) */
  std::vector<FileIdentity> missing;

  std::size_t entriesVisited = 0;
  std::size_t boundariesSkipped = 0;
  ErrorSummary errors;
  bool cancelled = false;

  std::size_t pathCount() const;

  /** @brief Sum of disk usage, one copy per identity */
  std::uint64_t estimatedBytes() const;

  /** @brief Every path of the plan, ordered by identity then path */
  std::vector<std::string> allPaths() const;

  /** @brief Identities with fewer discovered paths than links */
  std::vector<FileIdentity> incomplete() const;

  bool empty() const { return inodes.empty(); }
};

/**
 * @class PurgeEngine
 * @brief Builds PurgePlans for selections of a scan
 *
 * The walk honors the same xdev rule as the FileScanner: a directory is only
 * skipped when it is on another device than the search root, never because
 * it lies outside the scanned subtree. Only regular files are matched.
 * Kernel pseudo filesystems (proc, sysfs, ...) are never descended.
 *
 * With several workers the search root's subdirectories are walked
 * concurrently. Path lists are merged as sorted unions, so the plan does not
 * depend on scheduling.
 */
class PurgeEngine {
public:
  explicit PurgeEngine(ILogSink &log) : m_log(log) {}

  /**
   * @brief Walks options.searchRoot for every path of the targets
   *
   * Targets found nowhere are listed in PurgePlan::missing and logged as a
   * warning. Identities with fewer discovered paths than links are logged as
   * incomplete.
   *
   * @throws PathError if the search root cannot be stat()ed or is not a
   *         directory
   */
  PurgePlan discover(const std::vector<PurgeTarget> &targets,
                     const PurgeOptions &options);

  /**
   * @brief Plan for identities whose every link lies inside the scan
   *
   * No walk is performed: an identity qualifies when the scan saw as many
   * paths as its link count.
   */
  PurgePlan planContained(const ScanResult &scan);

  /** @brief Every symlink path inside the scan, sorted */
  static std::vector<std::string> planSymlinks(const ScanResult &scan);

  /**
   * @brief Mount boundary containing the scanned directory
   * @throws PathError if the scan root cannot be stat()ed
   */
  static std::string defaultSearchRoot(const ScanResult &scan);

private:
  using TargetMap =
      std::unordered_map<FileIdentity, PurgeTarget, FileIdentityHash>;

  /** @brief Per-worker walk state */
  struct WalkContext {
    const PurgeOptions *options = nullptr;
    const TargetMap *targets = nullptr;
    const std::vector<std::string> *skipMounts = nullptr;
    std::uint64_t rootDevice = 0;
    std::map<FileIdentity, PurgeInode> found;
    std::size_t entries = 0;
    std::size_t boundaries = 0;
    ErrorSummary errors;
    bool cancelled = false;
  };

  /** @brief Directory the walk would descend into, or not */
  bool shouldDescend(const std::filesystem::path &dir, const DiskEntry &entry,
                     WalkContext &context) const;

  /**
   * @brief Visits the entries of one directory
   * @param subdirs Receives directories to descend into
   */
  void visitDirectory(const std::filesystem::path &dir,
                      std::vector<std::filesystem::path> &subdirs,
                      WalkContext &context) const;

  /** @brief Iterative depth-first walk below start */
  void walkFrom(const std::filesystem::path &start, WalkContext &context) const;

  static void mergeInto(std::map<FileIdentity, PurgeInode> &into,
                        std::map<FileIdentity, PurgeInode> &from);

  void finish(PurgePlan &plan, const TargetMap &targets);

  ILogSink &m_log;
};

#endif // PURGEENGINE_HPP
