/**
 * @file filescanner.hpp
 * @brief Hardlink-aware directory scanning
 *
 * This header defines the FileScanner class which walks a directory tree,
 * lstat()s every entry, builds the browse tree, fills the inode registry and
 * computes deduplicated aggregates.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

#include "cancellation.hpp"
#include "errors.hpp"
#include "ilogsink.hpp"
#include "scanresult.hpp"

/**
 * @struct ScanOptions
 * @brief Walk policy for FileScanner::scan()
 */
struct ScanOptions {
  /** @brief Do not descend into directories on another device */
  bool xdev = false;

  /** @brief Aggregate logical sizes instead of allocated blocks */
  bool apparentSize = false;

  /** @brief Number of worker threads; 1 scans on the calling thread */
  unsigned workers = 1;

  /** @brief Optional cooperative cancellation, checked between entries */
  const CancellationToken *cancel = nullptr;
};

/**
 * @class FileScanner
 * @brief Scans a directory tree into a ScanResult
 *
 * Key features:
 * - Symlinks are recorded by their own identity and never followed
 * - xdev: other filesystems are listed but not descended (crossDevice flag)
 * - Unreadable entries are omitted and summarized once at the end
 * - Children sorted by name, so the tree does not depend on listing order
 * - Optional fan-out over the root's subdirectories with std::async
 * - Progress reporting via callbacks or atomic counters
 *
 * Only a root that cannot be stat()ed, or is not a directory, is fatal
 * (PathError).
 *
 * @see ScanResult
 * @see InodeRegistry
 * @see Aggregator
 */
class FileScanner {
private:
  /** @brief Destination for scan events */
  ILogSink &m_log;

  /** @brief Optional atomic counter for thread-safe progress tracking */
  std::atomic<int> *m_progress_counter = nullptr;

public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(int count)
   * - count: Number of entries processed so far
   */
  using ProgressCallback = std::function<void(int count)>;

  explicit FileScanner(ILogSink &log) : m_log(log) {}

  /**
   * @brief Sets an atomic progress counter for thread-safe progress tracking
   *
   * @param counter Pointer to atomic integer counter, or nullptr to disable
   *
   * @note The counter is not reset by this class; caller manages initialization
   */
  void setProgressCounter(std::atomic<int> *counter) {
    m_progress_counter = counter;
  }

  /**
   * @brief Scans a directory and returns the aggregated result
   *
   * @param root Directory to scan; made absolute
   * @param options Walk policy
   * @param progress Optional callback, invoked every 100 entries and once at
   *                 the end (only from the calling thread)
   *
   * @return ScanResult with tree, registry and aggregates filled in. If the
   *         walk was cancelled the result is partial but consistent and
   *         has cancelled set.
   *
   * @throws PathError if the root cannot be stat()ed or is not a directory
   */
  ScanResult scan(const std::filesystem::path &root, const ScanOptions &options,
                  ProgressCallback progress = nullptr);

private:
  /** @brief Per-walk bookkeeping, one per worker */
  struct WalkContext {
    const ScanOptions *options = nullptr;
    std::uint64_t rootDevice = 0;
    ErrorSummary errors;
    std::size_t boundaries = 0;
    std::size_t entries = 0;
    bool cancelled = false;
    ProgressCallback progress;
  };

  /** @brief One listed directory entry before it is added to the tree */
  struct ListedEntry {
    std::string name;
    DiskEntry entry;
  };

  /**
   * @brief Lists and lstat()s the entries of a directory, sorted by name
   *
   * @return false if the directory itself cannot be listed
   */
  bool listDirectory(const std::filesystem::path &dir,
                     std::vector<ListedEntry> &out, WalkContext &context) const;

  /** @brief Adds the children of node and recurses into subdirectories */
  void walkDirectory(ScanTree &tree, NodeHandle node,
                     const std::filesystem::path &dir,
                     WalkContext &context) const;

  /** @brief true if a listed directory must not be descended */
  bool crossesBoundary(const DiskEntry &entry, const WalkContext &context) const;

  void countEntry(WalkContext &context) const;

  void walkParallel(ScanTree &tree, const std::filesystem::path &root,
                    WalkContext &context) const;

  /**
   * @brief Feeds every non-directory node into the registry
   *
   * With several workers the root's subtrees are registered concurrently;
   * the registry's owner election keeps the outcome identical.
   */
  void registerEntries(ScanResult &result, unsigned workers) const;
};

#endif // FILESCANNER_HPP
