/**
 * @file deleteexecutor.hpp
 * @brief Best-effort batch removal of a purge plan
 */

#ifndef DELETEEXECUTOR_HPP
#define DELETEEXECUTOR_HPP

#include "cancellation.hpp"
#include "errors.hpp"
#include "ilogsink.hpp"
#include "ipathremover.hpp"
#include "purgeengine.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct DeleteOptions {
  /** @brief Report what would be removed, remove nothing */
  bool dryRun = false;

  /** @brief Operator confirmation, obtained before execute() */
  bool confirmed = false;

  /** @brief Refuse system paths, home, mount points and virtual filesystems */
  bool checkSafety = true;

  /** @brief Checked between paths; a single removal is never interrupted */
  const CancellationToken *cancel = nullptr;
};

/**
 * @struct DeleteReport
 * @brief Outcome of one batch
 *
 * freedBytes credits an identity's disk usage once its last known path is
 * removed. When the plan holds identities with links outside the search
 * root, estimateOnly is set: those links keep the data alive.
 */
struct DeleteReport {
  std::size_t plannedPaths = 0;
  std::size_t deletedPaths = 0;
  std::size_t failedPaths = 0;
  std::uint64_t freedBytes = 0;

  bool dryRun = false;
  bool cancelled = false;

  /** @brief Not confirmed: nothing was attempted */
  bool aborted = false;

  bool estimateOnly = false;

  /** @brief Identities with fewer discovered paths than links */
  std::vector<FileIdentity> incomplete;

  ErrorSummary errors;

  bool success() const { return failedPaths == 0 && !cancelled && !aborted; }
};

/**
 * @class DeleteExecutor
 * @brief Removes the paths of a PurgePlan
 *
 * Per-path failures are logged and counted; the batch always continues. A
 * path that vanished since discovery counts as a failure with a warning.
 *
 * Example usage:
 * @code
 * DeleteExecutor executor(log);
 * DeleteOptions options;
 * options.confirmed = askUser();
 * DeleteReport report = executor.execute(plan, options);
 * @endcode
 */
class DeleteExecutor {
public:
  /** @brief Uses the real filesystem */
  explicit DeleteExecutor(ILogSink &log)
      : m_log(log), m_remover(m_filesystem_remover) {}

  /** @param remover Must outlive the executor */
  DeleteExecutor(ILogSink &log, IPathRemover &remover)
      : m_log(log), m_remover(remover) {}

  DeleteExecutor(const DeleteExecutor &) = delete;
  DeleteExecutor &operator=(const DeleteExecutor &) = delete;

  DeleteReport execute(const PurgePlan &plan, const DeleteOptions &options);

  /**
   * @brief Removes an explicit list of paths (symlink removal)
   *
   * Each path is lstat()ed to build a plan first. Paths that no longer
   * exist are counted as failures.
   */
  DeleteReport executePaths(const std::vector<std::string> &paths,
                            const DeleteOptions &options);

private:
  void logReport(const DeleteReport &report);

  ILogSink &m_log;
  FilesystemRemover m_filesystem_remover;
  IPathRemover &m_remover;
};

#endif // DELETEEXECUTOR_HPP
