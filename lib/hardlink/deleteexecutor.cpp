#include "deleteexecutor.hpp"
#include "filesafety.hpp"
#include "utils.hpp"

DeleteReport DeleteExecutor::execute(const PurgePlan &plan,
                                     const DeleteOptions &options) {
  DeleteReport report;
  report.plannedPaths = plan.pathCount();
  report.dryRun = options.dryRun;
  report.incomplete = plan.incomplete();
  report.estimateOnly = !report.incomplete.empty();

  if (options.dryRun) {
    report.freedBytes = plan.estimatedBytes();
    m_log.info("delete-result", "DRY-RUN enabled. Nothing was deleted (" +
                                    std::to_string(report.plannedPaths) +
                                    " paths, est. freed " +
                                    formatMiB(report.freedBytes) + ")");
    return report;
  }

  if (!options.confirmed) {
    report.aborted = true;
    m_log.info("delete-result", "Cancelled by user, nothing was deleted");
    return report;
  }

  std::vector<FileSafety::MountInfo> mounts;
  if (options.checkSafety) {
    mounts = FileSafety::getMountPoints();
  }

  for (const auto &item : plan.inodes) {
    const PurgeInode &inode = item.second;
    std::size_t remaining = inode.paths.size();

    for (const auto &path : inode.paths) {
      if (cancelRequested(options.cancel)) {
        report.cancelled = true;
        break;
      }

      if (options.checkSafety) {
        auto status = FileSafety::checkDeletion(path, mounts);
        if (status != FileSafety::DeletionStatus::Allowed) {
          std::string message = FileSafety::getStatusMessage(status, path);
          m_log.error("delete-error", message);
          report.errors.add(message);
          ++report.failedPaths;
          continue;
        }
      }

      std::error_code ec;
      if (m_remover.remove(path, ec)) {
        ++report.deletedPaths;
        m_log.debug("delete-path", "Deleted " + path);
        if (--remaining == 0) {
          report.freedBytes += inode.diskUsage;
        }
        continue;
      }

      ++report.failedPaths;
      report.errors.add(path + ": " + ec.message());
      if (ec == std::errc::no_such_file_or_directory) {
        m_log.warn("delete-error", "Already doesn't exist: " + path);
      } else if (ec == std::errc::permission_denied ||
                 ec == std::errc::operation_not_permitted) {
        m_log.error("delete-error", "No permission to delete: " + path);
      } else if (ec == std::errc::is_a_directory) {
        m_log.error("delete-error",
                    "This is a directory (expected file): " + path);
      } else {
        m_log.error("delete-error",
                    "Error deleting " + path + ": " + ec.message());
      }
    }

    if (report.cancelled)
      break;
  }

  logReport(report);
  return report;
}

DeleteReport DeleteExecutor::executePaths(const std::vector<std::string> &paths,
                                          const DeleteOptions &options) {
  PurgePlan plan;
  ErrorSummary vanished;

  for (const auto &path : paths) {
    DiskEntry entry;
    std::error_code ec;
    if (!readDiskEntry(path, entry, ec)) {
      vanished.add(path + ": " + ec.message());
      m_log.warn("delete-error", "Already doesn't exist: " + path);
      continue;
    }

    PurgeInode &inode = plan.inodes[entry.identity];
    if (inode.paths.empty()) {
      inode.identity = entry.identity;
      inode.diskUsage = entry.diskUsage;
      inode.linkCount = entry.linkCount;
    }
    inode.paths.push_back(path);
  }

  DeleteReport report = execute(plan, options);
  report.plannedPaths += vanished.count;
  if (!options.dryRun && !report.aborted) {
    report.failedPaths += vanished.count;
    report.errors.merge(vanished);
  }
  return report;
}

void DeleteExecutor::logReport(const DeleteReport &report) {
  std::string message = "Deleted paths: " +
                        std::to_string(report.deletedPaths) + " of " +
                        std::to_string(report.plannedPaths) +
                        ". Estimated freed size: " +
                        formatMiB(report.freedBytes);
  if (report.failedPaths > 0) {
    message += ", " + std::to_string(report.failedPaths) + " failed";
  }
  if (report.cancelled) {
    message += " (cancelled)";
  }

  if (report.failedPaths > 0) {
    m_log.warn("delete-result", message);
    m_log.warn("delete-result",
               report.errors.describe("paths could not be removed"));
  } else {
    m_log.info("delete-result", message);
  }

  if (report.estimateOnly) {
    m_log.warn("delete-result",
               std::to_string(report.incomplete.size()) +
                   " identities keep links outside the search, freed size is "
                   "an estimate");
  }
}
