#include <cctype>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "aggregator.hpp"
#include "browserui.hpp"
#include "cancellation.hpp"
#include "cleaneroptions.hpp"
#include "deleteexecutor.hpp"
#include "errors.hpp"
#include "filescanner.hpp"
#include "purgeengine.hpp"
#include "scanpersistence.hpp"
#include "selectionmodel.hpp"
#include "streamlogsink.hpp"
#include "utils.hpp"

namespace {

CancellationToken g_cancel;

extern "C" void onInterrupt(int) {
  g_cancel.cancel();
  // A second Ctrl-C terminates immediately
  std::signal(SIGINT, SIG_DFL);
}

} // namespace

/**
 * @class Application
 * @brief Runs one hardlink-cleaner invocation
 *
 * Pipeline: scan (or load) -> optional save -> select -> purge search ->
 * confirm -> delete. The selection comes from the terminal browser in
 * interactive mode; batch mode selects the whole scanned tree.
 *
 * Batch modes:
 *  - --report: print the largest directories and exit
 *  - --contained: purge only files whose every link lies inside the scan
 *  - --remove-symlinks: remove the symlinks inside the scan
 *
 * Error handling
 *  - PathError and SerializationError end the run with EXIT_HARD_FAILURE
 *  - Per-path delete failures end it with EXIT_PARTIAL_FAILURE
 *  - A declined confirmation ends it with EXIT_ABORTED
 *  - SIGINT cancels walks and the delete loop, EXIT_INTERRUPTED
 */
class Application {
private:
  const CleanerOptions &m_options;
  StreamLogSink &m_log;

  /** @brief Root of the last walked or loaded scan */
  std::string m_scanned_root;

public:
  Application(const CleanerOptions &options, StreamLogSink &log)
      : m_options(options), m_log(log) {}

  int run() {
    try {
      if (m_options.interactive) {
        return runInteractive();
      }

      ScanResult scan = obtainScan();
      if (scan.cancelled) {
        m_log.warn("interrupted", "Interrupted by user");
        return EXIT_INTERRUPTED;
      }

      if (m_options.report) {
        return runReport(scan);
      }
      if (m_options.removeSymlinks) {
        return runRemoveSymlinks(scan);
      }
      return runPurge(scan);
    } catch (const PathError &e) {
      m_log.error("path-error", e.what());
      return EXIT_HARD_FAILURE;
    } catch (const SerializationError &e) {
      m_log.error("load-error", e.what());
      return EXIT_HARD_FAILURE;
    }
  }

private:
  ScanOptions scanOptions() const {
    ScanOptions options;
    options.xdev = m_options.xdev;
    options.apparentSize = m_options.apparentSize;
    options.workers = m_options.jobs;
    options.cancel = &g_cancel;
    return options;
  }

  ScanResult walk(const std::string &path, std::atomic<int> *progress) {
    FileScanner scanner(m_log);
    scanner.setProgressCounter(progress);
    return scanner.scan(path, scanOptions());
  }

  /** @brief Loads --load-scan or walks the path, then saves --save-scan */
  ScanResult obtainScan(std::atomic<int> *progress = nullptr,
                        bool save = true) {
    ScanResult scan;
    if (!m_options.loadScan.empty()) {
      m_log.info("scan-load",
                 "Loading scan results from file: " + m_options.loadScan);
      scan = ScanPersistence::load(m_options.loadScan);
      m_log.info("scan-load", "Loaded scan of " + scan.rootPath + " from " +
                                  scan.generatedAt + ", total " +
                                  formatBytes(scan.totalBytes()));
    } else {
      scan = walk(m_options.path, progress);
    }
    m_scanned_root = scan.rootPath;

    if (save) {
      saveIfRequested(scan);
    }
    return scan;
  }

  void saveIfRequested(const ScanResult &scan) {
    if (m_options.saveScan.empty() || scan.cancelled) {
      return;
    }
    ScanPersistence::save(scan, m_options.saveScan);
    m_log.info("scan-save", "Saved scan to " + m_options.saveScan);
  }

  std::string searchRoot(const ScanResult &scan) const {
    if (!m_options.fsRoot.empty()) {
      return m_options.fsRoot;
    }
    return PurgeEngine::defaultSearchRoot(scan);
  }

  // ===== Modes =====

  int runReport(const ScanResult &scan) {
    auto dirs =
        Aggregator::largestDirectories(scan, m_options.reportDepth, 0);

    std::cout << "\n--- Largest directories (depth " << m_options.reportDepth
              << ", " << (scan.apparentSize ? "apparent size" : "disk usage")
              << ") ---" << std::endl;
    for (const auto &dir : dirs) {
      std::string size = formatBytes(dir.bytes);
      std::cout << std::string(size.size() < 12 ? 12 - size.size() : 0, ' ')
                << size << "  " << dir.path << std::endl;
    }
    std::cout << "Total (hardlinks counted once): "
              << formatBytes(scan.totalBytes()) << std::endl;
    return EXIT_OK;
  }

  int runRemoveSymlinks(const ScanResult &scan) {
    std::vector<std::string> links = PurgeEngine::planSymlinks(scan);
    if (links.empty()) {
      m_log.info("symlinks", "No symlinks in " + scan.rootPath);
      return EXIT_OK;
    }

    for (const auto &link : links) {
      m_log.info("symlinks", "[SYMLINK] " + link);
    }
    m_log.info("symlinks", std::to_string(links.size()) + " symlinks found");

    DeleteOptions options;
    options.dryRun = m_options.dryRun;
    options.cancel = &g_cancel;
    if (!m_options.dryRun) {
      options.confirmed = confirm("Remove ALL above symlinks? [y/N]: ");
    }

    DeleteExecutor executor(m_log);
    return exitCodeFor(executor.executePaths(links, options));
  }

  int runPurge(const ScanResult &scan) {
    PurgeEngine engine(m_log);
    PurgePlan plan;

    if (m_options.contained) {
      m_log.info("mode", "Mode: contained purge in " + scan.rootPath);
      plan = engine.planContained(scan);
    } else {
      SelectionModel selection(scan);
      selection.mark(scan.tree.root());
      std::vector<PurgeTarget> targets = selection.purgeTargets();
      if (targets.empty()) {
        m_log.info("purge-found", "No files to purge in: " + scan.rootPath);
        return EXIT_OK;
      }

      PurgeOptions options;
      options.searchRoot = searchRoot(scan);
      options.xdev = m_options.xdev;
      options.workers = m_options.jobs;
      options.cancel = &g_cancel;

      m_log.info("mode", "Mode: global hardlink purge in " + scan.rootPath +
                             " (fs_root=" + options.searchRoot + ")");
      plan = engine.discover(targets, options);
    }

    if (plan.cancelled) {
      m_log.warn("interrupted", "Interrupted by user");
      return EXIT_INTERRUPTED;
    }
    if (plan.empty()) {
      m_log.info("purge-found", "No paths found to delete within " +
                                    plan.searchRoot);
      return EXIT_OK;
    }

    m_log.info("purge-found",
               "To delete: " + std::to_string(plan.inodes.size()) +
                   " inodes, " + std::to_string(plan.pathCount()) +
                   " paths. Est. freed: " + formatMiB(plan.estimatedBytes()));
    for (const auto &path : plan.allPaths()) {
      m_log.info("purge-path", "[PURGE] " + path);
    }

    DeleteOptions options;
    options.dryRun = m_options.dryRun;
    options.cancel = &g_cancel;
    if (!m_options.dryRun) {
      options.confirmed = confirm("Delete ALL above paths (purge)? [y/N]: ");
    }

    DeleteExecutor executor(m_log);
    return exitCodeFor(executor.execute(plan, options));
  }

  int runInteractive() {
    BrowserContext context;
    context.initialScan = [this](std::atomic<int> &progress) {
      return obtainScan(&progress, false);
    };
    context.rescan = [this](std::atomic<int> &progress) {
      // A loaded scan is refreshed from its own root
      return walk(m_scanned_root, &progress);
    };
    context.onScanned = [this](const ScanResult &scan) {
      try {
        saveIfRequested(scan);
      } catch (const SerializationError &e) {
        m_log.error("save-error", e.what());
      }
    };
    context.session.searchRoot = m_options.fsRoot;
    context.session.xdev = m_options.xdev;
    context.session.dryRun = m_options.dryRun;
    context.session.assumeYes = m_options.yes;
    context.session.workers = m_options.jobs;
    context.session.cancel = &g_cancel;
    context.cancel = &g_cancel;

    BrowserOutcome outcome;
    m_log.setConsoleMuted(true);
    {
      BrowserUI ui(m_log, context);
      ui.initialize();
      ui.run();
      outcome = ui.outcome();
    }
    m_log.setConsoleMuted(false);

    if (outcome.scanFailed) {
      m_log.error("scan-error", outcome.error);
      return EXIT_HARD_FAILURE;
    }
    if (outcome.deletedPaths > 0 || outcome.failedPaths > 0) {
      m_log.info("delete-result",
                 "Deleted paths: " + std::to_string(outcome.deletedPaths) +
                     ". Estimated freed size: " +
                     formatMiB(outcome.freedBytes));
    }
    if (outcome.interrupted) {
      return EXIT_INTERRUPTED;
    }
    return outcome.failedPaths > 0 ? EXIT_PARTIAL_FAILURE : EXIT_OK;
  }

  // ===== Helpers =====

  /** @brief Asks on stdin unless --yes was given */
  bool confirm(const std::string &question) {
    if (m_options.yes) {
      return true;
    }
    std::cout << question << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer)) {
      return false;
    }
    // trim and lower-case
    auto first = answer.find_first_not_of(" \t\r");
    auto last = answer.find_last_not_of(" \t\r");
    answer = first == std::string::npos ? ""
                                        : answer.substr(first, last - first + 1);
    for (auto &c : answer) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return answer == "y" || answer == "yes";
  }

  int exitCodeFor(const DeleteReport &report) const {
    if (report.aborted) {
      return EXIT_ABORTED;
    }
    if (report.cancelled) {
      return EXIT_INTERRUPTED;
    }
    return report.failedPaths > 0 ? EXIT_PARTIAL_FAILURE : EXIT_OK;
  }
};

int main(int argc, char *argv[]) {
  CleanerOptions options;
  try {
    options = parseArguments(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n\n" << usageText(argv[0]);
    return EXIT_HARD_FAILURE;
  }

  if (options.help) {
    std::cout << usageText(argv[0]);
    return EXIT_OK;
  }

  StreamLogSink log(std::cout,
                    options.verbose ? LogLevel::Debug : LogLevel::Info,
                    options.logFile);
  if (!options.logFile.empty() && !log.fileOpen()) {
    log.warn("log-error", "Cannot open log file " + options.logFile);
  }

  std::signal(SIGINT, onInterrupt);

  Application app(options, log);
  return app.run();
}
