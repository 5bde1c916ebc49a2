/**
 * @file cleaneroptions.hpp
 * @brief Command line settings of hardlink-cleaner
 */

#ifndef CLEANEROPTIONS_HPP
#define CLEANEROPTIONS_HPP

#include <cstddef>
#include <string>

/**
 * @enum ExitCode
 * @brief Process exit status of hardlink-cleaner
 */
enum ExitCode {
  EXIT_OK = 0,
  EXIT_PARTIAL_FAILURE = 1,
  EXIT_HARD_FAILURE = 2,
  EXIT_ABORTED = 3,
  EXIT_INTERRUPTED = 130
};

/**
 * @struct CleanerOptions
 * @brief Every setting of one run; there is no configuration file
 */
struct CleanerOptions {
  std::string path;

  bool xdev = false;
  bool interactive = true;
  bool yes = false;
  bool dryRun = false;

  std::string saveScan;
  std::string loadScan;
  std::string fsRoot;

  bool contained = false;
  bool removeSymlinks = false;

  bool report = false;
  std::size_t reportDepth = 1;

  bool apparentSize = false;
  unsigned jobs = 1;

  bool verbose = false;
  std::string logFile;

  bool help = false;
};

/**
 * @brief Parses argv into CleanerOptions
 *
 * Batch modes (--contained, --remove-symlinks, --report) imply
 * --no-interactive. The path may be omitted only with --load-scan or
 * --help.
 *
 * @throws std::invalid_argument on unknown options, missing or malformed
 *         values and conflicting modes
 */
CleanerOptions parseArguments(int argc, const char *const argv[]);

/** @brief Help text printed for -h/--help and after usage errors */
std::string usageText(const std::string &program);

#endif // CLEANEROPTIONS_HPP
