#include "cleaneroptions.hpp"

#include <sstream>
#include <stdexcept>

namespace {

bool isNumber(const std::string &value) {
  return !value.empty() &&
         value.find_first_not_of("0123456789") == std::string::npos;
}

unsigned long parseCount(const std::string &option, const std::string &value) {
  if (!isNumber(value))
    throw std::invalid_argument(option + " expects a number, got '" + value +
                                "'");
  try {
    return std::stoul(value);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(option + " value out of range: " + value);
  }
}

} // namespace

CleanerOptions parseArguments(int argc, const char *const argv[]) {
  CleanerOptions options;
  bool interactiveSet = false;

  auto valueOf = [&](int &i, const std::string &arg) -> std::string {
    if (i + 1 >= argc)
      throw std::invalid_argument(arg + " requires a value");
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "--xdev") {
      options.xdev = true;
    } else if (arg == "-i" || arg == "--interactive") {
      options.interactive = true;
      interactiveSet = true;
    } else if (arg == "--no-interactive") {
      options.interactive = false;
      interactiveSet = true;
    } else if (arg == "-y" || arg == "--yes") {
      options.yes = true;
    } else if (arg == "--dry-run") {
      options.dryRun = true;
    } else if (arg == "--save-scan") {
      options.saveScan = valueOf(i, arg);
    } else if (arg == "--load-scan") {
      options.loadScan = valueOf(i, arg);
    } else if (arg == "--fs-root") {
      options.fsRoot = valueOf(i, arg);
    } else if (arg == "--contained") {
      options.contained = true;
    } else if (arg == "--remove-symlinks") {
      options.removeSymlinks = true;
    } else if (arg == "--report") {
      options.report = true;
      // Optional depth
      if (i + 1 < argc && isNumber(argv[i + 1])) {
        options.reportDepth = parseCount(arg, argv[++i]);
      }
    } else if (arg == "--apparent-size") {
      options.apparentSize = true;
    } else if (arg == "-j" || arg == "--jobs") {
      unsigned long jobs = parseCount(arg, valueOf(i, arg));
      if (jobs == 0 || jobs > 256)
        throw std::invalid_argument(arg + " must be between 1 and 256");
      options.jobs = static_cast<unsigned>(jobs);
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--log") {
      options.logFile = valueOf(i, arg);
    } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
      throw std::invalid_argument("Unknown option: " + arg);
    } else if (options.path.empty()) {
      options.path = arg;
    } else {
      throw std::invalid_argument("Unexpected argument: " + arg);
    }
  }

  if (options.help)
    return options;

  int modes = (options.contained ? 1 : 0) + (options.removeSymlinks ? 1 : 0) +
              (options.report ? 1 : 0);
  if (modes > 1)
    throw std::invalid_argument(
        "--contained, --remove-symlinks and --report are exclusive");

  if (modes == 1) {
    if (interactiveSet && options.interactive)
      throw std::invalid_argument("Batch modes cannot run interactively");
    options.interactive = false;
  }

  if (!options.loadScan.empty() && !options.saveScan.empty() &&
      options.loadScan == options.saveScan)
    throw std::invalid_argument("--load-scan and --save-scan name the same file");

  if (options.path.empty() && options.loadScan.empty())
    throw std::invalid_argument("Missing <path>");

  return options;
}

std::string usageText(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options] <path>\n"
      << "\n"
      << "Find every hardlink of the selected files on the filesystem and\n"
      << "remove them together, so the space is actually freed.\n"
      << "\n"
      << "Options:\n"
      << "  --xdev                 do not descend into other filesystems\n"
      << "  -i, --interactive      browse and select in the terminal (default)\n"
      << "  --no-interactive       purge the whole <path> without browsing\n"
      << "  -y, --yes              do not ask for confirmation (batch and browser)\n"
      << "  --dry-run              discover and report, delete nothing\n"
      << "  --save-scan <file>     save the scan as JSON\n"
      << "  --load-scan <file>     use a saved scan instead of walking <path>\n"
      << "  --fs-root <dir>        search root for hardlinks (default: mount\n"
      << "                         point containing <path>)\n"
      << "  --contained            purge only files whose every link is inside\n"
      << "                         <path>\n"
      << "  --remove-symlinks      remove the symlinks inside <path>\n"
      << "  --report [depth]       print the largest directories and exit\n"
      << "  --apparent-size        count logical sizes instead of disk usage\n"
      << "  -j, --jobs <n>         walk with n threads\n"
      << "  -v, --verbose          debug logging\n"
      << "  --log <file>           also write the log to <file>\n"
      << "  -h, --help             show this help\n"
      << "\n"
      << "Exit codes: 0 success, 1 some deletions failed, 2 error,\n"
      << "3 aborted, 130 interrupted\n";
  return out.str();
}
