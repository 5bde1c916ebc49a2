/**
 * @file filescanner.cpp
 * @brief Implementation of hardlink-aware directory scanning
 */

#include "filescanner.hpp"
#include "aggregator.hpp"
#include "utils.hpp"

#include <algorithm>
#include <future>

namespace fs = std::filesystem;

namespace {

// Resolves symlinks on the way, so a root given through a link scans its target
fs::path normalizeRoot(const fs::path &root) {
  std::error_code ec;
  fs::path resolved = fs::canonical(root, ec);
  if (ec)
    throw PathError(root.string(), ec.message());
  return resolved;
}

} // namespace

/**
 * @brief Scans a directory and collects identity, size and type facts
 *
 * Processing steps:
 * 1. Resolve the root through symlinks, then lstat() it; failure or a
 *    non-directory root is a PathError
 * 2. Walk the tree (serially, or fanned out over the root's subdirectories)
 * 3. Register every non-directory node in the inode registry
 * 4. Aggregate deduplicated sizes bottom-up
 * 5. Summarize recoverable errors once
 */
ScanResult FileScanner::scan(const fs::path &root, const ScanOptions &options,
                             ProgressCallback progress) {
  const fs::path rootPath = normalizeRoot(root);

  DiskEntry rootEntry;
  std::error_code ec;
  if (!readDiskEntry(rootPath, rootEntry, ec))
    throw PathError(rootPath.string(), ec.message());
  if (!rootEntry.isDirectory())
    throw PathError(rootPath.string(), "not a directory");

  m_log.info("scan-start", "Scanning " + rootPath.string() +
                               (options.xdev ? " (staying on one filesystem)"
                                             : ""));

  ScanResult result;
  result.rootPath = rootPath.string();
  result.deviceId = rootEntry.identity.device;
  result.xdev = options.xdev;
  result.apparentSize = options.apparentSize;

  WalkContext context;
  context.options = &options;
  context.rootDevice = rootEntry.identity.device;
  context.progress = progress;

  NodeHandle rootNode = result.tree.addRoot(result.rootPath, rootEntry);

  if (options.workers > 1) {
    walkParallel(result.tree, rootPath, context);
  } else {
    walkDirectory(result.tree, rootNode, rootPath, context);
  }

  registerEntries(result, options.workers);
  Aggregator::aggregate(result);

  result.generatedAt = utcTimestamp();
  result.errors = context.errors;
  result.boundariesSkipped = context.boundaries;
  result.cancelled = context.cancelled;

  // Final callback
  if (progress) {
    progress(static_cast<int>(context.entries));
  }

  if (!result.errors.empty()) {
    m_log.warn("entry-error",
               result.errors.describe("entries could not be read"));
  }
  if (result.boundariesSkipped > 0) {
    m_log.info("boundary-skip",
               "Not scanned (different filesystem): " +
                   std::to_string(result.boundariesSkipped) + " directories");
  }
  if (result.cancelled) {
    m_log.warn("scan-cancelled", "Scan cancelled, results are partial");
  }

  m_log.info("scan-done",
             "Scanned " + std::to_string(context.entries) + " entries, " +
                 std::to_string(result.registry.size()) +
                 " distinct inodes, total " + formatBytes(result.totalBytes()));
  return result;
}

void FileScanner::countEntry(WalkContext &context) const {
  ++context.entries;
  if (m_progress_counter) {
    m_progress_counter->fetch_add(1, std::memory_order_relaxed);
  }
  // Update every 100 items
  if (context.progress && context.entries % 100 == 0) {
    context.progress(static_cast<int>(context.entries));
  }
}

bool FileScanner::crossesBoundary(const DiskEntry &entry,
                                  const WalkContext &context) const {
  return context.options->xdev && entry.identity.device != context.rootDevice;
}

bool FileScanner::listDirectory(const fs::path &dir,
                                std::vector<ListedEntry> &out,
                                WalkContext &context) const {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    context.errors.add(dir.string() + ": " + ec.message());
    m_log.debug("entry-error", "Cannot list " + dir.string() + ": " +
                                   ec.message());
    return false;
  }

  fs::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      context.errors.add(dir.string() + ": " + ec.message());
      m_log.debug("entry-error", "Listing of " + dir.string() +
                                     " stopped: " + ec.message());
      break;
    }

    if (cancelRequested(context.options->cancel)) {
      context.cancelled = true;
      break;
    }

    const fs::path &entryPath = it->path();
    DiskEntry entry;
    std::error_code statEc;
    if (!readDiskEntry(entryPath, entry, statEc)) {
      // Vanished or permission denied: omit the entry, keep walking
      context.errors.add(entryPath.string() + ": " + statEc.message());
      m_log.debug("entry-error", "Cannot stat " + entryPath.string() + ": " +
                                     statEc.message());
      continue;
    }

    out.push_back({entryPath.filename().string(), entry});
    countEntry(context);
  }

  std::sort(out.begin(), out.end(),
            [](const ListedEntry &a, const ListedEntry &b) {
              return a.name < b.name;
            });
  return true;
}

void FileScanner::walkDirectory(ScanTree &tree, NodeHandle node,
                                const fs::path &dir,
                                WalkContext &context) const {
  if (context.cancelled)
    return;

  std::vector<ListedEntry> entries;
  if (!listDirectory(dir, entries, context)) {
    tree.node(node).unreadable = true;
    return;
  }

  for (const auto &listed : entries) {
    NodeHandle child = tree.addChild(node, listed.name, listed.entry);

    if (!listed.entry.isDirectory())
      continue;

    if (crossesBoundary(listed.entry, context)) {
      tree.node(child).crossDevice = true;
      ++context.boundaries;
      m_log.debug("boundary-skip",
                  "Skipped different filesystem: " + (dir / listed.name).string());
      continue;
    }

    if (context.cancelled || cancelRequested(context.options->cancel)) {
      context.cancelled = true;
      continue;
    }

    walkDirectory(tree, child, dir / listed.name, context);
  }
}

void FileScanner::walkParallel(ScanTree &tree, const fs::path &root,
                               WalkContext &context) const {
  std::vector<ListedEntry> entries;
  if (!listDirectory(root, entries, context)) {
    tree.node(tree.root()).unreadable = true;
    return;
  }

  std::vector<std::size_t> descend;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].entry.isDirectory() &&
        !crossesBoundary(entries[i].entry, context)) {
      descend.push_back(i);
    }
  }

  struct Fragment {
    std::size_t index;
    ScanTree tree;
  };
  struct WorkerResult {
    std::vector<Fragment> fragments;
    WalkContext context;
  };

  const std::size_t taskCount =
      std::min<std::size_t>(context.options->workers, descend.size());

  std::vector<std::future<WorkerResult>> futures;
  futures.reserve(taskCount);
  for (std::size_t worker = 0; worker < taskCount; ++worker) {
    futures.push_back(std::async(std::launch::async, [&, worker]() {
      WorkerResult out;
      out.context.options = context.options;
      out.context.rootDevice = context.rootDevice;

      for (std::size_t k = worker; k < descend.size(); k += taskCount) {
        const ListedEntry &listed = entries[descend[k]];

        Fragment fragment{descend[k], ScanTree()};
        NodeHandle top = fragment.tree.addRoot(listed.name, listed.entry);

        if (cancelRequested(context.options->cancel)) {
          out.context.cancelled = true;
        } else {
          walkDirectory(fragment.tree, top, root / listed.name, out.context);
        }
        out.fragments.push_back(std::move(fragment));
      }
      return out;
    }));
  }

  std::vector<WorkerResult> results;
  results.reserve(futures.size());
  for (auto &future : futures) {
    results.push_back(future.get());
  }

  std::vector<const ScanTree *> fragmentFor(entries.size(), nullptr);
  for (const auto &result : results) {
    context.errors.merge(result.context.errors);
    context.boundaries += result.context.boundaries;
    context.entries += result.context.entries;
    context.cancelled = context.cancelled || result.context.cancelled;
    for (const auto &fragment : result.fragments) {
      fragmentFor[fragment.index] = &fragment.tree;
    }
  }

  // Splice in name order so the table matches a serial walk
  const NodeHandle rootNode = tree.root();
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (fragmentFor[i] != nullptr) {
      tree.graft(rootNode, *fragmentFor[i]);
      continue;
    }

    NodeHandle child = tree.addChild(rootNode, entries[i].name, entries[i].entry);
    if (entries[i].entry.isDirectory() &&
        crossesBoundary(entries[i].entry, context)) {
      tree.node(child).crossDevice = true;
      ++context.boundaries;
    }
  }
}

void FileScanner::registerEntries(ScanResult &result, unsigned workers) const {
  const NodeHandle rootNode = result.tree.root();
  if (workers <= 1) {
    result.registry.observeTree(result.tree, rootNode);
    return;
  }

  const auto &children = result.tree.node(rootNode).children;
  const std::size_t taskCount =
      std::min<std::size_t>(workers, children.size());

  std::vector<std::future<void>> futures;
  futures.reserve(taskCount);
  for (std::size_t worker = 0; worker < taskCount; ++worker) {
    futures.push_back(std::async(std::launch::async, [&, worker]() {
      for (std::size_t k = worker; k < children.size(); k += taskCount) {
        result.registry.observeTree(result.tree, children[k]);
      }
    }));
  }
  for (auto &future : futures) {
    future.get();
  }
}
