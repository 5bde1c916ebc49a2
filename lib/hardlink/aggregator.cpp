#include "aggregator.hpp"

#include <algorithm>

std::uint64_t Aggregator::contribution(const ScanTree &tree,
                                       const InodeRegistry &registry,
                                       NodeHandle handle, bool apparent) {
  const TreeNode &node = tree.node(handle);
  if (node.isDirectory())
    return node.aggregate;

  const InodeRecord *record = registry.find(node.entry.identity);
  if (record == nullptr || record->owner() != handle)
    return 0;
  return record->usage(apparent);
}

void Aggregator::aggregate(ScanTree &tree, const InodeRegistry &registry,
                           bool apparent) {
  if (tree.empty())
    return;

  // Children always have larger handles than their parent
  for (NodeHandle handle = tree.size(); handle-- > 0;) {
    TreeNode &node = tree.node(handle);

    if (!node.isDirectory()) {
      node.aggregate = contribution(tree, registry, handle, apparent);
      continue;
    }

    std::uint64_t total = 0;
    for (NodeHandle child : node.children) {
      total += tree.node(child).aggregate;
    }
    node.aggregate = total;
  }
}

std::vector<Aggregator::DirectoryUsage>
Aggregator::largestDirectories(const ScanResult &scan, std::size_t depth,
                               std::size_t limit) {
  std::vector<DirectoryUsage> result;
  if (scan.tree.empty())
    return result;

  scan.tree.walk(scan.tree.root(), [&](NodeHandle handle,
                                       const std::string &path) {
    const TreeNode &node = scan.tree.node(handle);
    if (!node.isDirectory())
      return;

    std::size_t nodeDepth = scan.tree.depthOf(handle);
    if (nodeDepth > depth)
      return;

    result.push_back({path, nodeDepth, node.aggregate});
  });

  std::sort(result.begin(), result.end(),
            [](const DirectoryUsage &a, const DirectoryUsage &b) {
              if (a.bytes != b.bytes)
                return a.bytes > b.bytes;
              return a.path < b.path;
            });

  if (limit > 0 && result.size() > limit)
    result.resize(limit);

  return result;
}
