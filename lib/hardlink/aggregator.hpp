#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include "inoderegistry.hpp"
#include "scanresult.hpp"
#include "scantree.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Service computing deduplicated sizes from registry truth
 *
 * A directory's aggregate is the sum over its children of:
 * - non-directory: its usage if it owns its identity, otherwise 0
 * - directory: its already computed aggregate
 *
 * Directory entries' own blocks are not counted, so the root aggregate is
 * exactly the sum of distinct identity usages reachable from it.
 *
 * Example usage:
 * @code
 * Aggregator::aggregate(scan.tree, scan.registry, scan.apparentSize);
 * auto top = Aggregator::largestDirectories(scan, 2, 10);
 * @endcode
 */
class Aggregator {
public:
  struct DirectoryUsage {
    std::string path;
    std::size_t depth = 0;
    std::uint64_t bytes = 0;
  };

  /**
   * @brief Recomputes every node's aggregate bottom-up
   * @param apparent Use logical sizes instead of allocated blocks
   */
  static void aggregate(ScanTree &tree, const InodeRegistry &registry,
                        bool apparent);

  /** @brief Convenience overload using the scan's own registry and mode */
  static void aggregate(ScanResult &scan) {
    aggregate(scan.tree, scan.registry, scan.apparentSize);
  }

  /**
   * @brief Bytes a single node adds to its parent
   *
   * For directories this is the memoized aggregate, so aggregate() must have
   * run first.
   */
  static std::uint64_t contribution(const ScanTree &tree,
                                    const InodeRegistry &registry,
                                    NodeHandle handle, bool apparent);

  /**
   * @brief Directories up to depth levels below the root, largest first
   *
   * Ties are ordered by path. depth 0 returns only the root.
   *
   * @param limit Maximum number of entries, 0 for no limit
   */
  static std::vector<DirectoryUsage> largestDirectories(const ScanResult &scan,
                                                        std::size_t depth,
                                                        std::size_t limit);
};

#endif // AGGREGATOR_HPP
