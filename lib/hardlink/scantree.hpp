/**
 * @file scantree.hpp
 * @brief Browse tree stored as a flat node table
 *
 * The directory hierarchy found by a scan is kept in a single vector of
 * TreeNode values addressed by NodeHandle indices. Parents are referenced by
 * handle, children are owned by the table, so the structure has no cycles
 * and serializes as plain data.
 *
 * Invariant: a child's handle is always greater than its parent's handle.
 * Iterating handles in descending order therefore visits every node after
 * all of its descendants (post-order), which the Aggregator relies on.
 */

#ifndef SCANTREE_HPP
#define SCANTREE_HPP

#include "fileidentity.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

using NodeHandle = std::size_t;

inline constexpr NodeHandle kInvalidNode =
    std::numeric_limits<NodeHandle>::max();

/**
 * @struct TreeNode
 * @brief One entry of the browse tree
 */
struct TreeNode {
  /** @brief Entry name; for the root node the full root path */
  std::string name;

  /** @brief lstat() facts of this entry */
  DiskEntry entry;

  NodeHandle parent = kInvalidNode;

  /** @brief Children ordered by name */
  std::vector<NodeHandle> children;

  /** @brief Deduplicated bytes credited to this node (memoized) */
  std::uint64_t aggregate = 0;

  /** @brief Directory on another filesystem, listed but not descended */
  bool crossDevice = false;

  /** @brief Directory that could be stat()ed but not listed */
  bool unreadable = false;

  bool isDirectory() const { return entry.isDirectory(); }
};

class ScanTree {
public:
  using Visitor = std::function<void(NodeHandle, const std::string &)>;

  bool empty() const { return m_nodes.empty(); }
  std::size_t size() const { return m_nodes.size(); }

  /** @brief Handle of the root node, kInvalidNode for an empty tree */
  NodeHandle root() const { return m_nodes.empty() ? kInvalidNode : 0; }

  /**
   * @brief Creates the root node; the tree must be empty
   * @param name Full path of the scanned directory
   */
  NodeHandle addRoot(const std::string &name, const DiskEntry &entry);

  /** @brief Appends a child at the end of parent's child list */
  NodeHandle addChild(NodeHandle parent, const std::string &name,
                      const DiskEntry &entry);

  /**
   * @brief Copies another tree below parent, remapping its handles
   *
   * The fragment's root becomes the last child of parent. Used to splice
   * subtrees scanned by worker threads into the main table.
   *
   * @return Handle of the grafted fragment root
   */
  NodeHandle graft(NodeHandle parent, const ScanTree &fragment);

  const TreeNode &node(NodeHandle handle) const { return m_nodes.at(handle); }
  TreeNode &node(NodeHandle handle) { return m_nodes.at(handle); }

  bool contains(NodeHandle handle) const { return handle < m_nodes.size(); }

  /** @brief Full path of a node, built from the root path and names */
  std::string pathOf(NodeHandle handle) const;

  /**
   * @brief Looks a node up by full path
   * @return kInvalidNode if no node has that path
   */
  NodeHandle findByPath(const std::string &path) const;

  /** @brief Depth below the root (root is 0) */
  std::size_t depthOf(NodeHandle handle) const;

  /**
   * @brief Depth-first pre-order walk of the subtree rooted at start
   *
   * The visitor receives every handle together with its full path, so a
   * caller never pays for pathOf() on each node.
   */
  void walk(NodeHandle start, const Visitor &visitor) const;

  void clear() { m_nodes.clear(); }

private:
  std::vector<TreeNode> m_nodes;
};

#endif // SCANTREE_HPP
