/**
 * @file selectionmodel.hpp
 * @brief Operator-marked nodes and their deduplicated aggregate
 */

#ifndef SELECTIONMODEL_HPP
#define SELECTIONMODEL_HPP

#include "fileidentity.hpp"
#include "scanresult.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

/**
 * @struct SelectionAggregate
 * @brief Totals of a selection, deduplicated across the whole selection
 */
struct SelectionAggregate {
  /** @brief Distinct selected regular-file leaves */
  std::size_t fileCount = 0;

  /** @brief Distinct identities behind those leaves */
  std::size_t identityCount = 0;

  /** @brief Usage counted once per identity */
  std::uint64_t totalBytes = 0;
};

/**
 * @struct PurgeTarget
 * @brief Identity handed to the purge engine with the usage the scan saw
 */
struct PurgeTarget {
  FileIdentity identity;
  std::uint64_t diskUsage = 0;
};

/**
 * @class SelectionModel
 * @brief Tracks marked tree nodes of one ScanResult
 *
 * Marking a directory selects its whole subtree as one logical unit; the
 * subtree is expanded only when the aggregate or the targets are computed.
 * Only regular files count: symlinks and special files are never purge
 * targets.
 *
 * @note The ScanResult must outlive the model
 */
class SelectionModel {
public:
  explicit SelectionModel(const ScanResult &scan) : m_scan(scan) {}

  /** @return false if the node was already marked or is invalid */
  bool mark(NodeHandle node);

  /** @return false if the node was not marked itself */
  bool unmark(NodeHandle node);

  /** @return true if the node is marked after the call */
  bool toggle(NodeHandle node);

  void clear() { m_marked.clear(); }

  bool empty() const { return m_marked.empty(); }

  bool isMarked(NodeHandle node) const { return m_marked.count(node) > 0; }

  /** @brief true if the node or one of its ancestors is marked */
  bool isSelected(NodeHandle node) const;

  const std::set<NodeHandle> &markedNodes() const { return m_marked; }

  /**
   * @brief Totals of the selection
   *
   * An identity reachable under two separately marked subtrees counts once.
   */
  SelectionAggregate aggregate() const;

  /** @brief Distinct regular-file identities under the marked nodes, sorted */
  std::vector<FileIdentity> targetIdentities() const;

  /** @brief targetIdentities() with the registry's usage figures */
  std::vector<PurgeTarget> purgeTargets() const;

private:
  /** @brief Distinct regular-file leaves under the marked nodes */
  std::set<NodeHandle> selectedLeaves() const;

  const ScanResult &m_scan;
  std::set<NodeHandle> m_marked;
};

#endif // SELECTIONMODEL_HPP
