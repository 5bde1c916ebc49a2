#include "selectionmodel.hpp"

bool SelectionModel::mark(NodeHandle node) {
  if (!m_scan.tree.contains(node))
    return false;
  return m_marked.insert(node).second;
}

bool SelectionModel::unmark(NodeHandle node) { return m_marked.erase(node) > 0; }

bool SelectionModel::toggle(NodeHandle node) {
  if (unmark(node))
    return false;
  return mark(node);
}

bool SelectionModel::isSelected(NodeHandle node) const {
  if (!m_scan.tree.contains(node))
    return false;
  for (NodeHandle h = node; h != kInvalidNode; h = m_scan.tree.node(h).parent) {
    if (m_marked.count(h) > 0)
      return true;
  }
  return false;
}

std::set<NodeHandle> SelectionModel::selectedLeaves() const {
  std::set<NodeHandle> leaves;
  const ScanTree &tree = m_scan.tree;

  for (NodeHandle marked : m_marked) {
    // Nested marks would only revisit the same nodes
    std::vector<NodeHandle> stack{marked};
    while (!stack.empty()) {
      NodeHandle handle = stack.back();
      stack.pop_back();

      const TreeNode &node = tree.node(handle);
      if (node.entry.isRegularFile()) {
        leaves.insert(handle);
      }
      for (NodeHandle child : node.children) {
        stack.push_back(child);
      }
    }
  }
  return leaves;
}

SelectionAggregate SelectionModel::aggregate() const {
  SelectionAggregate result;
  std::set<FileIdentity> seen;

  for (NodeHandle leaf : selectedLeaves()) {
    ++result.fileCount;

    const FileIdentity &identity = m_scan.tree.node(leaf).entry.identity;
    if (!seen.insert(identity).second)
      continue;

    const InodeRecord *record = m_scan.registry.find(identity);
    if (record != nullptr) {
      result.totalBytes += record->usage(m_scan.apparentSize);
    }
  }
  result.identityCount = seen.size();
  return result;
}

std::vector<FileIdentity> SelectionModel::targetIdentities() const {
  std::set<FileIdentity> identities;
  for (NodeHandle leaf : selectedLeaves()) {
    identities.insert(m_scan.tree.node(leaf).entry.identity);
  }
  return {identities.begin(), identities.end()};
}

std::vector<PurgeTarget> SelectionModel::purgeTargets() const {
  std::vector<PurgeTarget> targets;
  for (const auto &identity : targetIdentities()) {
    PurgeTarget target;
    target.identity = identity;
    if (const InodeRecord *record = m_scan.registry.find(identity)) {
      target.diskUsage = record->diskUsage;
    }
    targets.push_back(target);
  }
  return targets;
}
