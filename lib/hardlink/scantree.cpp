#include "scantree.hpp"

#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

NodeHandle ScanTree::addRoot(const std::string &name, const DiskEntry &entry) {
  if (!m_nodes.empty())
    throw std::logic_error("ScanTree already has a root");

  TreeNode root;
  root.name = name;
  root.entry = entry;
  m_nodes.push_back(std::move(root));
  return 0;
}

NodeHandle ScanTree::addChild(NodeHandle parent, const std::string &name,
                              const DiskEntry &entry) {
  if (!contains(parent))
    throw std::out_of_range("invalid parent handle");

  TreeNode child;
  child.name = name;
  child.entry = entry;
  child.parent = parent;

  NodeHandle handle = m_nodes.size();
  m_nodes.push_back(std::move(child));
  m_nodes[parent].children.push_back(handle);
  return handle;
}

NodeHandle ScanTree::graft(NodeHandle parent, const ScanTree &fragment) {
  if (!contains(parent))
    throw std::out_of_range("invalid parent handle");
  if (fragment.empty())
    return kInvalidNode;

  const NodeHandle offset = m_nodes.size();
  m_nodes.reserve(m_nodes.size() + fragment.size());

  for (const auto &source : fragment.m_nodes) {
    TreeNode copy = source;
    copy.parent = (source.parent == kInvalidNode) ? parent
                                                  : source.parent + offset;
    for (auto &child : copy.children) {
      child += offset;
    }
    m_nodes.push_back(std::move(copy));
  }

  m_nodes[parent].children.push_back(offset);
  return offset;
}

std::string ScanTree::pathOf(NodeHandle handle) const {
  std::vector<NodeHandle> chain;
  for (NodeHandle h = handle; h != kInvalidNode; h = m_nodes.at(h).parent) {
    chain.push_back(h);
  }

  fs::path path;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    if (path.empty()) {
      path = m_nodes[*it].name;
    } else {
      path /= m_nodes[*it].name;
    }
  }
  return path.string();
}

NodeHandle ScanTree::findByPath(const std::string &path) const {
  if (m_nodes.empty())
    return kInvalidNode;

  const fs::path wanted = fs::path(path).lexically_normal();
  const fs::path rootPath = fs::path(m_nodes[0].name).lexically_normal();

  if (wanted == rootPath)
    return 0;

  const fs::path relative = wanted.lexically_relative(rootPath);
  if (relative.empty() || *relative.begin() == "..")
    return kInvalidNode;

  NodeHandle current = 0;
  for (const auto &part : relative) {
    if (part.empty() || part == ".")
      continue;

    NodeHandle next = kInvalidNode;
    for (NodeHandle child : m_nodes[current].children) {
      if (m_nodes[child].name == part.string()) {
        next = child;
        break;
      }
    }
    if (next == kInvalidNode)
      return kInvalidNode;
    current = next;
  }
  return current;
}

std::size_t ScanTree::depthOf(NodeHandle handle) const {
  std::size_t depth = 0;
  for (NodeHandle h = m_nodes.at(handle).parent; h != kInvalidNode;
       h = m_nodes[h].parent) {
    ++depth;
  }
  return depth;
}

void ScanTree::walk(NodeHandle start, const Visitor &visitor) const {
  if (!contains(start))
    return;

  std::vector<std::pair<NodeHandle, std::string>> stack;
  stack.emplace_back(start, pathOf(start));

  while (!stack.empty()) {
    auto [handle, path] = std::move(stack.back());
    stack.pop_back();

    visitor(handle, path);

    const auto &children = m_nodes[handle].children;
    // Reverse push keeps name order on pop
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.emplace_back(*it, (fs::path(path) / m_nodes[*it].name).string());
    }
  }
}
