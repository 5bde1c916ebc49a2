#include "inoderegistry.hpp"

#include <algorithm>
#include <iterator>

InodeRegistry::InodeRegistry(InodeRegistry &&other) noexcept
    : m_records(std::move(other.m_records)) {}

InodeRegistry &InodeRegistry::operator=(InodeRegistry &&other) noexcept {
  if (this != &other) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records = std::move(other.m_records);
  }
  return *this;
}

bool InodeRegistry::observe(const DiskEntry &entry, const std::string &path,
                            NodeHandle node) {
  std::lock_guard<std::mutex> lock(m_mutex);

  auto [it, inserted] = m_records.try_emplace(entry.identity);
  InodeRecord &record = it->second;

  if (inserted) {
    record.identity = entry.identity;
    record.kind = entry.kind;
    record.size = entry.size;
    record.diskUsage = entry.diskUsage;
    record.linkCount = entry.linkCount;
  }

  auto pos = std::lower_bound(record.paths.begin(), record.paths.end(), path);
  if (pos != record.paths.end() && *pos == path)
    return inserted;

  auto index = std::distance(record.paths.begin(), pos);
  record.paths.insert(pos, path);
  record.nodes.insert(record.nodes.begin() + index, node);
  return inserted;
}

void InodeRegistry::observeTree(const ScanTree &tree, NodeHandle start) {
  tree.walk(start, [&](NodeHandle handle, const std::string &path) {
    const TreeNode &node = tree.node(handle);
    if (!node.isDirectory()) {
      observe(node.entry, path, handle);
    }
  });
}

const InodeRecord *InodeRegistry::find(const FileIdentity &identity) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(identity);
  return it == m_records.end() ? nullptr : &it->second;
}

bool InodeRegistry::isOwner(const FileIdentity &identity, NodeHandle node) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(identity);
  return it != m_records.end() && it->second.owner() == node;
}

bool InodeRegistry::overrideFacts(const FileIdentity &identity,
                                  std::uint64_t size, std::uint64_t diskUsage,
                                  std::uint64_t linkCount) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(identity);
  if (it == m_records.end())
    return false;

  it->second.size = size;
  it->second.diskUsage = diskUsage;
  it->second.linkCount = linkCount;
  return true;
}

std::size_t InodeRegistry::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_records.size();
}

std::vector<const InodeRecord *> InodeRegistry::records() const {
  std::lock_guard<std::mutex> lock(m_mutex);

  std::vector<const InodeRecord *> result;
  result.reserve(m_records.size());
  for (const auto &[identity, record] : m_records) {
    result.push_back(&record);
  }
  std::sort(result.begin(), result.end(),
            [](const InodeRecord *a, const InodeRecord *b) {
              return a->identity < b->identity;
            });
  return result;
}

void InodeRegistry::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_records.clear();
}
