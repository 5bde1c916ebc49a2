/**
 * @file inoderegistry.hpp
 * @brief Registry of distinct on-disk identities seen during a scan
 *
 * The InodeRegistry records each FileIdentity the first time a path to it is
 * observed and keeps every path the scan saw for it. It also decides which
 * browse-tree leaf "owns" the identity's bytes: the one with the
 * lexicographically smallest full path. Because the owner is elected by path
 * and not by arrival order, aggregate totals do not depend on the order in
 * which directories were listed or in which worker threads reported.
 *
 * observe() is atomic (mutex protected) so parallel walks can report into
 * one registry.
 */

#ifndef INODEREGISTRY_HPP
#define INODEREGISTRY_HPP

#include "fileidentity.hpp"
#include "scantree.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @struct InodeRecord
 * @brief Everything the scan learned about one FileIdentity
 *
 * size, diskUsage and linkCount are captured once, from the first
 * observation. paths and nodes are parallel vectors kept sorted by path, so
 * nodes.front() is the owning leaf.
 */
struct InodeRecord {
  FileIdentity identity;
  EntryKind kind = EntryKind::File;
  std::uint64_t size = 0;
  std::uint64_t diskUsage = 0;
  std::uint64_t linkCount = 1;

  std::vector<std::string> paths;
  std::vector<NodeHandle> nodes;

  NodeHandle owner() const { return nodes.empty() ? kInvalidNode : nodes.front(); }

  /** @brief true if every link the filesystem reports was seen by the scan */
  bool allLinksSeen() const { return paths.size() >= linkCount; }

  std::uint64_t usage(bool apparent) const { return apparent ? size : diskUsage; }
};

class InodeRegistry {
public:
  InodeRegistry() = default;
  InodeRegistry(const InodeRegistry &) = delete;
  InodeRegistry &operator=(const InodeRegistry &) = delete;

  /** @note The source must not be in use by other threads */
  InodeRegistry(InodeRegistry &&other) noexcept;
  InodeRegistry &operator=(InodeRegistry &&other) noexcept;

  /**
   * @brief Records one path of an identity
   *
   * Creates the record the first time the identity is seen, appends the
   * path otherwise, and re-elects the owner. Observing the same path twice
   * is a no-op.
   *
   * @return true if this call created the record (first sighting)
   */
  bool observe(const DiskEntry &entry, const std::string &path, NodeHandle node);

  /**
   * @brief Observes every non-directory node of a subtree
   *
   * Directories never become registry records: their own blocks are not
   * part of any aggregate.
   */
  void observeTree(const ScanTree &tree, NodeHandle start);

  /** @return nullptr if the identity was never observed */
  const InodeRecord *find(const FileIdentity &identity) const;

  /** @brief true if node is the elected owner of identity */
  bool isOwner(const FileIdentity &identity, NodeHandle node) const;

  /**
   * @brief Replaces the captured facts of an existing record
   * @return false if the identity is unknown
   */
  bool overrideFacts(const FileIdentity &identity, std::uint64_t size,
                     std::uint64_t diskUsage, std::uint64_t linkCount);

  std::size_t size() const;
  bool empty() const { return size() == 0; }

  /** @brief Snapshot of all records ordered by identity */
  std::vector<const InodeRecord *> records() const;

  void clear();

private:
  mutable std::mutex m_mutex;
  std::unordered_map<FileIdentity, InodeRecord, FileIdentityHash> m_records;
};

#endif // INODEREGISTRY_HPP
