/**
 * @file scanpersistence.hpp
 * @brief JSON persistence of completed scans
 */

#ifndef SCANPERSISTENCE_HPP
#define SCANPERSISTENCE_HPP

#include "errors.hpp"
#include "scanresult.hpp"

#include <string>

/**
 * @brief Saves and restores ScanResults as JSON documents
 *
 * Document layout (schema_version 1):
 * @code
 * { "schema_version": 1, "root_path": "...", "device_id": N, "xdev": false,
 *   "apparent_size": false, "generated_at": "2024-01-01T00:00:00Z",
 *   "tree": { "name": "...", "type": "dir", "size": N, "disk_usage": N,
 *             "device": N, "inode": N, "link_count": N,
 *             "cross_device": false, "unreadable": false,
 *             "children": [ ... ] },
 *   "inode_registry": { "<dev>:<ino>": { "size": N, "disk_usage": N,
 *                                        "link_count": N, "paths": [ ... ] } } }
 * @endcode
 *
 * Loading never touches the scanned filesystem: the registry is rebuilt
 * from the tree, its captured facts are taken from the saved registry and
 * aggregates are recomputed, which reproduces the saved totals.
 *
 * All failures throw SerializationError.
 */
class ScanPersistence {
public:
  static constexpr int kSchemaVersion = 1;

  static void save(const ScanResult &scan, const std::string &file);
  static ScanResult load(const std::string &file);

  static std::string toJson(const ScanResult &scan);
  static ScanResult fromJson(const std::string &json);
};

#endif // SCANPERSISTENCE_HPP
