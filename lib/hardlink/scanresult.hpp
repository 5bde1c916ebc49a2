/**
 * @file scanresult.hpp
 * @brief Completed scan: browse tree, inode registry and metadata
 *
 * ScanResult is the unit handed from the scanner to the selection model and
 * the unit of persistence.
 */

#ifndef SCANRESULT_HPP
#define SCANRESULT_HPP

#include "errors.hpp"
#include "inoderegistry.hpp"
#include "scantree.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

struct ScanResult {
  /** @brief Absolute path of the scanned directory */
  std::string rootPath;

  /** @brief st_dev of the root directory */
  std::uint64_t deviceId = 0;

  bool xdev = false;

  /** @brief Aggregates use logical sizes instead of allocated blocks */
  bool apparentSize = false;

  /** @brief ISO 8601 UTC time the scan finished */
  std::string generatedAt;

  ScanTree tree;
  InodeRegistry registry;

  /** @brief Entries that could not be read (recoverable) */
  ErrorSummary errors;

  /** @brief Directories not descended because they are on another device */
  std::size_t boundariesSkipped = 0;

  /** @brief The walk was cancelled; tree and registry are partial */
  bool cancelled = false;

  /** @brief Deduplicated size of the whole tree */
  std::uint64_t totalBytes() const {
    return tree.empty() ? 0 : tree.node(tree.root()).aggregate;
  }
};

#endif // SCANRESULT_HPP
