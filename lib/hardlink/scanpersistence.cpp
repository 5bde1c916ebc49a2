/**
 * @file scanpersistence.cpp
 * @brief yyjson based reader and writer for persisted scans
 */

#include "scanpersistence.hpp"
#include "aggregator.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <yyjson.h>

namespace {

struct MutDocDeleter {
  void operator()(yyjson_mut_doc *doc) const { yyjson_mut_doc_free(doc); }
};
struct DocDeleter {
  void operator()(yyjson_doc *doc) const { yyjson_doc_free(doc); }
};

using MutDocPtr = std::unique_ptr<yyjson_mut_doc, MutDocDeleter>;
using DocPtr = std::unique_ptr<yyjson_doc, DocDeleter>;

// ---- writing ----

yyjson_mut_val *writeNode(yyjson_mut_doc *doc, const ScanTree &tree,
                          NodeHandle handle) {
  const TreeNode &node = tree.node(handle);
  const DiskEntry &entry = node.entry;

  yyjson_mut_val *obj = yyjson_mut_obj(doc);
  yyjson_mut_obj_add_strcpy(doc, obj, "name", node.name.c_str());
  yyjson_mut_obj_add_str(doc, obj, "type", entryKindName(entry.kind));
  yyjson_mut_obj_add_uint(doc, obj, "size", entry.size);
  yyjson_mut_obj_add_uint(doc, obj, "disk_usage", entry.diskUsage);
  yyjson_mut_obj_add_uint(doc, obj, "device", entry.identity.device);
  yyjson_mut_obj_add_uint(doc, obj, "inode", entry.identity.inode);
  yyjson_mut_obj_add_uint(doc, obj, "link_count", entry.linkCount);
  yyjson_mut_obj_add_bool(doc, obj, "cross_device", node.crossDevice);
  yyjson_mut_obj_add_bool(doc, obj, "unreadable", node.unreadable);

  if (node.isDirectory()) {
    yyjson_mut_val *children = yyjson_mut_arr(doc);
    for (NodeHandle child : node.children) {
      yyjson_mut_arr_add_val(children, writeNode(doc, tree, child));
    }
    yyjson_mut_obj_add_val(doc, obj, "children", children);
  }
  return obj;
}

yyjson_mut_val *writeRegistry(yyjson_mut_doc *doc,
                              const InodeRegistry &registry) {
  yyjson_mut_val *obj = yyjson_mut_obj(doc);
  for (const InodeRecord *record : registry.records()) {
    yyjson_mut_val *item = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_uint(doc, item, "size", record->size);
    yyjson_mut_obj_add_uint(doc, item, "disk_usage", record->diskUsage);
    yyjson_mut_obj_add_uint(doc, item, "link_count", record->linkCount);

    yyjson_mut_val *paths = yyjson_mut_arr(doc);
    for (const auto &path : record->paths) {
      yyjson_mut_arr_add_strcpy(doc, paths, path.c_str());
    }
    yyjson_mut_obj_add_val(doc, item, "paths", paths);

    const std::string key = record->identity.toString();
    yyjson_mut_obj_add(obj, yyjson_mut_strcpy(doc, key.c_str()), item);
  }
  return obj;
}

// ---- reading ----

yyjson_val *require(yyjson_val *obj, const char *key, const std::string &where) {
  yyjson_val *value = yyjson_obj_get(obj, key);
  if (value == nullptr)
    throw SerializationError("Missing field '" + std::string(key) + "' in " +
                             where);
  return value;
}

std::uint64_t requireUint(yyjson_val *obj, const char *key,
                          const std::string &where) {
  yyjson_val *value = require(obj, key, where);
  if (!yyjson_is_uint(value))
    throw SerializationError("Field '" + std::string(key) + "' in " + where +
                             " is not an unsigned integer");
  return yyjson_get_uint(value);
}

bool requireBool(yyjson_val *obj, const char *key, const std::string &where) {
  yyjson_val *value = require(obj, key, where);
  if (!yyjson_is_bool(value))
    throw SerializationError("Field '" + std::string(key) + "' in " + where +
                             " is not a boolean");
  return yyjson_get_bool(value);
}

std::string requireString(yyjson_val *obj, const char *key,
                          const std::string &where) {
  yyjson_val *value = require(obj, key, where);
  if (!yyjson_is_str(value))
    throw SerializationError("Field '" + std::string(key) + "' in " + where +
                             " is not a string");
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

void readNode(yyjson_val *obj, ScanTree &tree, NodeHandle parent) {
  if (!yyjson_is_obj(obj))
    throw SerializationError("Tree node is not an object");

  const std::string name = requireString(obj, "name", "tree node");
  const std::string where = "tree node '" + name + "'";

  DiskEntry entry;
  if (!parseEntryKind(requireString(obj, "type", where), entry.kind))
    throw SerializationError("Unknown type in " + where);
  entry.size = requireUint(obj, "size", where);
  entry.diskUsage = requireUint(obj, "disk_usage", where);
  entry.identity.device = requireUint(obj, "device", where);
  entry.identity.inode = requireUint(obj, "inode", where);
  entry.linkCount = requireUint(obj, "link_count", where);

  NodeHandle handle = parent == kInvalidNode
                          ? tree.addRoot(name, entry)
                          : tree.addChild(parent, name, entry);
  tree.node(handle).crossDevice = requireBool(obj, "cross_device", where);
  tree.node(handle).unreadable = requireBool(obj, "unreadable", where);

  if (!entry.isDirectory())
    return;

  yyjson_val *children = require(obj, "children", where);
  if (!yyjson_is_arr(children))
    throw SerializationError("Field 'children' in " + where +
                             " is not an array");

  std::size_t idx, max;
  yyjson_val *child;
  yyjson_arr_foreach(children, idx, max, child) {
    readNode(child, tree, handle);
  }
}

void applyRegistry(yyjson_val *obj, InodeRegistry &registry) {
  if (!yyjson_is_obj(obj))
    throw SerializationError("Field 'inode_registry' is not an object");

  std::size_t idx, max;
  yyjson_val *key, *item;
  yyjson_obj_foreach(obj, idx, max, key, item) {
    const std::string name = yyjson_get_str(key);
    const std::string where = "registry entry '" + name + "'";

    FileIdentity identity;
    std::istringstream iss(name);
    char colon = 0;
    if (!(iss >> identity.device >> colon >> identity.inode) || colon != ':')
      throw SerializationError("Malformed identity in " + where);

    if (!yyjson_is_obj(item))
      throw SerializationError(where + " is not an object");
    yyjson_val *paths = require(item, "paths", where);
    if (!yyjson_is_arr(paths))
      throw SerializationError("Field 'paths' in " + where +
                               " is not an array");

    if (!registry.overrideFacts(identity, requireUint(item, "size", where),
                                requireUint(item, "disk_usage", where),
                                requireUint(item, "link_count", where)))
      throw SerializationError(where + " has no matching tree entry");
  }
}

} // namespace

std::string ScanPersistence::toJson(const ScanResult &scan) {
  if (scan.tree.empty())
    throw SerializationError("Cannot save an empty scan");

  MutDocPtr doc(yyjson_mut_doc_new(nullptr));
  if (!doc)
    throw SerializationError("Out of memory while writing scan");

  yyjson_mut_doc *d = doc.get();
  yyjson_mut_val *root = yyjson_mut_obj(d);
  yyjson_mut_doc_set_root(d, root);

  yyjson_mut_obj_add_int(d, root, "schema_version", kSchemaVersion);
  yyjson_mut_obj_add_strcpy(d, root, "root_path", scan.rootPath.c_str());
  yyjson_mut_obj_add_uint(d, root, "device_id", scan.deviceId);
  yyjson_mut_obj_add_bool(d, root, "xdev", scan.xdev);
  yyjson_mut_obj_add_bool(d, root, "apparent_size", scan.apparentSize);
  yyjson_mut_obj_add_strcpy(d, root, "generated_at", scan.generatedAt.c_str());
  yyjson_mut_obj_add_val(d, root, "tree",
                         writeNode(d, scan.tree, scan.tree.root()));
  yyjson_mut_obj_add_val(d, root, "inode_registry",
                         writeRegistry(d, scan.registry));

  std::size_t length = 0;
  char *json = yyjson_mut_write(
      d, YYJSON_WRITE_PRETTY | YYJSON_WRITE_ALLOW_INVALID_UNICODE, &length);
  if (json == nullptr)
    throw SerializationError("Cannot encode scan as JSON");

  std::string text(json, length);
  std::free(json);
  return text;
}

ScanResult ScanPersistence::fromJson(const std::string &json) {
  yyjson_read_err err;
  DocPtr doc(yyjson_read_opts(const_cast<char *>(json.data()), json.size(),
                              YYJSON_READ_ALLOW_INVALID_UNICODE,
                              nullptr, &err));
  if (!doc)
    throw SerializationError("Malformed JSON at byte " +
                             std::to_string(err.pos) + ": " + err.msg);

  yyjson_val *root = yyjson_doc_get_root(doc.get());
  if (!yyjson_is_obj(root))
    throw SerializationError("Scan document is not a JSON object");

  const std::string where = "scan document";
  yyjson_val *version = require(root, "schema_version", where);
  if (!yyjson_is_int(version) || yyjson_get_int(version) != kSchemaVersion)
    throw SerializationError("Unsupported schema_version (expected " +
                             std::to_string(kSchemaVersion) + ")");

  ScanResult scan;
  scan.rootPath = requireString(root, "root_path", where);
  scan.deviceId = requireUint(root, "device_id", where);
  scan.xdev = requireBool(root, "xdev", where);
  scan.apparentSize = requireBool(root, "apparent_size", where);
  scan.generatedAt = requireString(root, "generated_at", where);

  readNode(require(root, "tree", where), scan.tree, kInvalidNode);
  if (!scan.tree.node(scan.tree.root()).isDirectory())
    throw SerializationError("Tree root is not a directory");
  if (scan.tree.node(scan.tree.root()).name != scan.rootPath)
    throw SerializationError("Tree root does not match root_path");

  scan.registry.observeTree(scan.tree, scan.tree.root());
  applyRegistry(require(root, "inode_registry", where), scan.registry);

  for (std::size_t h = 0; h < scan.tree.size(); ++h) {
    if (scan.tree.node(h).crossDevice)
      ++scan.boundariesSkipped;
  }

  Aggregator::aggregate(scan);
  return scan;
}

void ScanPersistence::save(const ScanResult &scan, const std::string &file) {
  const std::string json = toJson(scan);

  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  if (!out)
    throw SerializationError("Cannot write " + file);
  out << json << '\n';
  if (!out)
    throw SerializationError("Error while writing " + file);
}

ScanResult ScanPersistence::load(const std::string &file) {
  std::ifstream in(file, std::ios::binary);
  if (!in)
    throw SerializationError("Cannot read " + file);

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad())
    throw SerializationError("Error while reading " + file);

  return fromJson(buffer.str());
}
