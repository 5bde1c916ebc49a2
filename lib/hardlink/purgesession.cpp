#include "purgesession.hpp"
#include "aggregator.hpp"
#include "utils.hpp"

#include <algorithm>

const char *sessionStateName(SessionState state) {
  switch (state) {
  case SessionState::Browsing:
    return "browsing";
  case SessionState::ConfirmingDelete:
    return "confirming-delete";
  case SessionState::Deleting:
    return "deleting";
  case SessionState::Quitting:
    return "quitting";
  }
  return "unknown";
}

PurgeSession::PurgeSession(ILogSink &log, ScanResult scan,
                           const SessionOptions &options)
    : m_log(log), m_scan(std::move(scan)), m_selection(m_scan),
      m_options(options), m_engine(log), m_executor(log) {
  m_current = m_scan.tree.root();
}

PurgeSession::PurgeSession(ILogSink &log, ScanResult scan,
                           const SessionOptions &options,
                           IPathRemover &remover)
    : m_log(log), m_scan(std::move(scan)), m_selection(m_scan),
      m_options(options), m_engine(log), m_executor(log, remover) {
  m_current = m_scan.tree.root();
}

void PurgeSession::replaceScan(ScanResult scan) {
  const std::string currentPath =
      m_scan.tree.contains(m_current) ? m_scan.tree.pathOf(m_current) : "";

  m_selection.clear();
  m_scan = std::move(scan);

  m_current = m_scan.tree.findByPath(currentPath);
  if (m_current == kInvalidNode || !m_scan.tree.node(m_current).isDirectory())
    m_current = m_scan.tree.root();

  m_cursor = 0;
  m_scroll = 0;
  m_stale = false;
  m_plan = PurgePlan();
  m_preview = PurgePreview();
  if (m_state != SessionState::Quitting)
    m_state = SessionState::Browsing;
}

std::vector<NodeHandle> PurgeSession::sortedChildren(NodeHandle dir) const {
  if (!m_scan.tree.contains(dir))
    return {};

  const ScanTree &tree = m_scan.tree;
  std::vector<std::pair<std::uint64_t, NodeHandle>> keyed;
  for (NodeHandle child : tree.node(dir).children) {
    keyed.emplace_back(Aggregator::contribution(tree, m_scan.registry, child,
                                                m_scan.apparentSize),
                       child);
  }

  std::sort(keyed.begin(), keyed.end(), [&](const auto &a, const auto &b) {
    if (a.first != b.first)
      return a.first > b.first;
    return tree.node(a.second).name < tree.node(b.second).name;
  });

  std::vector<NodeHandle> result;
  result.reserve(keyed.size());
  for (const auto &item : keyed) {
    result.push_back(item.second);
  }
  return result;
}

ChildRow PurgeSession::makeRow(NodeHandle handle) const {
  const TreeNode &node = m_scan.tree.node(handle);

  ChildRow row;
  row.node = handle;
  row.name = node.name;
  row.kind = node.entry.kind;
  row.bytes = Aggregator::contribution(m_scan.tree, m_scan.registry, handle,
                                       m_scan.apparentSize);
  row.ownBytes = node.isDirectory() ? node.aggregate
                                    : node.entry.usage(m_scan.apparentSize);
  row.linkCount = node.entry.linkCount;
  row.crossDevice = node.crossDevice;
  row.unreadable = node.unreadable;
  row.marked = m_selection.isMarked(handle);
  row.selected = m_selection.isSelected(handle);
  return row;
}

ChildPage PurgeSession::childrenOf(NodeHandle dir, std::size_t offset,
                                   std::size_t limit) const {
  ChildPage page;
  page.parent = dir;
  page.offset = offset;

  std::vector<NodeHandle> children = sortedChildren(dir);
  page.total = children.size();

  std::size_t end = limit == 0 ? children.size()
                               : std::min(children.size(), offset + limit);
  for (std::size_t i = offset; i < end; ++i) {
    page.rows.push_back(makeRow(children[i]));
  }
  return page;
}

std::uint64_t PurgeSession::currentAggregate() const {
  if (!m_scan.tree.contains(m_current))
    return 0;
  return m_scan.tree.node(m_current).aggregate;
}

NodeHandle PurgeSession::cursorNode() const {
  std::vector<NodeHandle> children = sortedChildren(m_current);
  if (m_cursor >= children.size())
    return kInvalidNode;
  return children[m_cursor];
}

void PurgeSession::clampCursor() {
  const std::size_t count =
      m_scan.tree.contains(m_current)
          ? m_scan.tree.node(m_current).children.size()
          : 0;
  if (count == 0) {
    m_cursor = 0;
  } else if (m_cursor >= count) {
    m_cursor = count - 1;
  }

  // Keep the cursor on screen
  const std::size_t rows = std::max<std::size_t>(m_options.pageSize, 1);
  if (m_cursor < m_scroll)
    m_scroll = m_cursor;
  if (m_cursor >= m_scroll + rows)
    m_scroll = m_cursor - rows + 1;
}

void PurgeSession::moveCursor(int delta) {
  if (m_state != SessionState::Browsing)
    return;
  if (delta < 0) {
    std::size_t step = static_cast<std::size_t>(-delta);
    m_cursor = step > m_cursor ? 0 : m_cursor - step;
  } else {
    m_cursor += static_cast<std::size_t>(delta);
  }
  clampCursor();
}

void PurgeSession::moveCursorTo(std::size_t index) {
  if (m_state != SessionState::Browsing)
    return;
  m_cursor = index;
  clampCursor();
}

void PurgeSession::setPageSize(std::size_t rows) {
  m_options.pageSize = std::max<std::size_t>(rows, 1);
  clampCursor();
}

bool PurgeSession::enter() {
  if (m_state != SessionState::Browsing)
    return false;

  NodeHandle target = cursorNode();
  if (target == kInvalidNode)
    return false;

  const TreeNode &node = m_scan.tree.node(target);
  if (!node.isDirectory())
    return false;
  if (node.crossDevice) {
    m_status = "Not scanned - different filesystem";
    return false;
  }

  m_current = target;
  m_cursor = 0;
  m_scroll = 0;
  m_status.clear();
  return true;
}

bool PurgeSession::leave() {
  if (m_state != SessionState::Browsing || !m_scan.tree.contains(m_current))
    return false;

  NodeHandle parent = m_scan.tree.node(m_current).parent;
  if (parent == kInvalidNode)
    return false;

  const NodeHandle left = m_current;
  m_current = parent;

  std::vector<NodeHandle> children = sortedChildren(m_current);
  auto it = std::find(children.begin(), children.end(), left);
  m_cursor = it == children.end()
                 ? 0
                 : static_cast<std::size_t>(it - children.begin());
  m_scroll = 0;
  clampCursor();
  m_status.clear();
  return true;
}

bool PurgeSession::toggleMark() {
  if (m_state != SessionState::Browsing)
    return false;

  NodeHandle target = cursorNode();
  if (target == kInvalidNode)
    return false;

  m_selection.toggle(target);
  moveCursor(1);
  return true;
}

void PurgeSession::clearMarks() {
  if (m_state == SessionState::Browsing)
    m_selection.clear();
}

PurgePreview PurgeSession::requestPurge() {
  if (m_state != SessionState::Browsing)
    return PurgePreview();

  m_preview = PurgePreview();

  if (m_selection.empty()) {
    m_status = "Nothing marked";
    return m_preview;
  }

  std::vector<PurgeTarget> targets = m_selection.purgeTargets();
  if (targets.empty()) {
    m_status = "Selection holds no regular files";
    return m_preview;
  }

  PurgeOptions options;
  options.xdev = m_options.xdev;
  options.workers = m_options.workers;
  options.cancel = m_options.cancel;

  try {
    options.searchRoot = m_options.searchRoot.empty()
                             ? PurgeEngine::defaultSearchRoot(m_scan)
                             : m_options.searchRoot;
    m_plan = m_engine.discover(targets, options);
  } catch (const PathError &e) {
    m_log.error("purge-error", e.what());
    m_status = e.what();
    return m_preview;
  }

  m_preview.searchRoot = m_plan.searchRoot;
  m_preview.paths = m_plan.allPaths();
  m_preview.identityCount = m_plan.inodes.size();
  m_preview.estimatedBytes = m_plan.estimatedBytes();
  m_preview.incomplete = m_plan.incomplete();
  m_preview.missing = m_plan.missing;
  m_preview.dryRun = m_options.dryRun;

  if (m_plan.cancelled) {
    m_status = "Purge search cancelled";
    m_preview = PurgePreview();
    return m_preview;
  }
  if (m_preview.empty()) {
    m_status = "No paths found to delete within " + m_plan.searchRoot;
    return m_preview;
  }

  m_state = SessionState::ConfirmingDelete;
  m_status = "Delete " + std::to_string(m_preview.paths.size()) +
             " paths, est. freed " + formatBytes(m_preview.estimatedBytes) +
             "?";

  if (m_options.assumeYes) {
    for (const auto &path : m_preview.paths)
      m_log.info("purge-preview", "Will delete " + path);
    PurgePreview preview = m_preview;
    preview.confirmed = true;
    confirm();
    return preview;
  }
  return m_preview;
}

DeleteReport PurgeSession::confirm() {
  if (m_state != SessionState::ConfirmingDelete)
    return DeleteReport();

  m_state = SessionState::Deleting;

  DeleteOptions options;
  options.dryRun = m_options.dryRun;
  options.confirmed = true;
  options.cancel = m_options.cancel;

  m_report = m_executor.execute(m_plan, options);
  m_has_report = true;

  if (!m_report.dryRun && m_report.deletedPaths > 0)
    m_stale = true;

  m_selection.clear();
  m_plan = PurgePlan();
  m_preview = PurgePreview();
  m_state = SessionState::Browsing;

  if (m_report.dryRun) {
    m_status = "Dry run: " + std::to_string(m_report.plannedPaths) +
               " paths, est. freed " + formatBytes(m_report.freedBytes);
  } else {
    m_status = "Deleted " + std::to_string(m_report.deletedPaths) + " of " +
               std::to_string(m_report.plannedPaths) + " paths, freed " +
               formatBytes(m_report.freedBytes);
    if (m_report.failedPaths > 0)
      m_status += ", " + std::to_string(m_report.failedPaths) + " failed";
  }
  return m_report;
}

void PurgeSession::cancelPurge() {
  if (m_state != SessionState::ConfirmingDelete)
    return;
  m_plan = PurgePlan();
  m_preview = PurgePreview();
  m_state = SessionState::Browsing;
  m_status = "Purge cancelled";
}

void PurgeSession::quit() { m_state = SessionState::Quitting; }

SessionSnapshot PurgeSession::snapshot() const {
  SessionSnapshot snap;
  snap.state = m_state;
  if (m_scan.tree.contains(m_current))
    snap.currentPath = m_scan.tree.pathOf(m_current);
  snap.currentBytes = currentAggregate();
  snap.totalBytes = m_scan.totalBytes();
  snap.page = childrenOf(m_current, m_scroll, m_options.pageSize);
  snap.cursor = m_cursor;
  snap.selection = m_selection.aggregate();
  snap.status = m_status;
  snap.preview = m_preview;
  snap.hasReport = m_has_report;
  snap.lastReport = m_report;
  snap.stale = m_stale;
  return snap;
}
