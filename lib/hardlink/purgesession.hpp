/**
 * @file purgesession.hpp
 * @brief Interactive purge state machine, independent of any renderer
 *
 * PurgeSession owns a completed scan and the operator's selection. A front
 * end (the FTXUI browser, or a test) feeds it intents: navigate, move the
 * cursor, mark, request a purge, confirm or cancel, quit. It renders only
 * what snapshot() returns.
 *
 * State transitions:
 * @code
 * Browsing --requestPurge()--> ConfirmingDelete --confirm()--> Deleting --> Browsing
 *                                               --cancelPurge()-----------> Browsing
 * any --quit()--> Quitting
 * @endcode
 */

#ifndef PURGESESSION_HPP
#define PURGESESSION_HPP

#include "cancellation.hpp"
#include "deleteexecutor.hpp"
#include "ilogsink.hpp"
#include "purgeengine.hpp"
#include "scanresult.hpp"
#include "selectionmodel.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class SessionState { Browsing, ConfirmingDelete, Deleting, Quitting };

const char *sessionStateName(SessionState state);

/**
 * @struct ChildRow
 * @brief One listed child of the current directory
 */
struct ChildRow {
  NodeHandle node = kInvalidNode;
  std::string name;
  EntryKind kind = EntryKind::Other;

  /** @brief Bytes the entry adds to its parent (0 for non-owner links) */
  std::uint64_t bytes = 0;

  /** @brief The entry's own size, regardless of ownership */
  std::uint64_t ownBytes = 0;

  std::uint64_t linkCount = 1;
  bool crossDevice = false;
  bool unreadable = false;

  /** @brief Marked itself */
  bool marked = false;

  /** @brief Marked itself or through an ancestor */
  bool selected = false;
};

struct ChildPage {
  NodeHandle parent = kInvalidNode;
  std::size_t total = 0;
  std::size_t offset = 0;
  std::vector<ChildRow> rows;
};

/**
 * @struct PurgePreview
 * @brief Everything the operator confirms, computed before any deletion
 */
struct PurgePreview {
  std::string searchRoot;
  std::vector<std::string> paths;
  std::size_t identityCount = 0;
  std::uint64_t estimatedBytes = 0;
  std::vector<FileIdentity> incomplete;
  std::vector<FileIdentity> missing;
  bool dryRun = false;

  /** @brief Already executed because the session assumes yes */
  bool confirmed = false;

  bool empty() const { return paths.empty(); }
};

struct SessionSnapshot {
  SessionState state = SessionState::Browsing;
  std::string currentPath;
  std::uint64_t currentBytes = 0;
  std::uint64_t totalBytes = 0;

  /** @brief Visible rows and the cursor's index among all children */
  ChildPage page;
  std::size_t cursor = 0;

  SelectionAggregate selection;
  std::string status;

  /** @brief Valid while state is ConfirmingDelete */
  PurgePreview preview;

  bool hasReport = false;
  DeleteReport lastReport;

  /** @brief A real delete ran; the scan no longer matches the disk */
  bool stale = false;
};

struct SessionOptions {
  /** @brief Purge search root, empty for the scan's mount boundary */
  std::string searchRoot;
  bool xdev = false;
  bool dryRun = false;
  unsigned workers = 1;

  /** @brief Execute every previewed plan without waiting for confirm() */
  bool assumeYes = false;

  /** @brief Rows per page of snapshot() */
  std::size_t pageSize = 20;

  const CancellationToken *cancel = nullptr;
};

class PurgeSession {
public:
  PurgeSession(ILogSink &log, ScanResult scan, const SessionOptions &options);

  /** @param remover Must outlive the session */
  PurgeSession(ILogSink &log, ScanResult scan, const SessionOptions &options,
               IPathRemover &remover);

  PurgeSession(const PurgeSession &) = delete;
  PurgeSession &operator=(const PurgeSession &) = delete;

  const ScanResult &scan() const { return m_scan; }
  const SelectionModel &selection() const { return m_selection; }
  SessionState state() const { return m_state; }

  /**
   * @brief Installs a fresh scan, typically after a real delete
   *
   * The selection is cleared. The current directory is kept if it still
   * exists in the new scan.
   */
  void replaceScan(ScanResult scan);

  /**
   * @brief Children of dir ordered by bytes descending, then name
   * @param limit 0 for all children
   */
  ChildPage childrenOf(NodeHandle dir, std::size_t offset,
                       std::size_t limit) const;

  NodeHandle current() const { return m_current; }
  std::uint64_t currentAggregate() const;

  /** @brief Node under the cursor, kInvalidNode for an empty directory */
  NodeHandle cursorNode() const;

  void moveCursor(int delta);
  void moveCursorTo(std::size_t index);
  void setPageSize(std::size_t rows);

  /** @brief Descends into the directory under the cursor */
  bool enter();

  /** @brief Returns to the parent; the cursor lands on the directory left */
  bool leave();

  /** @brief Toggles the mark under the cursor and advances the cursor */
  bool toggleMark();

  void clearMarks();

  /**
   * @brief Discovers every path of the selection and asks for confirmation
   *
   * On success the state becomes ConfirmingDelete. With assumeYes the
   * preview is logged and confirmed at once; the returned preview then has
   * confirmed set and the report is in snapshot().lastReport.
   *
   * An empty selection, an empty plan or an unreadable search root leave the
   * session browsing with a status message and an empty preview. Calls
   * outside Browsing change nothing.
   */
  PurgePreview requestPurge();

  /**
   * @brief Deletes the previewed plan (or simulates it in dry-run mode)
   *
   * The selection is cleared and the session returns to Browsing.
   */
  DeleteReport confirm();

  void cancelPurge();
  void quit();

  SessionSnapshot snapshot() const;

private:
  std::vector<NodeHandle> sortedChildren(NodeHandle dir) const;
  ChildRow makeRow(NodeHandle node) const;
  void clampCursor();

  ILogSink &m_log;
  ScanResult m_scan;
  SelectionModel m_selection;
  SessionOptions m_options;
  PurgeEngine m_engine;
  DeleteExecutor m_executor;

  SessionState m_state = SessionState::Browsing;
  NodeHandle m_current = kInvalidNode;
  std::size_t m_cursor = 0;
  std::size_t m_scroll = 0;

  PurgePlan m_plan;
  PurgePreview m_preview;
  DeleteReport m_report;
  bool m_has_report = false;
  bool m_stale = false;
  std::string m_status;
};

#endif // PURGESESSION_HPP
