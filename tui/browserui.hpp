/**
 * @file browserui.hpp
 * @brief Terminal browser for selecting what to purge
 *
 * BrowserUI is a thin FTXUI front end over PurgeSession: it renders
 * SessionSnapshot values and turns key presses into session intents. Long
 * operations (scanning, the purge search, deleting) run in a background
 * thread with a spinner, the UI stays responsive and can cancel them.
 */

#ifndef BROWSERUI_HPP
#define BROWSERUI_HPP

#include "cancellation.hpp"
#include "ilogsink.hpp"
#include "purgesession.hpp"
#include "scanresult.hpp"
#include "uicontrol.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ftxui;

/**
 * @struct BrowserContext
 * @brief Collaborators the browser calls back into
 */
struct BrowserContext {
  /**
   * @brief Produces the first scan (walk or load), on a background thread
   *
   * May throw PathError or SerializationError; the browser then exits and
   * reports the error through outcome().
   */
  std::function<ScanResult(std::atomic<int> &progress)> initialScan;

  /** @brief Walks the directory again after a real delete */
  std::function<ScanResult(std::atomic<int> &progress)> rescan;

  /** @brief Called on the UI thread for every installed scan */
  std::function<void(const ScanResult &)> onScanned;

  SessionOptions session;

  /** @brief Tripped by the browser to stop a running operation */
  CancellationToken *cancel = nullptr;
};

/**
 * @struct BrowserOutcome
 * @brief What happened while the browser ran, for the exit code
 */
struct BrowserOutcome {
  std::size_t deletedPaths = 0;
  std::size_t failedPaths = 0;
  std::uint64_t freedBytes = 0;

  /** @brief An operation was cancelled and the browser closed */
  bool interrupted = false;

  /** @brief The first scan failed; error holds the reason */
  bool scanFailed = false;
  std::string error;
};

/**
 * @class BrowserUI
 * @brief ncdu-like browser over a PurgeSession
 *
 * Layout:
 * - Top menu with the actions of ActionMap
 * - Directory panel: current path, totals, one row per child
 * - Confirmation overlay listing every path found by the purge search
 * - Status bar
 *
 * Example usage:
 * @code
 * BrowserUI ui(log, context);
 * ui.initialize();
 * ui.run();
 * BrowserOutcome outcome = ui.outcome();
 * @endcode
 */
class BrowserUI {
private:
  ILogSink &m_log;
  BrowserContext m_context;
  std::unique_ptr<PurgeSession> m_session;

  // ===== UI Components =====
  Component m_top_menu;
  Component m_main_view;
  Component m_document;
  std::vector<std::string> m_menu_entries;
  int m_top_menu_selected = 0;

  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();
  std::string m_current_status = "Ready.";

  // ===== Background Operations =====
  std::future<void> m_task;
  std::atomic<bool> m_busy{false};
  std::atomic<int> m_progress{0};
  std::string m_busy_message;

  BrowserOutcome m_outcome;

  // ===== Animation Thread =====
  std::thread m_animation_thread;
  std::atomic<bool> m_animating{false};

  /** @brief Rows of the confirmation list scrolled past */
  int m_preview_scroll = 0;

  /**
   * @brief Runs work on a background thread with the spinner shown
   *
   * done is posted back to the UI thread when work returns or throws.
   */
  void runAsync(const std::string &message, std::function<void()> work,
                std::function<void(std::exception_ptr)> done);

  void loadScanAsync(bool initial);
  void installScan(ScanResult scan);
  void requestPurgeAsync();
  void confirmPurgeAsync();
  /** @brief Adds a finished delete to the outcome, then rescans if stale */
  void applyReport(const DeleteReport &report);

  void setupTopMenu();
  void setupBrowserPanel();
  void setupMainLayout();

  Element renderBusy();
  Element renderBrowser(const SessionSnapshot &snap);
  Element renderRow(const ChildRow &row, bool focused);
  Element renderConfirmation(const SessionSnapshot &snap);

  bool handleBrowseEvent(Event event);
  bool handleConfirmEvent(Event event);
  bool handleAction(ActionID action);
  ActionID getActionIdByIndex(int index);

  void quit();

  void startAnimation();
  void stopAnimation();

public:
  BrowserUI(ILogSink &log, BrowserContext context)
      : m_log(log), m_context(std::move(context)) {}
  ~BrowserUI();

  BrowserUI(const BrowserUI &) = delete;
  BrowserUI &operator=(const BrowserUI &) = delete;

  /** @brief Builds the components and starts the first scan */
  void initialize();

  /** @brief Blocks until the operator quits */
  void run();

  const BrowserOutcome &outcome() const { return m_outcome; }
};

#endif // BROWSERUI_HPP
