/**
 * @file browserui.cpp
 * @brief Implementation of the BrowserUI class
 *
 * Key implementation areas:
 * - Background scan, purge search and delete with spinner feedback
 * - Rendering of session snapshots (directory panel, confirmation overlay)
 * - Keyboard handling and action dispatch
 * - Animation thread management
 *
 * @see BrowserUI
 * @see PurgeSession
 */

#include "browserui.hpp"
#include "utils.hpp"

#include <ftxui/screen/terminal.hpp>

#include <algorithm>
#include <chrono>

BrowserUI::~BrowserUI() {
  if (m_context.cancel && m_busy) {
    m_context.cancel->cancel();
  }
  stopAnimation();

  // Wait for background task to complete
  if (m_task.valid()) {
    m_task.wait();
  }
}

// ============================================================================
// BACKGROUND OPERATIONS
// ============================================================================

/**
 * @brief Runs an operation in a background thread
 *
 * Implementation flow:
 * 1. Waits for any previous operation to complete
 * 2. Sets the busy flag and starts the spinner
 * 3. Launches work with std::async
 * 4. Posts completion back to the UI thread via m_screen.Post(), handing
 *    over any exception thrown by work
 *
 * While busy the session is never touched from the UI thread.
 */
void BrowserUI::runAsync(const std::string &message, std::function<void()> work,
                         std::function<void(std::exception_ptr)> done) {
  if (m_task.valid()) {
    m_task.wait();
  }

  m_busy = true;
  m_progress = 0;
  m_busy_message = message;
  if (m_context.cancel) {
    m_context.cancel->reset();
  }

  startAnimation();

  m_task = std::async(std::launch::async, [this, work, done]() {
    std::exception_ptr error;
    try {
      work();
    } catch (...) {
      error = std::current_exception();
    }

    m_screen.Post([this, done, error]() {
      m_busy = false;
      stopAnimation();
      done(error);
    });
  });
}

void BrowserUI::loadScanAsync(bool initial) {
  auto producer = initial ? m_context.initialScan : m_context.rescan;
  if (!producer) {
    m_current_status = "Rescan not available";
    return;
  }

  auto result = std::make_shared<ScanResult>();
  runAsync(
      initial ? "Scanning directory..." : "Rescanning directory...",
      [this, producer, result]() { *result = producer(m_progress); },
      [this, initial, result](std::exception_ptr error) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception &e) {
            m_log.error("scan-error", e.what());
            if (initial) {
              m_outcome.scanFailed = true;
              m_outcome.error = e.what();
              quit();
            } else {
              m_current_status = std::string("Rescan failed: ") + e.what();
            }
          }
          return;
        }

        if (result->cancelled) {
          m_outcome.interrupted = true;
          quit();
          return;
        }
        installScan(std::move(*result));
      });
}

void BrowserUI::installScan(ScanResult scan) {
  if (m_context.onScanned) {
    m_context.onScanned(scan);
  }

  std::string summary = "Scanned " + scan.rootPath + ": " +
                        std::to_string(scan.tree.size()) + " entries, " +
                        formatBytes(scan.totalBytes());
  if (!scan.errors.empty()) {
    summary += " (" + std::to_string(scan.errors.count) + " unreadable)";
  }

  if (m_session) {
    m_session->replaceScan(std::move(scan));
  } else {
    m_session = std::make_unique<PurgeSession>(m_log, std::move(scan),
                                               m_context.session);
  }
  m_current_status = summary;
}

void BrowserUI::requestPurgeAsync() {
  if (m_session->selection().empty()) {
    m_current_status = "Nothing marked";
    return;
  }

  auto preview = std::make_shared<PurgePreview>();
  runAsync(
      "Searching the filesystem for all hardlinks...",
      [this, preview]() { *preview = m_session->requestPurge(); },
      [this, preview](std::exception_ptr error) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception &e) {
            m_log.error("purge-error", e.what());
            m_current_status = std::string("Purge search failed: ") + e.what();
          }
          return;
        }
        m_preview_scroll = 0;
        if (preview->confirmed) {
          applyReport(m_session->snapshot().lastReport);
          return;
        }
        m_current_status = m_session->snapshot().status;
      });
}

void BrowserUI::confirmPurgeAsync() {
  auto report = std::make_shared<DeleteReport>();
  runAsync(
      m_context.session.dryRun ? "Simulating deletion..." : "Deleting...",
      [this, report]() { *report = m_session->confirm(); },
      [this, report](std::exception_ptr error) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception &e) {
            m_log.error("delete-error", e.what());
            m_current_status = std::string("Delete failed: ") + e.what();
          }
          return;
        }
        applyReport(*report);
      });
}

void BrowserUI::applyReport(const DeleteReport &report) {
  m_outcome.deletedPaths += report.deletedPaths;
  m_outcome.failedPaths += report.failedPaths;
  m_outcome.freedBytes += report.freedBytes;
  m_current_status = m_session->snapshot().status;

  if (report.cancelled) {
    m_outcome.interrupted = true;
    quit();
    return;
  }
  if (m_session->snapshot().stale) {
    loadScanAsync(false);
  }
}

// ============================================================================
// UI SETUP
// ============================================================================

/**
 * @brief Builds the components and starts the initial scan
 *
 * Must be called before run().
 */
void BrowserUI::initialize() {
  setupTopMenu();
  setupBrowserPanel();
  setupMainLayout();

  loadScanAsync(true);
}

void BrowserUI::setupTopMenu() {
  m_menu_entries = ::getMenuEntries(); // from uicontrol.hpp
  m_top_menu =
      Menu(&m_menu_entries, &m_top_menu_selected, MenuOption::Horizontal());
  m_top_menu = m_top_menu | CatchEvent([this](Event event) {
                 if (event == Event::Return) {
                   return handleAction(getActionIdByIndex(m_top_menu_selected));
                 }
                 return false;
               });
}

/**
 * @brief Creates the directory panel
 *
 * The panel renders the current snapshot; its event handler forwards
 * navigation keys to the session. ArrowUp on the first row is left
 * unhandled so focus can move to the top menu.
 */
void BrowserUI::setupBrowserPanel() {
  m_main_view = Renderer([this](bool) {
    if (m_busy) {
      return renderBusy();
    }
    if (!m_session) {
      return text(m_current_status) | center | border;
    }

    int terminal_height = Terminal::Size().dimy;
    int available_height = std::max(5, terminal_height - 11);
    m_session->setPageSize(static_cast<std::size_t>(available_height));

    SessionSnapshot snap = m_session->snapshot();
    Element browser = renderBrowser(snap);
    if (snap.state == SessionState::ConfirmingDelete) {
      return dbox({browser, renderConfirmation(snap) | clear_under | center});
    }
    return browser;
  });

  m_main_view = m_main_view | CatchEvent([this](Event event) {
                  if (m_busy || !m_session) {
                    return false;
                  }
                  if (m_session->state() == SessionState::ConfirmingDelete) {
                    return handleConfirmEvent(event);
                  }
                  return handleBrowseEvent(event);
                });
}

void BrowserUI::setupMainLayout() {
  auto container = Container::Vertical({m_top_menu, m_main_view});
  container->SetActiveChild(m_main_view);

  m_document = Renderer(container, [this] {
    return vbox({m_top_menu->Render(), separator(), m_main_view->Render() | flex,
                 text("STATUS: " + m_current_status) | color(Color::GrayLight) |
                     hcenter});
  });
}

// ============================================================================
// RENDERING
// ============================================================================

Element BrowserUI::renderBusy() {
  static const std::vector<std::string> spinner = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                                   "⠴", "⠦", "⠧", "⠇", "⠏"};
  static size_t frame = 0;
  frame = (frame + 1) % spinner.size();

  std::vector<Element> content = {
      text("") | flex,
      hbox({text(spinner[frame]) | color(Color::Cyan) | bold |
                size(WIDTH, EQUAL, 2),
            text(m_busy_message) | color(Color::GrayLight)}) |
          center,
      text("") | size(HEIGHT, EQUAL, 1)};
  if (m_progress.load() > 0) {
    content.push_back(text("Entries found: " +
                           std::to_string(m_progress.load())) |
                      color(Color::Yellow) | center);
  }
  content.push_back(text("(q) cancel") | dim | center);
  content.push_back(text("") | flex);
  return vbox(content) | flex | border;
}

Element BrowserUI::renderRow(const ChildRow &row, bool focused) {
  std::string mark = row.marked ? "[X]" : (row.selected ? "[x]" : "[ ]");
  bool is_dir = row.kind == EntryKind::Directory;

  std::string note;
  if (row.crossDevice) {
    note = "not scanned - different filesystem";
  } else if (row.unreadable) {
    note = "unreadable";
  } else if (row.kind == EntryKind::Symlink) {
    note = "symlink";
  } else if (row.kind == EntryKind::File && row.linkCount > 1) {
    note = std::to_string(row.linkCount) + " links";
    if (row.bytes == 0 && row.ownBytes > 0) {
      note += ", counted elsewhere";
    }
  }

  auto name_element = text((is_dir ? "/" : " ") + row.name);
  if (is_dir) {
    name_element = name_element | color(Color::Cyan);
  }

  auto line = hbox({text(mark + " "),
                    text(formatBytes(row.bytes)) | size(WIDTH, EQUAL, 12) |
                        align_right | color(Color::GrayLight),
                    text(" "), name_element, filler(), text(note) | dim});
  if (row.selected) {
    line = line | color(Color::Green);
  }
  if (focused) {
    line = line | inverted | bold | focus;
  }
  return line;
}

Element BrowserUI::renderBrowser(const SessionSnapshot &snap) {
  std::string path_display = snap.currentPath;
  if (snap.page.total > snap.page.rows.size()) {
    path_display += " [" + std::to_string(snap.cursor + 1) + "/" +
                    std::to_string(snap.page.total) + "]";
  }

  std::string totals = "Here: " + formatBytes(snap.currentBytes) +
                       "   Total: " + formatBytes(snap.totalBytes);
  if (snap.stale) {
    totals += "   (outdated, press r)";
  }

  std::string selected =
      "Selected: " + std::to_string(snap.selection.fileCount) + " files, " +
      std::to_string(snap.selection.identityCount) + " inodes, " +
      formatBytes(snap.selection.totalBytes);

  std::vector<Element> rows;
  for (std::size_t i = 0; i < snap.page.rows.size(); ++i) {
    bool focused = snap.page.offset + i == snap.cursor;
    rows.push_back(renderRow(snap.page.rows[i], focused));
  }
  if (rows.empty()) {
    rows.push_back(text("(empty)") | dim);
  }

  return vbox({text(path_display) | bold | color(Color::Green),
               text(totals) | color(Color::GrayLight),
               text(selected) | color(Color::Green), separator(),
               vbox(rows) | vscroll_indicator | frame | flex}) |
         border;
}

Element BrowserUI::renderConfirmation(const SessionSnapshot &snap) {
  const PurgePreview &preview = snap.preview;
  const int list_height = 12;

  std::vector<Element> content = {
      text("PURGE " + std::to_string(preview.paths.size()) + " PATHS?") | bold |
          color(Color::Red) | hcenter,
      separator(),
      text("Search root: " + preview.searchRoot) | color(Color::Yellow),
      text("Inodes: " + std::to_string(preview.identityCount) +
           ", est. freed: " + formatBytes(preview.estimatedBytes))};

  if (!preview.incomplete.empty()) {
    content.push_back(text(std::to_string(preview.incomplete.size()) +
                           " inodes have links outside the search root, "
                           "their space will not be freed") |
                      color(Color::Magenta) | bold);
  }
  if (!preview.missing.empty()) {
    content.push_back(text(std::to_string(preview.missing.size()) +
                           " marked files no longer exist") |
                      color(Color::Yellow));
  }
  if (preview.dryRun) {
    content.push_back(text("DRY RUN: nothing will be deleted") |
                      color(Color::Cyan) | bold);
  }

  content.push_back(separator());
  int end = std::min(static_cast<int>(preview.paths.size()),
                     m_preview_scroll + list_height);
  for (int i = m_preview_scroll; i < end; ++i) {
    content.push_back(text("[PURGE] " + preview.paths[i]));
  }
  if (end < static_cast<int>(preview.paths.size())) {
    content.push_back(text("... " +
                           std::to_string(preview.paths.size() - end) +
                           " more") |
                      dim);
  }

  content.push_back(separator());
  content.push_back(
      hbox({text("Press ") | color(Color::GrayLight),
            text("'y'") | bold | color(Color::Green),
            text(" to confirm, ") | color(Color::GrayLight),
            text("'n'") | bold | color(Color::Red),
            text(" or ") | color(Color::GrayLight), text("ESC") | bold,
            text(" to cancel") | color(Color::GrayLight)}) |
      hcenter);

  return vbox(content) | border | size(WIDTH, LESS_THAN, 110);
}

// ============================================================================
// EVENTS
// ============================================================================

bool BrowserUI::handleBrowseEvent(Event event) {
  SessionSnapshot snap = m_session->snapshot();
  int page = static_cast<int>(std::max<std::size_t>(snap.page.rows.size(), 1));

  if (event == Event::ArrowUp || event == Event::Character('k')) {
    if (snap.cursor == 0) {
      return false;
    }
    m_session->moveCursor(-1);
    return true;
  }
  if (event == Event::ArrowDown || event == Event::Character('j')) {
    m_session->moveCursor(1);
    return true;
  }
  if (event == Event::PageUp) {
    m_session->moveCursor(-page);
    return true;
  }
  if (event == Event::PageDown) {
    m_session->moveCursor(page);
    return true;
  }
  if (event == Event::Home || event == Event::Character('g')) {
    m_session->moveCursorTo(0);
    return true;
  }
  if (event == Event::End || event == Event::Character('G')) {
    m_session->moveCursorTo(snap.page.total == 0 ? 0 : snap.page.total - 1);
    return true;
  }
  if (event == Event::Return || event == Event::ArrowRight) {
    m_session->enter();
    m_current_status = m_session->snapshot().status;
    return true;
  }
  if (event == Event::Backspace || event == Event::ArrowLeft) {
    m_session->leave();
    return true;
  }
  return false;
}

bool BrowserUI::handleConfirmEvent(Event event) {
  if (event == Event::Character('y') || event == Event::Character('Y')) {
    confirmPurgeAsync();
    return true;
  }
  if (event == Event::Character('n') || event == Event::Character('N') ||
      event == Event::Escape) {
    m_session->cancelPurge();
    m_current_status = "Purge cancelled.";
    return true;
  }
  if (event == Event::ArrowDown) {
    int max_scroll = std::max(
        0, static_cast<int>(m_session->snapshot().preview.paths.size()) - 1);
    m_preview_scroll = std::min(m_preview_scroll + 1, max_scroll);
    return true;
  }
  if (event == Event::ArrowUp) {
    m_preview_scroll = std::max(0, m_preview_scroll - 1);
    return true;
  }
  // Modal: swallow everything else
  return true;
}

/**
 * @brief Executes an action from the top menu or a shortcut
 *
 * @return true if the action was handled
 */
bool BrowserUI::handleAction(ActionID action) {
  if (action == ActionID::Quit) {
    quit();
    return true;
  }
  if (!m_session || m_busy ||
      m_session->state() != SessionState::Browsing) {
    return false;
  }

  switch (action) {
  case ActionID::ToggleMark:
    m_session->toggleMark();
    return true;
  case ActionID::PurgeMarked:
    requestPurgeAsync();
    return true;
  case ActionID::ClearMarks:
    m_session->clearMarks();
    m_current_status = "Marks cleared.";
    return true;
  case ActionID::Rescan:
    loadScanAsync(false);
    return true;
  default:
    return false;
  }
}

ActionID BrowserUI::getActionIdByIndex(int index) {
  if (index < 0 || index >= static_cast<int>(ActionMap.size())) {
    return ActionID::Quit; // Fallback in case of invalid index
  }
  auto it = ActionMap.begin();
  std::advance(it, index);
  return it->first;
}

void BrowserUI::quit() {
  if (m_session) {
    m_session->quit();
  }
  m_screen.Exit();
}

// ============================================================================
// MAIN LOOP
// ============================================================================

/**
 * @brief Starts the main UI event loop
 *
 * Character keys are looked up in ActionMap first, so shortcuts work from
 * anywhere in the UI. While an operation runs, 'q' and ESC cancel it and
 * every other key is ignored.
 */
void BrowserUI::run() {
  auto global_handler = CatchEvent(m_document, [this](Event event) {
    if (m_busy) {
      if (event == Event::Character('q') || event == Event::Escape) {
        if (m_context.cancel) {
          m_context.cancel->cancel();
          m_busy_message = "Cancelling...";
        }
      }
      return true;
    }

    if (m_session && m_session->state() == SessionState::ConfirmingDelete) {
      return false;
    }

    if (event.is_character()) {
      for (const auto &pair : ActionMap) {
        if (event.character()[0] == pair.second.m_shortcut) {
          return handleAction(pair.first);
        }
      }
    }
    return false;
  });
  m_screen.Loop(global_handler);
}

// ============================================================================
// ANIMATION THREAD
// ============================================================================

/**
 * @brief Starts the animation thread for the spinner
 *
 * Requests an animation frame every 10ms until stopAnimation() is called.
 */
void BrowserUI::startAnimation() {
  if (m_animating)
    return;

  m_animating = true;
  m_animation_thread = std::thread([this]() {
    while (m_animating) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      if (m_animating) {
        m_screen.RequestAnimationFrame(); // Force UI refresh
      }
    }
  });
}

void BrowserUI::stopAnimation() {
  m_animating = false;
  if (m_animation_thread.joinable()) {
    m_animation_thread.join();
  }
  // Request final frame redraw to clear spinner
  m_screen.RequestAnimationFrame();
}
