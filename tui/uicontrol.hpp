/**
 * @file uicontrol.hpp
 * @brief Browser actions and keyboard shortcut mappings
 *
 * Each browser action has one shortcut key and one top menu title.
 *
 * Navigation keys (arrows, Enter, Backspace, PageUp/PageDown, Home/End) are
 * handled directly by the browser and are not part of the map.
 *
 * @see ActionID
 * @see ActionInfo
 * @see ActionMap
 */

#ifndef UI_CONTROL_HPP
#define UI_CONTROL_HPP

#include <map>
#include <string>
#include <vector>

/**
 * @struct ActionInfo
 * @brief Shortcut and menu title of one browser action
 */
struct ActionInfo {
  char m_shortcut;

  /** @brief e.g. "(q) Quit" */
  std::string m_menu_title;
};

/**
 * @enum ActionID
 * @brief Actions reachable from the top menu and by shortcut
 */
enum class ActionID {
  /** @brief Mark/unmark the entry under the cursor (shortcut: ' ') */
  ToggleMark,

  /** @brief Find every hardlink of the marked entries and ask to delete (shortcut: 'd') */
  PurgeMarked,

  /** @brief Unmark everything (shortcut: 'c') */
  ClearMarks,

  /** @brief Walk the scanned directory again (shortcut: 'r') */
  Rescan,

  /** @brief Quit the browser (shortcut: 'q') */
  Quit
};

/**
 * @brief Shortcut and menu title per action
 *
 * @note Shortcuts are case-sensitive
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::ToggleMark, {' ', "(space) Mark"}},
    {ActionID::PurgeMarked, {'d', "(d) Purge Marked"}},
    {ActionID::ClearMarks, {'c', "(c) Clear Marks"}},
    {ActionID::Rescan, {'r', "(r) Rescan"}},
    {ActionID::Quit, {'q', "(q) Quit"}}};

/**
 * @brief Menu titles in ActionID order
 */
inline std::vector<std::string> getMenuEntries() {
  std::vector<std::string> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    entries.push_back(info.m_menu_title);
  }
  return entries;
}

#endif // UI_CONTROL_HPP
