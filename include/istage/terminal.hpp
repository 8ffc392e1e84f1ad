#pragma once
/*
 * Terminal
 *
 * RAII wrapper around ncurses: the constructor switches the screen to
 * raw/noecho/keypad mode, the destructor restores it. Draws Frames
 * produced by render() and turns key codes into session Events.
 * Only one Terminal may exist at a time.
 */
#include "istage/render.hpp"
#include "istage/session.hpp"

namespace istage {

class Terminal {
public:
  explicit Terminal(const Theme& theme);
  ~Terminal();

  Terminal(const Terminal&) = delete;
  auto operator=(const Terminal&) -> Terminal& = delete;

  [[nodiscard]] auto height() const -> int;

  // Blocks for the next key; keys without a binding and interrupted reads
  // come back as Key::None. Lost input (EOF, hangup) comes back as Quit.
  auto next_event() -> Event;

  void draw(const Frame& frame);

private:
  [[nodiscard]] auto attr_for(Style style) const -> int;

  Theme theme_;
  bool color_{false};
  bool wide_colors_{false};
};

// Map a curses key code to an event. `height` is the current row count,
// recorded for KEY_RESIZE.
auto translate_key(int ch, int height) -> Event;

// Event for one getch() result. `err` is errno after the call and only
// matters when `ch` is ERR: EINTR yields Key::None (read again), any
// other failure yields Key::Quit.
auto event_for_getch(int ch, int err, int height) -> Event;

} // namespace istage
