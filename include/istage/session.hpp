#pragma once
#include "istage/status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace istage {

class Repository; // fwd

enum class Mode : std::uint8_t { Browsing, ViewingDiff };

enum class Key : std::uint8_t {
  None,
  Quit,
  Up,
  Down,
  PageUp,
  PageDown,
  Toggle,
  ToggleDiff,
  Top,
  Bottom,
  Resize,
};

struct Event {
  Key key{Key::None};
  int height{0}; // terminal rows, Resize only
};

// The interaction state machine. Owns the file list, cursor, mode and
// diff scroll position; every input event goes through handle().
//
// Invariants while not quitting:
//   0 <= cursor() < entries().size()
//   0 <= scroll_offset() <= max_scroll()
//   viewport_height() >= 1
//
// PageUp/PageDown move by viewport_height() / 2, but never by less than
// one row, so a one-row viewport still scrolls.
class Session {
public:
  // `entries` must be non-empty (throws std::invalid_argument).
  Session(std::vector<FileEntry> entries, const Repository &repo, int terminal_height);

  void handle(const Event &ev);

  [[nodiscard]] const std::vector<FileEntry> &entries() const { return entries_; }
  [[nodiscard]] const FileEntry &current() const { return entries_[cursor_]; }
  [[nodiscard]] std::size_t cursor() const { return cursor_; }
  [[nodiscard]] Mode mode() const { return mode_; }
  [[nodiscard]] bool quitting() const { return quitting_; }

  // Diff state, meaningful only in ViewingDiff.
  [[nodiscard]] const std::string &diff_text() const { return diff_text_; }
  [[nodiscard]] const std::vector<std::string> &diff_lines() const { return diff_lines_; }
  [[nodiscard]] int scroll_offset() const { return scroll_; }
  [[nodiscard]] int viewport_height() const { return viewport_; }
  [[nodiscard]] int max_scroll() const;

  // Transient message from the last event (e.g. a failed toggle).
  [[nodiscard]] const std::string &status_message() const { return message_; }

private:
  void move_cursor(bool forward);
  void scroll_to(int offset);
  [[nodiscard]] int half_page() const;
  void toggle();
  void enter_diff();
  void leave_diff();
  void refresh_diff();
  void resize(int terminal_height);

  std::vector<FileEntry> entries_;
  const Repository *repo_;
  std::size_t cursor_{0};
  Mode mode_{Mode::Browsing};
  std::string diff_text_;
  std::vector<std::string> diff_lines_;
  int scroll_{0};
  int viewport_{1};
  bool quitting_{false};
  std::string message_;
};

} // namespace istage
