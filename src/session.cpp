#include "istage/session.hpp"

#include "istage/diff.hpp"
#include "istage/repo.hpp"
#include "istage/util.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace istage {

Session::Session(std::vector<FileEntry> entries, const Repository &repo, int terminal_height)
    : entries_(std::move(entries)), repo_(&repo) {
  if (entries_.empty())
    throw std::invalid_argument("session: no entries");
  resize(terminal_height);
}

int Session::max_scroll() const {
  const int total = static_cast<int>(diff_lines_.size());
  return std::max(0, total - viewport_);
}

void Session::handle(const Event &ev) {
  if (quitting_)
    return;
  message_.clear();

  const bool in_diff = mode_ == Mode::ViewingDiff;
  switch (ev.key) {
  case Key::Quit:
    quitting_ = true;
    break;
  case Key::Up:
    if (in_diff && scroll_ > 0)
      --scroll_;
    else
      move_cursor(false);
    break;
  case Key::Down:
    if (in_diff && scroll_ < max_scroll())
      ++scroll_;
    else
      move_cursor(true);
    break;
  case Key::PageDown:
    if (in_diff)
      scroll_to(scroll_ + half_page());
    break;
  case Key::PageUp:
    if (in_diff)
      scroll_to(scroll_ - half_page());
    break;
  case Key::Toggle:
    if (!in_diff)
      toggle();
    break;
  case Key::ToggleDiff:
    if (in_diff)
      leave_diff();
    else
      enter_diff();
    break;
  case Key::Top:
    if (in_diff)
      scroll_ = 0;
    break;
  case Key::Bottom:
    if (in_diff)
      scroll_ = max_scroll();
    break;
  case Key::Resize:
    resize(ev.height);
    break;
  case Key::None:
    break;
  }
}

// Wraps in both directions; a single entry wraps onto itself.
void Session::move_cursor(bool forward) {
  const std::size_t n = entries_.size();
  const std::size_t prev = cursor_;
  cursor_ = forward ? (cursor_ + 1) % n : (cursor_ + n - 1) % n;
  scroll_ = 0;
  if (mode_ == Mode::ViewingDiff && cursor_ != prev)
    refresh_diff();
}

void Session::scroll_to(int offset) { scroll_ = std::clamp(offset, 0, max_scroll()); }

int Session::half_page() const { return std::max(1, viewport_ / 2); }

void Session::toggle() {
  FileEntry &e = entries_[cursor_];
  const bool staging = e.classification != Classification::Staged;
  const Action &action = staging ? e.stage : e.unstage;

  try {
    const auto res = repo_->apply(action);
    if (!res.ok()) {
      message_ = "git " + std::string(to_string(action.op)) + " failed";
      if (auto detail = strutil::first_line(res.output); !detail.empty())
        message_ += ": " + detail;
      return;
    }
  } catch (const std::exception &ex) {
    message_ = "git " + std::string(to_string(action.op)) + " failed: " + ex.what();
    return;
  }
  e.classification = staging ? Classification::Staged : Classification::Unstaged;
}

void Session::enter_diff() {
  mode_ = Mode::ViewingDiff;
  refresh_diff();
}

void Session::leave_diff() {
  mode_ = Mode::Browsing;
  diff_text_.clear();
  diff_lines_.clear();
  scroll_ = 0;
}

void Session::refresh_diff() {
  diff_text_ = diff::fetch(*repo_, entries_[cursor_]);
  diff_lines_ = strutil::split_lines(diff_text_);
  scroll_ = 0;
}

// Rows left for diff text once the file list and footer are accounted for.
void Session::resize(int terminal_height) {
  const int n = static_cast<int>(entries_.size());
  viewport_ = std::max(1, terminal_height - n - 1);
  scroll_ = std::clamp(scroll_, 0, max_scroll());
}

} // namespace istage
