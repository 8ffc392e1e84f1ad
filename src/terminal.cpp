#include "istage/terminal.hpp"

#include <curses.h>

#include "istage/util.hpp"

#include <algorithm>
#include <cerrno>
#include <string>

namespace istage {

namespace {

constexpr int kCtrlC = 3;
constexpr std::size_t kTabWidth = 8;

// Pair numbers are the Style values shifted by one (pair 0 is reserved).
constexpr short pair_number(Style s) { return static_cast<short>(static_cast<int>(s) + 1); }

std::string expand_tabs(const std::string &text) {
  if (text.find('\t') == std::string::npos)
    return text;
  std::string out;
  for (const char c : text) {
    if (c == '\t')
      out.append(kTabWidth - out.size() % kTabWidth, ' ');
    else
      out.push_back(c);
  }
  return out;
}

} // namespace

Event translate_key(int ch, int height) {
  switch (ch) {
  case 'q':
  case kCtrlC:
    return {.key = Key::Quit};
  case KEY_UP:
    return {.key = Key::Up};
  case KEY_DOWN:
    return {.key = Key::Down};
  case KEY_PPAGE:
    return {.key = Key::PageUp};
  case KEY_NPAGE:
    return {.key = Key::PageDown};
  case ' ':
    return {.key = Key::Toggle};
  case 'd':
    return {.key = Key::ToggleDiff};
  case 'g':
    return {.key = Key::Top};
  case 'G':
    return {.key = Key::Bottom};
  case KEY_RESIZE:
    return {.key = Key::Resize, .height = height};
  default:
    return {};
  }
}

Event event_for_getch(int ch, int err, int height) {
  if (ch != ERR)
    return translate_key(ch, height);
  // EINTR: a signal cut the read short, ask again. Anything else means
  // input is gone (EOF, hangup) and retrying would spin forever.
  if (err == EINTR)
    return {};
  return {.key = Key::Quit};
}

Terminal::Terminal(const Theme &theme) : theme_(theme) {
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);

  color_ = theme_.color && has_colors();
  if (color_) {
    start_color();
    use_default_colors();
    wide_colors_ = COLORS >= 256;
    const auto pick = [this](const ThemeColor &c) { return wide_colors_ ? c.color : c.fallback; };
    init_pair(pair_number(Style::Cursor), pick(theme_.cursor), -1);
    init_pair(pair_number(Style::Staged), pick(theme_.staged), -1);
    init_pair(pair_number(Style::Unstaged), pick(theme_.unstaged), -1);
    init_pair(pair_number(Style::Hint), pick(theme_.hint), -1);
    init_pair(pair_number(Style::Error), pick(theme_.error), -1);
  }
}

Terminal::~Terminal() { endwin(); }

int Terminal::height() const { return LINES; }

Event Terminal::next_event() {
  errno = 0;
  const int ch = getch();
  return event_for_getch(ch, errno, LINES);
}

int Terminal::attr_for(Style style) const {
  if (style == Style::Plain)
    return A_NORMAL;
  if (!color_)
    return style == Style::Error ? A_BOLD : A_NORMAL;

  int attr = static_cast<int>(COLOR_PAIR(pair_number(style)));
  // grey is not available in 8 colors; dim white stands in for it
  if (!wide_colors_ && (style == Style::Unstaged || style == Style::Hint))
    attr |= static_cast<int>(A_DIM);
  return attr;
}

void Terminal::draw(const Frame &frame) {
  erase();
  const int rows = std::min(static_cast<int>(frame.lines.size()), LINES);
  for (int r = 0; r < rows; ++r) {
    move(r, 0);
    int room = COLS;
    for (const auto &span : frame.lines[static_cast<std::size_t>(r)].spans) {
      if (room <= 0)
        break;
      const std::string text = expand_tabs(span.text);
      const auto fit = strutil::fit_columns(text, room);
      const int attr = attr_for(span.style);
      attron(attr);
      addnstr(text.c_str(), static_cast<int>(fit.bytes));
      attroff(attr);
      room -= fit.columns;
    }
  }
  refresh();
}

} // namespace istage
