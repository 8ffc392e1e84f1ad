#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace istage {

class Session; // fwd

enum class Style : std::uint8_t { Plain, Cursor, Staged, Unstaged, Hint, Error };

// Terminal color with an 8-color fallback (curses numbering: 1 red,
// 2 green, 4 blue, 7 white).
struct ThemeColor {
  short color;
  short fallback;
};

// Presentation settings. Passed explicitly to the renderer and terminal.
struct Theme {
  bool color{true};
  std::string glyph_staged;
  std::string glyph_partial;
  std::string glyph_unstaged;
  std::string arrows; // key hint for up/down

  ThemeColor cursor{.color = 12, .fallback = 4};
  ThemeColor staged{.color = 42, .fallback = 2};
  ThemeColor unstaged{.color = 240, .fallback = 7};
  ThemeColor hint{.color = 240, .fallback = 7};
  ThemeColor error{.color = 9, .fallback = 1};
};

struct Span {
  Style style{Style::Plain};
  std::string text;
};

struct Line {
  std::vector<Span> spans;
};

struct Frame {
  std::vector<Line> lines;
};

// Pure: the frame for the session's current state. Empty once quitting.
auto render(const Session& session, const Theme& theme) -> Frame;

// Frame as plain text, one '\n' after every line.
auto to_text(const Frame& frame) -> std::string;

} // namespace istage
