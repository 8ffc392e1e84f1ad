#include "istage/render.hpp"

#include "istage/consts.hpp"
#include "istage/session.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace istage {

namespace {

Line plain(std::string text, Style style = Style::Plain) {
  return Line{.spans = {Span{.style = style, .text = std::move(text)}}};
}

void render_diff(const Session &s, const Theme &theme, Frame &f) {
  const auto &lines = s.diff_lines();
  const int total = static_cast<int>(lines.size());
  const int begin = std::min(s.scroll_offset(), total);
  const int end = std::min(begin + s.viewport_height(), total);

  if (total == 0)
    f.lines.push_back(plain(std::string(consts::kNoDifferences)));
  for (int i = begin; i < end; ++i)
    f.lines.push_back(plain(lines[static_cast<std::size_t>(i)]));

  std::ostringstream os;
  os << theme.arrows << "/PageUp/PageDown scroll (" << end << "/" << total
     << ")  g: top  G: bottom  d: back  q: quit";
  f.lines.push_back(plain(os.str(), Style::Hint));
}

void render_list(const Session &s, const Theme &theme, Frame &f) {
  const auto &entries = s.entries();
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto &e = entries[i];
    Line line;
    line.spans.push_back(
        {Style::Cursor, std::string(i == s.cursor() ? consts::kCursorMark : consts::kNoCursorMark)});
    switch (e.classification) {
    case Classification::Staged:
      line.spans.push_back({Style::Staged, theme.glyph_staged});
      break;
    case Classification::PartiallyStaged:
      line.spans.push_back({Style::Unstaged, theme.glyph_partial});
      break;
    case Classification::Unstaged:
      line.spans.push_back({Style::Unstaged, theme.glyph_unstaged});
      break;
    }
    line.spans.push_back({Style::Plain, " " + e.name});
    f.lines.push_back(std::move(line));
  }

  f.lines.push_back(Line{});
  if (!s.status_message().empty())
    f.lines.push_back(plain(s.status_message(), Style::Error));
  f.lines.push_back(plain(theme.arrows + ": navigate  space: toggle  d: diff  q: quit", Style::Hint));
}

} // namespace

Frame render(const Session &session, const Theme &theme) {
  Frame f;
  if (session.quitting())
    return f;
  if (session.mode() == Mode::ViewingDiff)
    render_diff(session, theme, f);
  else
    render_list(session, theme, f);
  return f;
}

std::string to_text(const Frame &frame) {
  std::string out;
  for (const auto &line : frame.lines) {
    for (const auto &span : line.spans)
      out += span.text;
    out += '\n';
  }
  return out;
}

} // namespace istage
