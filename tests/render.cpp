#include "istage/config.hpp"
#include "istage/render.hpp"
#include "istage/repo.hpp"
#include "istage/session.hpp"

#include "fake_runner.hpp"

#include <iostream>
#include <string>
#include <string_view>

using istage::Event;
using istage::Key;
using istage::Style;
using testutil::FakeRunner;

namespace {

int failures = 0;

void expect(bool ok, std::string_view what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

std::string line_text(const istage::Line &line) {
  std::string out;
  for (const auto &span : line.spans)
    out += span.text;
  return out;
}

const istage::Theme kTheme = istage::make_theme(istage::Options{});

void test_list_view() {
  FakeRunner git;
  testutil::script_repo(git);
  git.on("git add -- changed.txt", 0);
  const istage::Repository repo{git};
  istage::Session s{repo.load_changes(), repo, 25};

  auto text = istage::to_text(istage::render(s, kTheme));
  expect(text == "> [ ] newfile.txt\n"
                 "  [ ] changed.txt\n"
                 "  [✓] added.txt\n"
                 "  [~] addedmod.txt\n"
                 "\n"
                 "↑/↓: navigate  space: toggle  d: diff  q: quit\n",
         "list frame");

  s.handle(Event{.key = Key::Down});
  s.handle(Event{.key = Key::Toggle});
  const auto frame = istage::render(s, kTheme);
  expect(line_text(frame.lines[1]) == "> [✓] changed.txt", "cursor and toggled glyph");
  expect(line_text(frame.lines[0]) == "  [ ] newfile.txt", "cursor mark only on selection");
  expect(frame.lines[1].spans[0].style == Style::Cursor, "cursor style");
  expect(frame.lines[1].spans[1].style == Style::Staged, "staged glyph style");
  expect(frame.lines[3].spans[1].style == Style::Unstaged, "partial glyph style");
  expect(frame.lines.back().spans[0].style == Style::Hint, "footer style");
}

void test_ascii_theme() {
  FakeRunner git;
  testutil::script_repo(git, "M  staged.txt\n");
  const istage::Repository repo{git};
  const istage::Session s{repo.load_changes(), repo, 25};

  istage::Options opts;
  opts.ascii = true;
  const auto text = istage::to_text(istage::render(s, istage::make_theme(opts)));
  expect(text == "> [x] staged.txt\n\nup/down: navigate  space: toggle  d: diff  q: quit\n",
         "ascii frame");
}

void test_status_message() {
  FakeRunner git;
  testutil::script_repo(git);
  git.on("git add -- newfile.txt", 1, "error: open(\"newfile.txt\"): Permission denied\n");
  const istage::Repository repo{git};
  istage::Session s{repo.load_changes(), repo, 25};
  s.handle(Event{.key = Key::Toggle});

  const auto frame = istage::render(s, kTheme);
  const auto &msg = frame.lines[frame.lines.size() - 2];
  expect(msg.spans[0].style == Style::Error, "message styled as error");
  expect(line_text(msg) == "git add failed: error: open(\"newfile.txt\"): Permission denied",
         "message text");
}

void test_diff_view() {
  FakeRunner git;
  testutil::script_repo(git);
  std::string diff;
  for (int i = 1; i <= 50; ++i)
    diff += "line " + std::to_string(i) + "\n";
  git.on("git diff --no-color HEAD -- newfile.txt", 0, diff);
  const istage::Repository repo{git};
  istage::Session s{repo.load_changes(), repo, 25}; // viewport 20
  s.handle(Event{.key = Key::ToggleDiff});

  auto frame = istage::render(s, kTheme);
  expect(frame.lines.size() == 21, "viewport rows plus footer");
  expect(line_text(frame.lines[0]) == "line 1", "first visible line");
  expect(line_text(frame.lines[19]) == "line 20", "last visible line");
  expect(line_text(frame.lines[20]) ==
             "↑/↓/PageUp/PageDown scroll (20/50)  g: top  G: bottom  d: back  q: quit",
         "diff footer");

  s.handle(Event{.key = Key::Bottom});
  frame = istage::render(s, kTheme);
  expect(line_text(frame.lines[0]) == "line 31", "bottom first line");
  expect(line_text(frame.lines[19]) == "line 50", "bottom last line");
  expect(line_text(frame.lines[20]).find("(50/50)") != std::string::npos, "bottom position");
}

void test_short_and_empty_diff() {
  FakeRunner git;
  testutil::script_repo(git);
  git.on("git diff --no-color HEAD -- newfile.txt", 0, "");
  git.on("git diff --no-color HEAD -- changed.txt", 0, "a\nb\n");
  const istage::Repository repo{git};
  istage::Session s{repo.load_changes(), repo, 25};
  s.handle(Event{.key = Key::ToggleDiff});

  auto frame = istage::render(s, kTheme);
  expect(frame.lines.size() == 2, "placeholder plus footer");
  expect(line_text(frame.lines[0]) == "(no differences)", "empty diff placeholder");
  expect(line_text(frame.lines[1]).find("(0/0)") != std::string::npos, "empty diff position");

  s.handle(Event{.key = Key::Down});
  frame = istage::render(s, kTheme);
  expect(frame.lines.size() == 3, "short diff is not padded");
  expect(line_text(frame.lines[2]).find("(2/2)") != std::string::npos, "short diff position");
}

void test_quitting_renders_nothing() {
  FakeRunner git;
  testutil::script_repo(git);
  const istage::Repository repo{git};
  istage::Session s{repo.load_changes(), repo, 25};
  s.handle(Event{.key = Key::Quit});
  const auto frame = istage::render(s, kTheme);
  expect(frame.lines.empty(), "no lines once quitting");
  expect(istage::to_text(frame).empty(), "no text once quitting");
}

} // namespace

int main() {
  test_list_view();
  test_ascii_theme();
  test_status_message();
  test_diff_view();
  test_short_and_empty_diff();
  test_quitting_renders_nothing();

  if (failures != 0) {
    std::cerr << failures << " check(s) failed\n";
    return 1;
  }
  std::cout << "render OK\n";
  return 0;
}
