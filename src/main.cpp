#include "istage/config.hpp"
#include "istage/consts.hpp"
#include "istage/process.hpp"
#include "istage/render.hpp"
#include "istage/repo.hpp"
#include "istage/session.hpp"
#include "istage/terminal.hpp"

#include <clocale>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

using istage::consts::kProgramName;

int run_interactive(std::vector<istage::FileEntry> files, const istage::Repository &repo,
                    const istage::Theme &theme) {
  istage::Terminal term{theme};
  istage::Session session{std::move(files), repo, term.height()};

  term.draw(istage::render(session, theme));
  while (!session.quitting()) {
    const auto ev = term.next_event();
    if (ev.key == istage::Key::None)
      continue;
    session.handle(ev);
    term.draw(istage::render(session, theme));
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  istage::Options opts;
  try {
    opts = istage::parse_options(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const istage::UsageError &e) {
    std::cerr << e.what() << "\n";
    istage::print_usage(std::cerr);
    return 2;
  }
  if (opts.help) {
    istage::print_usage(std::cout);
    return 0;
  }
  if (opts.version) {
    std::cout << istage::version_string() << "\n";
    return 0;
  }

  istage::SystemRunner runner;
  const istage::Repository repo{runner};

  std::vector<istage::FileEntry> files;
  try {
    files = repo.load_changes();
  } catch (const std::exception &e) {
    std::cerr << kProgramName << ": " << e.what() << "\n";
    return 1;
  }

  if (files.empty()) {
    std::cout << istage::consts::kNoChanges << "\n";
    return 0;
  }

  // UTF-8 glyphs need the user's locale before curses starts
  std::setlocale(LC_ALL, "");
  try {
    return run_interactive(std::move(files), repo, istage::make_theme(opts));
  } catch (const std::exception &e) {
    std::cerr << kProgramName << ": " << e.what() << "\n";
    return 1;
  }
}
