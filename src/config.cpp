#include "istage/config.hpp"

#include "istage/consts.hpp"

#ifndef ISTAGE_VERSION
#define ISTAGE_VERSION "0.0.0"
#endif

namespace istage {

Options parse_options(const std::vector<std::string> &args) {
  Options opts;
  for (const auto &a : args) {
    if (a == "-h" || a == "--help")
      opts.help = true;
    else if (a == "-V" || a == "--version")
      opts.version = true;
    else if (a == "--no-color")
      opts.color = false;
    else if (a == "--ascii")
      opts.ascii = true;
    else
      throw UsageError("unknown option: " + a);
  }
  return opts;
}

Theme make_theme(const Options &opts) {
  Theme t;
  t.color = opts.color;
  t.glyph_staged = std::string(opts.ascii ? consts::kAsciiStaged : consts::kGlyphStaged);
  t.glyph_partial = std::string(consts::kGlyphPartial);
  t.glyph_unstaged = std::string(consts::kGlyphUnstaged);
  t.arrows = std::string(opts.ascii ? consts::kArrowsAscii : consts::kArrowsUnicode);
  return t;
}

void print_usage(std::ostream &os) {
  os << "usage: " << consts::kProgramName << " [--no-color] [--ascii]\n\n";
  os << "Interactively stage and unstage changed files of the current git work tree.\n\n";
  os << "keys:\n";
  os << "  up/down            move between files (scroll in diff view)\n";
  os << "  space              stage / unstage the selected file\n";
  os << "  d                  show / hide the diff of the selected file\n";
  os << "  PageUp/PageDown    scroll the diff by half a screen\n";
  os << "  g / G              jump to top / bottom of the diff\n";
  os << "  q / Ctrl-C         quit\n\n";
  os << "options:\n";
  os << "  --no-color         disable colors\n";
  os << "  --ascii            ASCII glyphs only\n";
  os << "  -h, --help         show this help\n";
  os << "  -V, --version      show version\n";
}

std::string version_string() {
  return std::string(consts::kProgramName) + " " + ISTAGE_VERSION;
}

} // namespace istage
