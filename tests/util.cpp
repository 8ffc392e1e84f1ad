#include "istage/util.hpp"

#include <iostream>
#include <string>

int main() {
  using istage::strutil::fit_columns;

  auto fit = fit_columns("hello", 3);
  if (fit.bytes != 3 || fit.columns != 3) {
    std::cerr << "ascii clip wrong\n";
    return 1;
  }
  fit = fit_columns("hi", 10);
  if (fit.bytes != 2 || fit.columns != 2) {
    std::cerr << "short text should fit whole\n";
    return 1;
  }

  // "[✓] a": the check mark is three bytes but one cell
  const std::string glyph = "[\xe2\x9c\x93] a";
  fit = fit_columns(glyph, 2);
  if (fit.bytes != 4 || fit.columns != 2) {
    std::cerr << "multibyte glyph not kept whole: " << fit.bytes << "\n";
    return 1;
  }
  fit = fit_columns(glyph, 5);
  if (fit.bytes != glyph.size() || fit.columns != 5) {
    std::cerr << "full glyph line wrong\n";
    return 1;
  }

  // "é" ends the line; one column short cuts before it, never inside it
  const std::string accent = "caf\xc3\xa9";
  fit = fit_columns(accent, 3);
  if (fit.bytes != 3) {
    std::cerr << "clip split a code point\n";
    return 1;
  }

  // a sequence truncated by the producer is dropped, not half emitted
  fit = fit_columns("ab\xe2\x9c", 10);
  if (fit.bytes != 2 || fit.columns != 2) {
    std::cerr << "truncated sequence emitted\n";
    return 1;
  }

  if (fit_columns("abc", 0).bytes != 0) {
    std::cerr << "zero columns should fit nothing\n";
    return 1;
  }

  auto lines = istage::strutil::split_lines("a\r\nb\n");
  if (lines.size() != 2 || lines[0] != "a" || lines[1] != "b") {
    std::cerr << "split_lines wrong\n";
    return 1;
  }

  std::cout << "util OK\n";
  return 0;
}
