#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace istage {

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Trim ASCII whitespace on both ends
  auto trim(std::string_view sv) -> std::string;

  // First line of `text` without its terminator (empty if text is empty)
  auto first_line(std::string_view text) -> std::string;

  // Split raw text into lines. A trailing newline does not produce an
  // extra empty line; CR characters are dropped.
  auto split_lines(std::string_view text) -> std::vector<std::string>;

  struct Fit {
    std::size_t bytes; // prefix length, always on a UTF-8 code point boundary
    int columns;       // code points in that prefix
  };

  // Longest prefix of UTF-8 `text` that fits in `columns` cells, counting
  // one cell per code point.
  auto fit_columns(std::string_view text, int columns) -> Fit;
}

}
