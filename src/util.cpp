// Small string helpers shared by the status parser, loader and renderer
#include "istage/util.hpp"

#include <cctype>

namespace istage::strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  const auto is_ws = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!sv.empty() && is_ws(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_ws(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string first_line(std::string_view text) {
  const auto nl = text.find('\n');
  std::string out(text.substr(0, nl));
  rstrip_newlines(out);
  return out;
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

Fit fit_columns(std::string_view text, int columns) {
  Fit fit{.bytes = 0, .columns = 0};
  std::size_t i = 0;
  while (i < text.size() && fit.columns < columns) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t len = 1;
    if (lead >= 0xF0)
      len = 4;
    else if (lead >= 0xE0)
      len = 3;
    else if (lead >= 0xC0)
      len = 2;
    // a truncated sequence at the end is dropped rather than split
    if (i + len > text.size())
      break;
    i += len;
    fit.bytes = i;
    ++fit.columns;
  }
  return fit;
}

} // namespace istage::strutil
