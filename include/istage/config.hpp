#pragma once
#include "istage/render.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace istage {

// Bad command-line input; main prints usage and exits 2.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Options {
  bool help{false};
  bool version{false};
  bool color{true};
  bool ascii{false};
};

// Parse arguments after argv[0]. Throws UsageError on anything unknown.
auto parse_options(const std::vector<std::string>& args) -> Options;

// Theme for the given options (UTF-8 glyphs unless --ascii).
auto make_theme(const Options& opts) -> Theme;

void print_usage(std::ostream& os);

auto version_string() -> std::string;

} // namespace istage
