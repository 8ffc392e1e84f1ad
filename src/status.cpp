#include "istage/status.hpp"

#include "istage/consts.hpp"
#include "istage/util.hpp"

namespace istage {

using consts::kSpace;

FileEntry interpret_status(char x, char y, const std::string &path) {
  const Action add{.op = StageOp::Add, .path = path};
  const Action rm_cached{.op = StageOp::RemoveCached, .path = path};
  const Action restore{.op = StageOp::RestoreStaged, .path = path};

  // '??'
  if (x == consts::kUntracked && y == consts::kUntracked)
    return {path, Classification::Unstaged, add, rm_cached};
  // 'AM', 'AD'
  if (x == consts::kAdded && y != kSpace)
    return {path, Classification::PartiallyStaged, add, rm_cached};
  // '*M'
  if (x != kSpace && y != kSpace)
    return {path, Classification::PartiallyStaged, add, restore};
  // 'A '
  if (x == consts::kAdded)
    return {path, Classification::Staged, add, rm_cached};
  // '* '
  if (x != kSpace)
    return {path, Classification::Staged, add, restore};
  // ' *'
  return {path, Classification::Unstaged, add, restore};
}

std::string unquote_path(std::string_view raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"')
    return std::string(raw);

  raw = raw.substr(1, raw.size() - 2);
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 == raw.size()) {
      out.push_back(c);
      continue;
    }
    const char e = raw[++i];
    switch (e) {
    case 'a': out.push_back('\a'); break;
    case 'b': out.push_back('\b'); break;
    case 'f': out.push_back('\f'); break;
    case 'n': out.push_back('\n'); break;
    case 'r': out.push_back('\r'); break;
    case 't': out.push_back('\t'); break;
    case 'v': out.push_back('\v'); break;
    default:
      if (e >= '0' && e <= '7') {
        // up to three octal digits encode one raw byte
        int value = 0;
        std::size_t n = 0;
        while (n < 3 && i < raw.size() && raw[i] >= '0' && raw[i] <= '7') {
          value = value * 8 + (raw[i] - '0');
          ++i;
          ++n;
        }
        --i;
        out.push_back(static_cast<char>(value & 0xff));
      } else {
        out.push_back(e); // '\\', '"'
      }
    }
  }
  return out;
}

bool parse_status_line(std::string_view line, FileEntry &out) {
  if (line.size() < consts::kMinStatusLine)
    return false;

  const char x = line[0];
  const char y = line[1];
  std::string_view rest = line.substr(consts::kStatusPathOffset);

  // "R  old -> new": the entry tracks the destination
  if (x == consts::kRenamed || x == consts::kCopied) {
    if (const auto arrow = rest.find(consts::kRenameArrow); arrow != std::string_view::npos)
      rest.remove_prefix(arrow + consts::kRenameArrow.size());
  }

  const std::string path = unquote_path(strutil::trim(rest));
  if (path.empty())
    return false;
  out = interpret_status(x, y, path);
  return true;
}

std::vector<FileEntry> parse_porcelain(std::string_view text) {
  std::vector<FileEntry> files;
  for (const auto &line : strutil::split_lines(text)) {
    FileEntry e{};
    if (parse_status_line(line, e))
      files.push_back(std::move(e));
  }
  return files;
}

std::string_view to_string(StageOp op) {
  switch (op) {
  case StageOp::RemoveCached:
    return "rm";
  case StageOp::RestoreStaged:
    return "restore";
  case StageOp::Add:
    break;
  }
  return "add";
}

} // namespace istage
