#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace istage {

enum class Classification : std::uint8_t { Unstaged, Staged, PartiallyStaged };

// Index mutation needed for one side of a toggle. Resolved to a git
// invocation only when it is run (see Repository::apply).
enum class StageOp : std::uint8_t {
  Add,           // git add
  RemoveCached,  // git rm --cached (never-committed paths)
  RestoreStaged, // git restore --staged (paths with a HEAD revision)
};

struct Action {
  StageOp op;
  std::string path; // repo-relative
};

struct FileEntry {
  std::string name;              // repo-relative, fixed at load
  Classification classification; // changed only by a successful toggle
  Action stage;                  // derived from the status code at load
  Action unstage;
};

// Map a porcelain status pair (x = index side, y = worktree side) and a
// path to a classification and its stage/unstage actions.
// `??` and `A?` are tested before the generic "both sides dirty" rule so
// that a never-committed path always unstages with `rm --cached`.
auto interpret_status(char x, char y, const std::string& path) -> FileEntry;

// Undo git's C-style quoting of a porcelain path ("a\tb", "\303\251").
// Unquoted input is returned unchanged.
auto unquote_path(std::string_view raw) -> std::string;

// Parse one `git status --porcelain` line. Returns false for lines
// shorter than the minimum valid length.
auto parse_status_line(std::string_view line, FileEntry& out) -> bool;

// Parse full porcelain output, keeping git's order.
auto parse_porcelain(std::string_view text) -> std::vector<FileEntry>;

// Short git sub-command name for an op ("add", "rm", "restore").
auto to_string(StageOp op) -> std::string_view;

} // namespace istage
