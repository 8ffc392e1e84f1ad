#pragma once
#include "istage/status.hpp"

#include <string>
#include <vector>

namespace istage {

class Repository; // fwd

namespace diff {

// Arguments (without the leading "git") of the diff shown for `entry`,
// chosen by its current classification:
//   Staged          -> index vs HEAD
//   Unstaged        -> working tree vs HEAD
//   PartiallyStaged -> working tree vs HEAD
auto diff_args(const FileEntry& entry) -> std::vector<std::string>;

// Diff text for `entry`. Never throws: a failing git run comes back as a
// one-line "Failed to show diff: ..." message so there is always
// something to display.
auto fetch(const Repository& repo, const FileEntry& entry) -> std::string;

} // namespace diff

} // namespace istage
