#include "istage/diff.hpp"

#include "istage/repo.hpp"
#include "istage/util.hpp"

#include <exception>
#include <utility>

namespace istage::diff {

std::vector<std::string> diff_args(const FileEntry &entry) {
  switch (entry.classification) {
  case Classification::Staged:
    return {"diff", "--no-color", "--staged", "--", entry.name};
  case Classification::Unstaged:
  case Classification::PartiallyStaged:
    break;
  }
  return {"diff", "--no-color", "HEAD", "--", entry.name};
}

std::string fetch(const Repository &repo, const FileEntry &entry) {
  try {
    auto res = repo.git(diff_args(entry), Capture::Combined);
    if (!res.ok()) {
      std::string msg = "Failed to show diff: exit status " + std::to_string(res.exit_code);
      if (auto detail = strutil::first_line(res.output); !detail.empty())
        msg += " (" + detail + ")";
      return msg;
    }
    return std::move(res.output);
  } catch (const std::exception &e) {
    return std::string("Failed to show diff: ") + e.what();
  }
}

} // namespace istage::diff
