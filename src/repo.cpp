#include "istage/repo.hpp"

#include "istage/consts.hpp"
#include "istage/util.hpp"

#include <utility>

namespace istage {

Repository::Repository(CommandRunner &runner) : runner_(&runner) {}

ProcessResult Repository::git(const std::vector<std::string> &args, Capture capture) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.emplace_back(consts::kGitExe);
  argv.insert(argv.end(), args.begin(), args.end());
  return runner_->run(argv, capture);
}

bool Repository::is_inside_work_tree() const {
  const auto res = git({"rev-parse", "--is-inside-work-tree"});
  return res.ok() && strutil::trim(res.output) == consts::kTrue;
}

std::string Repository::status_porcelain() const {
  // stdout only: a warning on stderr must not parse as a status line
  auto res = git({"status", "--porcelain"});
  if (!res.ok()) {
    throw RepoError(ErrorKind::StatusQueryFailure,
                    "git status failed (exit " + std::to_string(res.exit_code) + ")");
  }
  return std::move(res.output);
}

std::vector<FileEntry> Repository::load_changes() const {
  if (!is_inside_work_tree())
    throw RepoError(ErrorKind::NotARepository, "not inside a git work tree");
  return parse_porcelain(status_porcelain());
}

ProcessResult Repository::apply(const Action &action) const {
  return git(action_args(action), Capture::Combined);
}

std::vector<std::string> action_args(const Action &action) {
  switch (action.op) {
  case StageOp::RemoveCached:
    return {"rm", "-r", "--cached", "--quiet", "--", action.path};
  case StageOp::RestoreStaged:
    return {"restore", "--staged", "--", action.path};
  case StageOp::Add:
    break;
  }
  return {"add", "--", action.path};
}

} // namespace istage
