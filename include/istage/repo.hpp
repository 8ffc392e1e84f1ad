#pragma once
#include "istage/process.hpp"
#include "istage/status.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace istage {

enum class ErrorKind : std::uint8_t { NotARepository, StatusQueryFailure };

// Fatal startup errors; the interactive loop never sees these.
class RepoError : public std::runtime_error {
public:
  RepoError(ErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] auto kind() const -> ErrorKind { return kind_; }

private:
  ErrorKind kind_;
};

// Thin front for the `git` executable. Every query and mutation goes
// through the injected runner so tests can script git's answers.
class Repository {
public:
  explicit Repository(CommandRunner &runner);

  // `git <args...>`
  auto git(const std::vector<std::string> &args, Capture capture = Capture::Stdout) const
      -> ProcessResult;

  // `git rev-parse --is-inside-work-tree` exits 0 and prints "true".
  [[nodiscard]] auto is_inside_work_tree() const -> bool;

  // Raw `git status --porcelain` output.
  // Throws RepoError(StatusQueryFailure) on a non-zero exit.
  [[nodiscard]] auto status_porcelain() const -> std::string;

  // Changed files in git's order.
  // Throws RepoError(NotARepository | StatusQueryFailure).
  [[nodiscard]] auto load_changes() const -> std::vector<FileEntry>;

  // Run a stage/unstage action; stderr is merged so failures can be shown.
  auto apply(const Action &action) const -> ProcessResult;

private:
  CommandRunner *runner_;
};

// Arguments (without the leading "git") that carry out `action`.
auto action_args(const Action &action) -> std::vector<std::string>;

} // namespace istage
