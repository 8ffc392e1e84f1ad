#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace istage {

enum class Capture : std::uint8_t {
  Stdout,   // stderr goes to /dev/null
  Combined, // stderr merged into the captured output
};

struct ProcessResult {
  int exit_code{0}; // 128 + signal number if the child was killed
  std::string output;

  [[nodiscard]] auto ok() const -> bool { return exit_code == 0; }
};

// Runs an external command to completion and captures its output.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual auto run(const std::vector<std::string>& argv, Capture capture) -> ProcessResult = 0;
};

// fork/execvp runner. The child never inherits the terminal: stdin is
// /dev/null and stderr is either captured or discarded.
// Throws std::system_error if the child cannot be spawned or reaped.
class SystemRunner : public CommandRunner {
public:
  SystemRunner() = default;
  explicit SystemRunner(std::filesystem::path cwd);

  auto run(const std::vector<std::string>& argv, Capture capture) -> ProcessResult override;

private:
  std::filesystem::path cwd_; // empty: inherit
};

} // namespace istage
