#include "istage/process.hpp"

#include "istage/consts.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace {

class UniqueFd {
public:
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset() noexcept {
    if (fd_ != -1) {
      // best effort; no throw in destructor
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_;
};

[[noreturn]] void throw_errno(const char *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

// Child side of fork: only async-signal-safe calls until exec.
[[noreturn]] void exec_child(const std::vector<char *> &args, int out_fd, istage::Capture capture,
                             const char *cwd) {
  const int devnull = ::open("/dev/null", O_RDWR);
  if (devnull != -1)
    ::dup2(devnull, STDIN_FILENO);
  ::dup2(out_fd, STDOUT_FILENO);
  if (capture == istage::Capture::Combined)
    ::dup2(out_fd, STDERR_FILENO);
  else if (devnull != -1)
    ::dup2(devnull, STDERR_FILENO);

  if (cwd != nullptr && ::chdir(cwd) != 0)
    ::_exit(istage::consts::kExecFailed);

  ::execvp(args[0], args.data());
  ::_exit(istage::consts::kExecFailed);
}

auto read_all(int fd) -> std::string {
  std::string out;
  std::array<char, 4096> buf{};
  for (;;) {
    const ssize_t r = ::read(fd, buf.data(), buf.size());
    if (r == 0)
      break;
    if (r < 0) {
      if (errno == EINTR)
        continue;
      throw_errno("read");
    }
    out.append(buf.data(), static_cast<std::size_t>(r));
  }
  return out;
}

auto wait_child(pid_t pid) -> int {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      throw_errno("waitpid");
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return istage::consts::kSignalBase + WTERMSIG(status);
  return -1;
}

} // namespace

namespace istage {

SystemRunner::SystemRunner(std::filesystem::path cwd) : cwd_(std::move(cwd)) {}

ProcessResult SystemRunner::run(const std::vector<std::string> &argv, Capture capture) {
  if (argv.empty())
    throw std::invalid_argument("run: empty argv");

  // Build everything the child needs before forking.
  std::vector<std::string> storage = argv;
  std::vector<char *> args;
  args.reserve(storage.size() + 1);
  for (auto &a : storage)
    args.push_back(a.data());
  args.push_back(nullptr);
  const std::string cwd = cwd_.string();

  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0)
    throw_errno("pipe");
  UniqueFd read_end{fds[0]};
  UniqueFd write_end{fds[1]};

  const pid_t pid = ::fork();
  if (pid == -1)
    throw_errno("fork");
  if (pid == 0)
    exec_child(args, write_end.get(), capture, cwd.empty() ? nullptr : cwd.c_str());

  // Parent keeps only the read end so EOF arrives when the child exits.
  write_end.reset();

  ProcessResult res;
  try {
    res.output = read_all(read_end.get());
  } catch (...) {
    wait_child(pid);
    throw;
  }
  res.exit_code = wait_child(pid);
  return res;
}

} // namespace istage
