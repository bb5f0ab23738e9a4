#include "process.h"

#include "platform.h"
#include "util.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bpack {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

// Reads the child's merged output until EOF, forwarding complete lines.
std::string drain_pipe(fd_cleanup &read_fd, process_run_cfg const &cfg) {
  std::string output;
  std::string pending;
  std::array<char, 4096> chunk{};

  pollfd pfd{ .fd = read_fd.get(), .events = POLLIN, .revents = 0 };

  auto const emit_line = [&cfg](std::string_view line) {
    if (cfg.on_output_line) { cfg.on_output_line(line); }
  };

  while (true) {
    int const poll_result{ ::poll(&pfd, 1, -1) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (pfd.revents & POLLNVAL) { throw std::runtime_error("poll failed on child pipe"); }

    ssize_t const read_bytes{ ::read(read_fd.get(), chunk.data(), chunk.size()) };
    if (read_bytes == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "read failed");
    }

    if (read_bytes == 0) {
      if (!pending.empty()) { emit_line(pending); }
      return output;
    }

    output.append(chunk.data(), static_cast<size_t>(read_bytes));
    pending.append(chunk.data(), static_cast<size_t>(read_bytes));

    size_t newline{ 0 };
    while ((newline = pending.find('\n')) != std::string::npos) {
      emit_line(std::string_view{ pending }.substr(0, newline));
      pending.erase(0, newline + 1);
    }
  }
}

std::pair<int, std::optional<int>> wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result = ::waitpid(child, &status, 0);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }

  if (WIFEXITED(status)) { return { WEXITSTATUS(status), std::nullopt }; }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { kSignalExitBase + sig, sig };
  }

  return { status, std::nullopt };
}

[[noreturn]] void exec_child_process(fd_cleanup &output_read,
                                     fd_cleanup &output_write,
                                     std::optional<std::filesystem::path> const &cwd,
                                     std::string const &executable,
                                     std::vector<std::string> const &argv_strings,
                                     std::vector<char *> const &envp) {
  output_read.release();

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ output_write.get(), STDOUT_FILENO },
    std::pair{ output_write.get(), STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  output_write.release();

  if (cwd) {
    if (::chdir(cwd->c_str()) == -1) {
      std::perror("chdir");
      _exit(kChildErrorExit);
    }
  }

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  ::execve(executable.c_str(), argv.data(), const_cast<char **>(envp.data()));
  std::perror("execve");
  _exit(kChildErrorExit);
}

std::string resolve_executable(std::string const &name,
                               std::optional<std::filesystem::path> const &cwd) {
  if (name.find('/') != std::string::npos) {
    std::filesystem::path p{ name };
    if (p.is_relative() && cwd) { p = std::filesystem::absolute(*cwd / p); }
    return p.string();
  }

  if (auto const found{ platform::find_executable(name) }) { return found->string(); }
  throw std::runtime_error("process: executable not found on PATH: " + name);
}

}  // namespace

process_result process_run(std::vector<std::string> const &argv, process_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("process_run: argv must be non-empty"); }

  std::string const executable{ resolve_executable(argv[0], cfg.cwd) };

  auto const [env_strings, envp]{ [&cfg] {
    std::vector<std::string> strings;
    for (auto const &entry : platform::get_environment()) {
      auto const key{ entry.substr(0, entry.find('=')) };
      if (!cfg.env_overrides.contains(key)) { strings.push_back(entry); }
    }
    for (auto const &[key, value] : cfg.env_overrides) { strings.push_back(key + "=" + value); }

    std::vector<char *> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto &entry : strings) { pointers.push_back(entry.data()); }
    pointers.push_back(nullptr);
    return std::pair{ std::move(strings), std::move(pointers) };
  }() };

  int pipefd[2];
  if (::pipe(pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }

  fd_cleanup read_end{ pipefd[0] };
  fd_cleanup write_end{ pipefd[1] };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(read_end, write_end, cfg.cwd, executable, argv, envp);
  }

  write_end.release();  // parent: close write end so EOF arrives when the child exits

  process_result result;
  try {
    result.output = drain_pipe(read_end, cfg);
    std::tie(result.exit_code, result.signal) = wait_for_child(child);
  } catch (...) {
    ::kill(child, SIGKILL);
    wait_for_child(child);
    throw;
  }

  return result;
}

process_result process_run_checked(std::string_view what,
                                   std::vector<std::string> const &argv,
                                   process_run_cfg const &cfg) {
  auto result{ process_run(argv, cfg) };
  if (result.exit_code != 0) {
    std::string message{ std::string{ what } + " failed with exit code " +
                         std::to_string(result.exit_code) };
    if (!result.output.empty()) { message += ":\n" + result.output; }
    throw process_error(message, result.exit_code, std::move(result.output));
  }
  return result;
}

}  // namespace bpack
