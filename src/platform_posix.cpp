#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <wordexp.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

extern "C" char **environ;

namespace bpack::platform {

struct file_lock::impl {
  int fd;
  std::mutex *path_mutex;  // owned by the s_lock_mutexes map

  // POSIX record locks are per-process, so threads of one process would all
  // "acquire" the same file lock. An in-process mutex per path closes that gap.
  static std::mutex s_lock_map_mutex;
  static std::unordered_map<std::string, std::unique_ptr<std::mutex> > s_lock_mutexes;
};

std::mutex file_lock::impl::s_lock_map_mutex;
std::unordered_map<std::string, std::unique_ptr<std::mutex> >
    file_lock::impl::s_lock_mutexes;

file_lock::file_lock(std::filesystem::path const &path) {
  std::string const canonical_key{
    std::filesystem::absolute(path).lexically_normal().string()
  };

  std::unique_lock<std::mutex> path_lock{ [&]() {
    std::lock_guard<std::mutex> lock(impl::s_lock_map_mutex);
    auto &mutex_ptr{ impl::s_lock_mutexes[canonical_key] };
    if (!mutex_ptr) { mutex_ptr = std::make_unique<std::mutex>(); }
    return std::unique_lock<std::mutex>{ *mutex_ptr };
  }() };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  while (::fcntl(fd, F_SETLKW, &fl) == -1) {
    if (errno == EINTR) { continue; }
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
  impl_->path_mutex = path_lock.release();  // mutex stays locked until destruction
}

file_lock::~file_lock() {
  if (impl_) {
    ::close(impl_->fd);
    if (impl_->path_mutex) { impl_->path_mutex->unlock(); }
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

std::filesystem::path make_temp_dir(std::string_view prefix) {
  std::string pattern{
    (std::filesystem::temp_directory_path() / (std::string{ prefix } + "XXXXXX")).string()
  };

  std::vector<char> buffer{ pattern.begin(), pattern.end() };
  buffer.push_back('\0');

  if (::mkdtemp(buffer.data()) == nullptr) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "mkdtemp failed for " + pattern);
  }

  return std::filesystem::path{ buffer.data() };
}

std::filesystem::path make_temp_file(std::filesystem::path const &dir,
                                     std::string_view stem) {
  std::string pattern{ (dir / (std::string{ stem } + "XXXXXX")).string() };

  std::vector<char> buffer{ pattern.begin(), pattern.end() };
  buffer.push_back('\0');

  int const fd{ ::mkstemp(buffer.data()) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "mkstemp failed for " + pattern);
  }
  ::close(fd);

  return std::filesystem::path{ buffer.data() };
}

std::optional<std::filesystem::path> get_default_cache_root() {
  // BPACK_CACHE_ROOT takes precedence; ~ and $VARS in it are expanded
  if (char const *env_root{ std::getenv("BPACK_CACHE_ROOT") }; env_root && *env_root) {
    return expand_path(env_root);
  }

  if (char const *home{ std::getenv("HOME") }; home && *home) {
    return std::filesystem::path{ home } / ".buildpack-packager" / "cache";
  }

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() { return "BPACK_CACHE_ROOT or HOME"; }

std::optional<std::filesystem::path> find_executable(std::string_view name) {
  if (name.empty()) { return std::nullopt; }

  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path const candidate{ name };
    if (::access(candidate.c_str(), X_OK) == 0) { return candidate; }
    return std::nullopt;
  }

  char const *path_env{ std::getenv("PATH") };
  if (!path_env) { return std::nullopt; }

  for (std::string_view sv{ path_env }; !sv.empty();) {
    auto const pos{ sv.find(':') };
    auto const dir{ sv.substr(0, pos) };
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);

    std::filesystem::path const candidate{
      std::filesystem::path{ dir.empty() ? "." : std::string{ dir } } / std::string{ name }
    };

    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }

  return std::nullopt;
}

std::vector<std::string> get_environment() {
  std::vector<std::string> result;
  for (char **ep = environ; ep && *ep; ++ep) { result.emplace_back(*ep); }
  return result;
}

std::filesystem::path expand_path(std::string_view p) {
  if (p.empty()) { return {}; }

  wordexp_t we{};
  std::string const path_str{ p };
  int const flags{ WRDE_NOCMD | WRDE_UNDEF };  // no $(cmd), fail on undefined $VAR

  int const rc{ wordexp(path_str.c_str(), &we, flags) };

  if (rc == 0) {
    if (we.we_wordc == 0) {
      wordfree(&we);
      throw std::runtime_error("path expansion produced no results: " + path_str);
    }
    std::filesystem::path result{ we.we_wordv[0] };
    wordfree(&we);
    return result;
  }

  // POSIX: wordfree() must only be called after successful wordexp()
  if (rc == WRDE_BADVAL) {
    throw std::runtime_error("undefined variable in path: " + path_str);
  }
  throw std::runtime_error("path expansion failed: " + path_str);
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace bpack::platform
