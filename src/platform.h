#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bpack::platform {

// Exclusive advisory lock on `path`, held for the lifetime of the object. Also
// serializes threads of this process that lock the same path.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// Create a new, uniquely named directory under the system temp directory.
std::filesystem::path make_temp_dir(std::string_view prefix);

// Create a new, empty, uniquely named file `<dir>/<stem>XXXXXX`.
std::filesystem::path make_temp_file(std::filesystem::path const &dir,
                                     std::string_view stem);

std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

// Search PATH for an executable named `name`. Names containing a '/' are
// returned as-is when they exist.
std::optional<std::filesystem::path> find_executable(std::string_view name);

std::vector<std::string> get_environment();

// Expands ~ and $VARS (no command substitution). Throws on undefined variables.
std::filesystem::path expand_path(std::string_view p);

bool is_tty();

}  // namespace bpack::platform
