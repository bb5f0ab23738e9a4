#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bpack {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Case-insensitive; throws std::runtime_error naming the offending position.
std::vector<unsigned char> util_hex_to_bytes(std::string_view hex);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Create or truncate `path` and write `content` to it.
// Throws std::runtime_error on open or write failure.
void util_write_file(std::filesystem::path const &path, std::string_view content);

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

// Removes a single file on destruction unless release()d.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  std::filesystem::path release();
  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Removes a directory tree on destruction unless release()d.
class scoped_dir_cleanup : public unmovable {
 public:
  explicit scoped_dir_cleanup(std::filesystem::path path);
  ~scoped_dir_cleanup();

  std::filesystem::path release();
  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace bpack
