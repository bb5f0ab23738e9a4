#include "util.h"

#include "tui.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bpack {

namespace {

constexpr char kHexDigits[]{ "0123456789abcdef" };

int hex_nibble(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  char const lower{ static_cast<char>(c | 0x20) };
  if (lower >= 'a' && lower <= 'f') { return lower - 'a' + 10; }
  return -1;
}

}  // namespace

std::string util_bytes_to_hex(void const *data, size_t length) {
  auto const *bytes{ static_cast<unsigned char const *>(data) };
  std::string hex(length * 2, '0');
  for (size_t i{ 0 }; i < length; ++i) {
    hex[2 * i] = kHexDigits[bytes[i] >> 4];
    hex[2 * i + 1] = kHexDigits[bytes[i] & 0x0f];
  }
  return hex;
}

std::vector<unsigned char> util_hex_to_bytes(std::string_view hex) {
  if (hex.size() & 1) {
    throw std::runtime_error("util_hex_to_bytes: hex string must have even length, got " +
                             std::to_string(hex.size()));
  }

  std::vector<unsigned char> bytes(hex.size() / 2);
  for (size_t pos{ 0 }; pos < hex.size(); ++pos) {
    int const nibble{ hex_nibble(hex[pos]) };
    if (nibble < 0) {
      throw std::runtime_error("util_hex_to_bytes: invalid character at position " +
                               std::to_string(pos));
    }
    bytes[pos / 2] = static_cast<unsigned char>(bytes[pos / 2] << 4 | nibble);
  }
  return bytes;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto const file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "util_load_file: cannot open " + path.string());
  }

  std::vector<unsigned char> content;
  std::array<unsigned char, 16 * 1024> chunk;
  for (;;) {
    size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    content.insert(content.end(), chunk.begin(), chunk.begin() + static_cast<long>(n));
    if (n < chunk.size()) { break; }
  }

  if (std::ferror(file.get())) {
    throw std::runtime_error("util_load_file: read error: " + path.string());
  }
  return content;
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  auto const file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "util_write_file: cannot open " + path.string());
  }

  size_t const written{ std::fwrite(content.data(), 1, content.size(), file.get()) };
  if (written != content.size() || std::fflush(file.get()) != 0) {
    throw std::runtime_error("util_write_file: short write: " + path.string());
  }
}

std::string util_format_bytes(std::uint64_t bytes) {
  if (bytes < 1024) { return std::to_string(bytes) + "B"; }

  static constexpr std::array<char const *, 4> kUnits{ "KB", "MB", "GB", "TB" };
  double scaled{ static_cast<double>(bytes) / 1024.0 };
  size_t unit{ 0 };
  for (; scaled >= 1024.0 && unit + 1 < kUnits.size(); ++unit) { scaled /= 1024.0; }

  std::array<char, 32> buf{};
  std::snprintf(buf.data(), buf.size(), "%.2f%s", scaled, kUnits[unit]);
  return buf.data();
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

std::filesystem::path scoped_path_cleanup::release() { return std::exchange(path_, {}); }

scoped_dir_cleanup::scoped_dir_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

namespace {

// remove_all cannot unlink entries of directories lacking owner write or search.
void make_tree_removable(std::filesystem::path const &root) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::is_directory(fs::symlink_status(root, ec))) { return; }
  fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);

  // Each directory is opened only after its entry is visited, so fixing the
  // mode at visit time is enough to descend into it.
  for (fs::recursive_directory_iterator it{ root, ec }, end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_directory(ec) && !it->is_symlink(ec)) {
      fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
    }
    ec.clear();
  }
}

}  // namespace

scoped_dir_cleanup::~scoped_dir_cleanup() {
  if (path_.empty()) { return; }
  make_tree_removable(path_);
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    tui::warn("Failed to remove %s: %s", path_.string().c_str(), ec.message().c_str());
  }
}

std::filesystem::path scoped_dir_cleanup::release() { return std::exchange(path_, {}); }

}  // namespace bpack
