#include "dependency_cache.h"

#include "fetch.h"
#include "md5.h"
#include "platform.h"
#include "sha256.h"
#include "tui.h"
#include "uri.h"
#include "util.h"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace bpack {

namespace {

constexpr char kDependenciesDir[]{ "dependencies" };
constexpr char kLockFileName[]{ ".lock" };

void verify_entry(dependency const &dep, std::filesystem::path const &path) {
  try {
    sha256_verify(dep.sha256, sha256(path));
  } catch (integrity_error const &e) {
    throw integrity_error("dependency sha256 mismatch for " + path.string() +
                              ": expected sha256 " + e.expected() + ", actual sha256 " +
                              e.actual(),
                          e.expected(),
                          e.actual());
  }
}

}  // namespace

std::string dependency_cache_relative_path(std::string_view uri) {
  auto const basename{ uri_extract_filename(uri) };
  if (basename.empty() || basename == "." || basename == "..") {
    throw std::runtime_error("dependency_cache: uri has no file name: " + std::string{ uri });
  }

  return (std::filesystem::path{ kDependenciesDir } / md5_hex(uri) / basename).generic_string();
}

file_entry fetch_dependency(dependency const &dep, std::filesystem::path const &cache_root) {
  auto const name{ dependency_cache_relative_path(dep.uri) };
  auto const final_path{ (std::filesystem::absolute(cache_root) / name).lexically_normal() };
  file_entry const entry{ .name = name, .path = final_path };

  if (std::filesystem::is_regular_file(final_path)) {
    tui::debug("dependency_cache: hit %s", final_path.string().c_str());
    verify_entry(dep, final_path);
    return entry;
  }

  auto const entry_dir{ final_path.parent_path() };
  std::filesystem::create_directories(entry_dir);

  platform::file_lock const lock{ entry_dir / kLockFileName };

  // Another process may have populated the entry while we waited.
  if (std::filesystem::is_regular_file(final_path)) {
    tui::debug("dependency_cache: populated concurrently %s", final_path.string().c_str());
    verify_entry(dep, final_path);
    return entry;
  }

  tui::info("Downloading %s", dep.uri.c_str());

  scoped_path_cleanup temp{ platform::make_temp_file(entry_dir,
                                                     final_path.filename().string() +
                                                         ".tmp-") };
  fetch_single(fetch_request_from_uri(dep.uri, temp.path()));
  verify_entry(dep, temp.path());

  platform::atomic_rename(temp.path(), final_path);
  temp.release();

  tui::debug("dependency_cache: stored %s", final_path.string().c_str());
  return entry;
}

}  // namespace bpack
