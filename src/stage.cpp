#include "stage.h"

#include "platform.h"
#include "tui.h"
#include "util.h"

#include <filesystem>
#include <ranges>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bpack {
namespace {

namespace fs = std::filesystem;

constexpr fs::perms kOwnerRwx{ fs::perms::owner_all };

void stage_copy_symlink(fs::path const &src, fs::path const &dest) {
  std::error_code ec;
  auto const target{ fs::read_symlink(src, ec) };
  if (ec) {
    throw std::runtime_error("stage: failed to read symlink " + src.string() + ": " +
                             ec.message());
  }

  fs::create_symlink(target, dest, ec);
  if (ec) {
    throw std::runtime_error("stage: failed to create " + dest.string() +
                             " as symlink to " + target.string() + ": " + ec.message());
  }
}

void copy_regular_file(fs::path const &src, fs::path const &dest, fs::perms perms) {
  fs::create_directories(dest.parent_path());
  fs::copy_file(src, dest, fs::copy_options::overwrite_existing);
  fs::permissions(dest, perms, fs::perm_options::replace);
}

}  // namespace

bool stage_is_excluded(fs::path const &name) { return name == ".git" || name == "tests"; }

fs::path stage_directory(fs::path const &source_dir) {
  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    throw std::runtime_error("stage: source is not a directory: " + source_dir.string());
  }

  auto const source{ fs::absolute(source_dir).lexically_normal() };
  scoped_dir_cleanup staged{ platform::make_temp_dir("bpack-stage-") };

  // Directory modes are applied after the walk so read-only directories can
  // still be populated.
  std::vector<std::pair<fs::path, fs::perms>> dir_modes;
  std::size_t file_count{ 0 };

  for (auto it{ fs::recursive_directory_iterator(source) };
       it != fs::recursive_directory_iterator();
       ++it) {
    auto const &entry{ *it };
    auto const relative{ entry.path().lexically_relative(source) };
    auto const dest{ staged.path() / relative };

    if (stage_is_excluded(entry.path().filename())) {
      tui::debug("stage: skipping %s", relative.string().c_str());
      if (entry.is_directory() && !entry.is_symlink()) { it.disable_recursion_pending(); }
      continue;
    }

    auto const status{ entry.symlink_status() };
    switch (status.type()) {
      case fs::file_type::symlink: stage_copy_symlink(entry.path(), dest); break;

      case fs::file_type::directory:
        fs::create_directories(dest);
        fs::permissions(dest, status.permissions() | kOwnerRwx, fs::perm_options::replace);
        dir_modes.emplace_back(dest, status.permissions());
        break;

      case fs::file_type::regular:
        copy_regular_file(entry.path(), dest, status.permissions());
        ++file_count;
        break;

      default:
        throw std::runtime_error("stage: unsupported file type: " + entry.path().string());
    }
  }

  for (auto const &[dir, perms] : dir_modes | std::views::reverse) {
    fs::permissions(dir, perms, fs::perm_options::replace);
  }

  tui::debug("stage: copied %zu files from %s to %s",
             file_count,
             source.string().c_str(),
             staged.path().string().c_str());

  return staged.release();
}

}  // namespace bpack
