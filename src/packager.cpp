#include "packager.h"

#include "manifest.h"
#include "manifest_transform.h"
#include "manifest_validate.h"
#include "process.h"
#include "stage.h"
#include "tui.h"
#include "util.h"
#include "zip_archive.h"

#include <stdexcept>

namespace bpack {

namespace {

constexpr char kVersionFileName[]{ "VERSION" };

void write_version_file(std::filesystem::path const &staged_dir, std::string const &version) {
  auto const path{ staged_dir / kVersionFileName };
  util_write_file(path, version);
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::others_read,
                               std::filesystem::perm_options::replace);
}

std::filesystem::path absolute_source(std::filesystem::path const &source_dir) {
  auto const abs{ std::filesystem::absolute(source_dir).lexically_normal() };
  if (!std::filesystem::is_directory(abs)) {
    throw std::runtime_error("package: source directory does not exist: " + abs.string());
  }
  return abs;
}

void log_output_line(std::string_view line) {
  tui::debug("%.*s", static_cast<int>(line.size()), line.data());
}

}  // namespace

std::string package_archive_name(std::string_view language,
                                 std::string_view version,
                                 bool cached) {
  std::string name{ language };
  name += cached ? "_buildpack-cached-v" : "_buildpack-v";
  name += version;
  name += ".zip";
  return name;
}

std::filesystem::path package(package_options const &options) {
  auto const source_dir{ absolute_source(options.source_dir) };

  auto const source_view{ manifest_view::from_document(
      manifest_document::load(manifest_path(source_dir))) };
  manifest_validate_stack(source_view, options.stack);

  scoped_dir_cleanup staged{ stage_directory(source_dir) };
  tui::debug("package: staged %s in %s",
             source_dir.string().c_str(),
             staged.path().string().c_str());

  write_version_file(staged.path(), options.version);

  // The hook may rewrite the manifest, so everything after it reads the staged copy.
  if (source_view.pre_package && !source_view.pre_package->empty()) {
    tui::info("Running pre-package script: %s", source_view.pre_package->c_str());
    process_run_checked("pre_package",
                        { *source_view.pre_package },
                        process_run_cfg{ .on_output_line = log_output_line,
                                         .cwd = staged.path() });
  }

  auto const files{
    manifest_transform(staged.path(), options.stack, options.cached, options.cache_dir)
  };

  auto const staged_view{ manifest_view::from_document(
      manifest_document::load(manifest_path(staged.path()))) };

  auto const archive_path{
    source_dir / package_archive_name(staged_view.language, options.version, options.cached)
  };
  zip_archive_build(archive_path, files);

  tui::info("Packaged %s (%zu files, %s)",
            archive_path.string().c_str(),
            files.size(),
            util_format_bytes(std::filesystem::file_size(archive_path)).c_str());
  return archive_path;
}

std::filesystem::path package_extension(std::filesystem::path const &source_dir,
                                        std::string const &version,
                                        bool cached) {
  auto const abs_source{ absolute_source(source_dir) };
  auto const view{ manifest_view::from_document(
      manifest_document::load(manifest_path(abs_source))) };

  scoped_dir_cleanup staged{ stage_directory(abs_source) };
  write_version_file(staged.path(), version);

  tui::info("Running buildpack-packager (%s)", cached ? "cached" : "uncached");
  process_run_checked(
      "buildpack-packager",
      { "bundle", "exec", "buildpack-packager", cached ? "--cached" : "--uncached" },
      process_run_cfg{ .on_output_line = log_output_line,
                       .cwd = staged.path(),
                       .env_overrides = { { "BUNDLE_GEMFILE", "cf.Gemfile" } } });

  auto const name{ package_archive_name(view.language, version, cached) };
  auto const produced{ staged.path() / name };
  if (!std::filesystem::is_regular_file(produced)) {
    throw std::runtime_error("package_extension: buildpack-packager did not produce " + name);
  }

  auto const dest{ abs_source / name };
  std::filesystem::copy_file(produced,
                             dest,
                             std::filesystem::copy_options::overwrite_existing);

  tui::info("Packaged %s", dest.string().c_str());
  return dest;
}

}  // namespace bpack
