#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace bpack {

struct package_options {
  std::filesystem::path source_dir;
  std::filesystem::path cache_dir;
  std::string version;
  std::string stack;  // empty packages every stack
  bool cached{ false };
};

// "<language>_buildpack[-cached]-v<version>.zip"
std::string package_archive_name(std::string_view language,
                                 std::string_view version,
                                 bool cached);

// Stage the buildpack at options.source_dir, stamp VERSION, run its pre_package hook,
// rewrite the staged manifest for options.stack and zip the result into the source
// directory. Returns the absolute archive path. The staging directory never
// outlives the call.
std::filesystem::path package(package_options const &options);

// Package an extension-style buildpack by delegating to its own
// `bundle exec buildpack-packager`, then copy the produced zip into `source_dir`.
std::filesystem::path package_extension(std::filesystem::path const &source_dir,
                                        std::string const &version,
                                        bool cached);

}  // namespace bpack
