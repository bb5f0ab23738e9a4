#pragma once

#include "file_entry.h"
#include "manifest.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace bpack {

// "dependencies/<md5-hex of uri>/<basename of uri>"
std::string dependency_cache_relative_path(std::string_view uri);

// Return the verified cache entry for `dep` under `cache_root`, downloading it
// first when absent. The checksum is re-verified on every call, so a corrupted
// cache entry fails with integrity_error rather than being reused. Concurrent
// callers are serialized per entry by a lock file; a file at the final path is
// always a complete, verified download.
file_entry fetch_dependency(dependency const &dep, std::filesystem::path const &cache_root);

}  // namespace bpack
