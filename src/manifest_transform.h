#pragma once

#include "file_entry.h"

#include <filesystem>
#include <string_view>
#include <vector>

namespace bpack {

// Rewrite <staged_dir>/manifest.yml for `stack` and return the archive contents:
// the include files (in declared order) followed by cached dependency files when
// `include_cache` is set. Dependencies not available for a non-empty `stack` are
// dropped; retained ones get a "file" key naming their cache entry when cached.
// Keys the view does not model survive untouched.
std::vector<file_entry> manifest_transform(std::filesystem::path const &staged_dir,
                                           std::string_view stack,
                                           bool include_cache,
                                           std::filesystem::path const &cache_root);

}  // namespace bpack
