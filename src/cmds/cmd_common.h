#pragma once

#include <filesystem>
#include <optional>

namespace bpack {

// --cache-root when given, else the platform default (BPACK_CACHE_ROOT, then
// $HOME/.buildpack-packager/cache).
std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root);

}  // namespace bpack
