#include "cmd_common.h"

#include "platform.h"

#include <stdexcept>
#include <string>

namespace bpack {

std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root) {
  if (cache_root) { return *cache_root; }

  auto default_cache_root{ platform::get_default_cache_root() };
  if (!default_cache_root) {
    throw std::runtime_error(std::string("could not determine cache root (set ") +
                             platform::get_default_cache_root_env_vars() +
                             " or pass --cache-root)");
  }
  return *default_cache_root;
}

}  // namespace bpack
