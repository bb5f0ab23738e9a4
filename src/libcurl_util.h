#pragma once

#include <filesystem>
#include <string_view>

namespace bpack {

void libcurl_ensure_initialized();

// Download `url` into `destination`, creating parent directories. On failure the
// partial file is removed and std::runtime_error is thrown; HTTP error statuses
// are reported as "could not download: <status>".
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination);

}  // namespace bpack
