#pragma once

#include "file_entry.h"

#include <filesystem>
#include <vector>

namespace bpack {

// Write `files` as a deflate-compressed zip at `archive_path`, in the given order.
// Each entry records its source's mtime and permission bits. The archive is
// assembled in a temp file beside `archive_path` and renamed over it only on
// success; on failure no archive is published and the temp file is removed.
void zip_archive_build(std::filesystem::path const &archive_path,
                       std::vector<file_entry> const &files);

}  // namespace bpack
