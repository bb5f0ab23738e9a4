#pragma once

#include <filesystem>

namespace bpack {

// Copy `source_dir` into a fresh temp directory and return its path. Entries named
// .git or tests are skipped at any depth; symlinks are recreated, never followed;
// files and directories keep their permission bits. The caller owns the returned
// directory. On failure the partial copy is removed and the error propagates.
std::filesystem::path stage_directory(std::filesystem::path const &source_dir);

// True for directory entry names excluded from staging.
bool stage_is_excluded(std::filesystem::path const &name);

}  // namespace bpack
