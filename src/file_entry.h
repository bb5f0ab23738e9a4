#pragma once

#include <filesystem>
#include <string>

namespace bpack {

// One archive member: `name` inside the archive, `path` on the local disk.
struct file_entry {
  std::string name;
  std::filesystem::path path;

  bool operator==(file_entry const &) const = default;
};

}  // namespace bpack
