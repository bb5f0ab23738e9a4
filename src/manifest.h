#pragma once

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bpack {

// A manifest field is missing a required value or has an unexpected shape.
class manifest_schema_error : public std::runtime_error {
 public:
  manifest_schema_error(std::string field, std::string const &message);

  std::string const &field() const { return field_; }

 private:
  std::string field_;
};

struct dependency {
  std::string name;
  std::string version;
  std::string uri;
  std::string sha256;
  std::vector<std::string> cf_stacks;

  bool available_for(std::string_view stack) const;
};

struct default_version {
  std::string name;
  std::string version;
};

// Raw YAML document. Keys keep their file order and unknown keys survive a
// load/save round trip.
class manifest_document {
 public:
  explicit manifest_document(YAML::Node root);

  static manifest_document load(std::filesystem::path const &path);
  static manifest_document parse(std::string_view yaml);

  void save(std::filesystem::path const &path) const;
  std::string dump() const;

  YAML::Node &root() { return root_; }
  YAML::Node const &root() const { return root_; }

 private:
  YAML::Node root_;
};

// Typed, read-only projection of a manifest_document. dependencies[i] mirrors
// root()["dependencies"][i].
struct manifest_view {
  std::string language;
  std::optional<std::string> pre_package;
  std::vector<std::string> include_files;
  std::vector<dependency> dependencies;
  std::vector<default_version> default_versions;

  static manifest_view from_document(manifest_document const &doc);

  // Every stack named by any dependency, in first-seen order.
  std::vector<std::string> stacks() const;
};

std::filesystem::path manifest_path(std::filesystem::path const &buildpack_dir);

}  // namespace bpack
