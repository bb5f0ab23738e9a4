#include "manifest.h"

#include "util.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace bpack {

namespace {

constexpr char kManifestFileName[]{ "manifest.yml" };

std::string describe(YAML::Node const &node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined: return "undefined";
    case YAML::NodeType::Null: return "null";
    case YAML::NodeType::Scalar: return "a scalar";
    case YAML::NodeType::Sequence: return "a sequence";
    case YAML::NodeType::Map: return "a mapping";
  }
  return "unknown";
}

std::string required_scalar(YAML::Node const &parent,
                            char const *key,
                            std::string const &field) {
  YAML::Node const node{ parent[key] };
  if (!node || node.IsNull()) {
    throw manifest_schema_error(field, "required field is missing");
  }
  if (!node.IsScalar()) {
    throw manifest_schema_error(field, "expected a scalar, got " + describe(node));
  }
  return node.as<std::string>();
}

std::optional<std::string> optional_scalar(YAML::Node const &parent,
                                           char const *key,
                                           std::string const &field) {
  YAML::Node const node{ parent[key] };
  if (!node || node.IsNull()) { return std::nullopt; }
  if (!node.IsScalar()) {
    throw manifest_schema_error(field, "expected a scalar, got " + describe(node));
  }
  return node.as<std::string>();
}

// Absent or null yields an empty sequence; any other non-sequence is an error.
YAML::Node optional_sequence(YAML::Node const &parent,
                             char const *key,
                             std::string const &field) {
  YAML::Node const node{ parent[key] };
  if (!node || node.IsNull()) { return YAML::Node{ YAML::NodeType::Sequence }; }
  if (!node.IsSequence()) {
    throw manifest_schema_error(field, "expected a sequence, got " + describe(node));
  }
  return node;
}

std::vector<std::string> scalar_list(YAML::Node const &parent,
                                     char const *key,
                                     std::string const &field) {
  std::vector<std::string> result;
  YAML::Node const seq{ optional_sequence(parent, key, field) };
  for (std::size_t i{ 0 }; i < seq.size(); ++i) {
    YAML::Node const item{ seq[i] };
    if (!item.IsScalar()) {
      throw manifest_schema_error(field + "[" + std::to_string(i) + "]",
                                  "expected a scalar, got " + describe(item));
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

dependency parse_dependency(YAML::Node const &node, std::string const &field) {
  if (!node.IsMap()) {
    throw manifest_schema_error(field, "expected a mapping, got " + describe(node));
  }

  return dependency{ .name = optional_scalar(node, "name", field + ".name").value_or(""),
                     .version =
                         optional_scalar(node, "version", field + ".version").value_or(""),
                     .uri = required_scalar(node, "uri", field + ".uri"),
                     .sha256 =
                         optional_scalar(node, "sha256", field + ".sha256").value_or(""),
                     .cf_stacks = scalar_list(node, "cf_stacks", field + ".cf_stacks") };
}

default_version parse_default_version(YAML::Node const &node, std::string const &field) {
  if (!node.IsMap()) {
    throw manifest_schema_error(field, "expected a mapping, got " + describe(node));
  }
  return default_version{ .name = required_scalar(node, "name", field + ".name"),
                          .version = required_scalar(node, "version", field + ".version") };
}

// Plain scalars the YAML resolver would read back as null, bool or a number.
bool resolves_to_non_string(std::string const &value) {
  if (value.empty() || value == "~" || value == "null" || value == "Null" ||
      value == "NULL") {
    return true;
  }
  YAML::Node const scalar{ value };
  bool as_bool{ false };
  double as_number{ 0 };
  return YAML::convert<bool>::decode(scalar, as_bool) ||
         YAML::convert<double>::decode(scalar, as_number);
}

// Quoted scalars carry the "!" tag; scalars assigned in code carry none and are
// quoted only when they would otherwise change type on reload.
bool needs_quotes(YAML::Node const &scalar) {
  auto const &tag{ scalar.Tag() };
  if (tag == "!") { return true; }
  if (tag.empty()) { return resolves_to_non_string(scalar.Scalar()); }
  return false;
}

void emit_node(YAML::Emitter &out, YAML::Node const &node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null: out << YAML::Null; return;

    case YAML::NodeType::Scalar:
      if (needs_quotes(node)) { out << YAML::DoubleQuoted; }
      out << node.Scalar();
      return;

    case YAML::NodeType::Sequence:
      if (node.Style() == YAML::EmitterStyle::Flow) { out << YAML::Flow; }
      out << YAML::BeginSeq;
      for (auto const &item : node) { emit_node(out, item); }
      out << YAML::EndSeq;
      return;

    case YAML::NodeType::Map:
      if (node.Style() == YAML::EmitterStyle::Flow) { out << YAML::Flow; }
      out << YAML::BeginMap;
      for (auto const &kv : node) {
        out << YAML::Key;
        emit_node(out, kv.first);
        out << YAML::Value;
        emit_node(out, kv.second);
      }
      out << YAML::EndMap;
      return;
  }
}

}  // namespace

manifest_schema_error::manifest_schema_error(std::string field, std::string const &message)
    : std::runtime_error{ "manifest: " + field + ": " + message }, field_{ std::move(field) } {}

bool dependency::available_for(std::string_view stack) const {
  return std::ranges::find(cf_stacks, stack) != cf_stacks.end();
}

manifest_document::manifest_document(YAML::Node root) : root_{ std::move(root) } {
  if (!root_.IsMap()) {
    throw manifest_schema_error("manifest", "expected a mapping, got " + describe(root_));
  }
}

manifest_document manifest_document::load(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  try {
    return manifest_document{ YAML::Load(std::string(bytes.begin(), bytes.end())) };
  } catch (YAML::Exception const &e) {
    throw std::runtime_error("manifest: failed to parse " + path.string() + ": " + e.what());
  }
}

manifest_document manifest_document::parse(std::string_view yaml) {
  try {
    return manifest_document{ YAML::Load(std::string{ yaml }) };
  } catch (YAML::Exception const &e) {
    throw std::runtime_error(std::string("manifest: failed to parse document: ") + e.what());
  }
}

std::string manifest_document::dump() const {
  YAML::Emitter emitter;
  emit_node(emitter, root_);
  if (!emitter.good()) {
    throw std::runtime_error("manifest: failed to emit document: " +
                             emitter.GetLastError());
  }

  std::string result{ emitter.c_str() };
  result += '\n';
  return result;
}

void manifest_document::save(std::filesystem::path const &path) const {
  util_write_file(path, dump());
}

manifest_view manifest_view::from_document(manifest_document const &doc) {
  YAML::Node const &root{ doc.root() };

  manifest_view view;
  view.language = required_scalar(root, "language", "language");
  view.pre_package = optional_scalar(root, "pre_package", "pre_package");

  YAML::Node const include_files{ root["include_files"] };
  view.include_files = (include_files && !include_files.IsNull())
                           ? scalar_list(root, "include_files", "include_files")
                           : scalar_list(root, "included_files", "included_files");

  YAML::Node const deps{ optional_sequence(root, "dependencies", "dependencies") };
  for (std::size_t i{ 0 }; i < deps.size(); ++i) {
    view.dependencies.push_back(
        parse_dependency(deps[i], "dependencies[" + std::to_string(i) + "]"));
  }

  YAML::Node const defaults{ optional_sequence(root, "default_versions", "default_versions") };
  for (std::size_t i{ 0 }; i < defaults.size(); ++i) {
    view.default_versions.push_back(
        parse_default_version(defaults[i], "default_versions[" + std::to_string(i) + "]"));
  }

  return view;
}

std::vector<std::string> manifest_view::stacks() const {
  std::vector<std::string> result;
  for (auto const &dep : dependencies) {
    for (auto const &stack : dep.cf_stacks) {
      if (std::ranges::find(result, stack) == result.end()) { result.push_back(stack); }
    }
  }
  return result;
}

std::filesystem::path manifest_path(std::filesystem::path const &buildpack_dir) {
  return buildpack_dir / kManifestFileName;
}

}  // namespace bpack
