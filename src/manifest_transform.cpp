#include "manifest_transform.h"

#include "dependency_cache.h"
#include "manifest.h"
#include "tui.h"

#include <string>

namespace bpack {

std::vector<file_entry> manifest_transform(std::filesystem::path const &staged_dir,
                                           std::string_view stack,
                                           bool include_cache,
                                           std::filesystem::path const &cache_root) {
  auto const path{ manifest_path(staged_dir) };
  auto doc{ manifest_document::load(path) };
  auto const view{ manifest_view::from_document(doc) };

  std::vector<file_entry> files;
  files.reserve(view.include_files.size());
  for (auto const &name : view.include_files) {
    files.push_back(file_entry{ .name = name, .path = staged_dir / name });
  }

  if (!stack.empty()) { doc.root()["stack"] = std::string{ stack }; }

  YAML::Node retained{ YAML::NodeType::Sequence };
  if (!view.dependencies.empty()) {
    YAML::Node raw_deps{ doc.root()["dependencies"] };

    for (size_t i{ 0 }; i < view.dependencies.size(); ++i) {
      auto const &dep{ view.dependencies[i] };
      if (!stack.empty() && !dep.available_for(stack)) {
        tui::debug("transform: dropping %s (not built for %s)",
                   dep.uri.c_str(),
                   std::string{ stack }.c_str());
        continue;
      }

      YAML::Node raw{ raw_deps[i] };
      if (include_cache) {
        auto const cached{ fetch_dependency(dep, cache_root) };
        raw["file"] = cached.name;
        files.push_back(cached);
      }
      retained.push_back(raw);
    }
  }

  // Manifests without a dependencies key keep that shape.
  YAML::Node const &root{ doc.root() };
  if (root["dependencies"] || !view.dependencies.empty()) {
    doc.root()["dependencies"] = retained;
  }

  doc.save(path);

  tui::debug("transform: %zu of %zu dependencies retained, %zu archive entries",
             retained.size(),
             view.dependencies.size(),
             files.size());
  return files;
}

}  // namespace bpack
