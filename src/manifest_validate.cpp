#include "manifest_validate.h"

#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace bpack {

namespace {

std::vector<std::string_view> split_segments(std::string_view s) {
  std::vector<std::string_view> result;
  size_t start{ 0 };
  while (true) {
    auto const dot{ s.find('.', start) };
    result.push_back(s.substr(start, dot == std::string_view::npos ? dot : dot - start));
    if (dot == std::string_view::npos) { return result; }
    start = dot + 1;
  }
}

bool is_wildcard(std::string_view segment) {
  return segment == "x" || segment == "X" || segment == "*";
}

}  // namespace

bool manifest_version_matches(std::string_view pattern, std::string_view version) {
  if (pattern.empty() || version.empty()) { return false; }

  auto const want{ split_segments(pattern) };
  auto const have{ split_segments(version) };

  for (size_t i{ 0 }; i < want.size(); ++i) {
    if (is_wildcard(want[i])) { return true; }
    if (i >= have.size() || want[i] != have[i]) { return false; }
  }
  return want.size() == have.size();
}

void manifest_validate_stack(manifest_view const &view, std::string_view stack) {
  if (stack.empty()) { return; }

  auto const stacks{ view.stacks() };
  if (std::ranges::find(stacks, stack) == stacks.end()) {
    throw std::runtime_error("Stack `" + std::string{ stack } + "` not found in manifest");
  }

  for (auto const &dv : view.default_versions) {
    bool const found{ std::ranges::any_of(view.dependencies, [&](dependency const &dep) {
      return dep.name == dv.name && dep.available_for(stack) &&
             manifest_version_matches(dv.version, dep.version);
    }) };

    if (!found) {
      throw std::runtime_error("No matching default dependency `" + dv.name +
                               "` for stack `" + std::string{ stack } + "`");
    }
    tui::debug("validate: default %s %s available for %s",
               dv.name.c_str(),
               dv.version.c_str(),
               std::string{ stack }.c_str());
  }
}

}  // namespace bpack
