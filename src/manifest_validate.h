#pragma once

#include "manifest.h"

#include <string_view>

namespace bpack {

// Throws std::runtime_error unless `stack` is declared by some dependency and
// every default_versions entry resolves to a dependency available for it. An
// empty stack means "all stacks" and is always valid.
void manifest_validate_stack(manifest_view const &view, std::string_view stack);

// True if `version` satisfies `pattern`: exact, or with x/X/* segments matching
// any remainder ("2.7.x", "2.*", "*").
bool manifest_version_matches(std::string_view pattern, std::string_view version);

}  // namespace bpack
