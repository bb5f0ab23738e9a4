#include "manifest_validate.h"

#include <doctest/doctest.h>

#include <stdexcept>

namespace {

bpack::manifest_view make_view() {
  return bpack::manifest_view::from_document(bpack::manifest_document::parse(R"(
language: ruby
default_versions:
  - name: ruby
    version: 2.7.x
  - name: bundler
    version: 2.1.4
dependencies:
  - name: ruby
    version: 2.7.1
    uri: https://example.com/ruby-2.7.1-cflinuxfs3.tgz
    cf_stacks: [cflinuxfs3]
  - name: ruby
    version: 3.0.0
    uri: https://example.com/ruby-3.0.0-cflinuxfs4.tgz
    cf_stacks: [cflinuxfs4]
  - name: bundler
    version: 2.1.4
    uri: https://example.com/bundler-2.1.4.tgz
    cf_stacks: [cflinuxfs3, cflinuxfs4]
)"));
}

}  // namespace

TEST_CASE("manifest_version_matches handles exact versions") {
  CHECK(bpack::manifest_version_matches("2.7.1", "2.7.1"));
  CHECK_FALSE(bpack::manifest_version_matches("2.7.1", "2.7.2"));
  CHECK_FALSE(bpack::manifest_version_matches("2.7", "2.7.1"));
  CHECK_FALSE(bpack::manifest_version_matches("2.7.1", "2.7"));
}

TEST_CASE("manifest_version_matches handles wildcard segments") {
  CHECK(bpack::manifest_version_matches("2.7.x", "2.7.1"));
  CHECK(bpack::manifest_version_matches("2.7.X", "2.7.15"));
  CHECK(bpack::manifest_version_matches("2.*", "2.7.1"));
  CHECK(bpack::manifest_version_matches("*", "9.9.9"));
  CHECK(bpack::manifest_version_matches("2.x", "2.0.0"));
  CHECK_FALSE(bpack::manifest_version_matches("2.7.x", "2.8.0"));
  CHECK_FALSE(bpack::manifest_version_matches("3.x", "2.7.1"));
  CHECK_FALSE(bpack::manifest_version_matches("", "2.7.1"));
  CHECK_FALSE(bpack::manifest_version_matches("2.x", ""));
}

TEST_CASE("manifest_validate_stack accepts empty stack") {
  CHECK_NOTHROW(bpack::manifest_validate_stack(make_view(), ""));
}

TEST_CASE("manifest_validate_stack accepts a stack with all defaults available") {
  CHECK_NOTHROW(bpack::manifest_validate_stack(make_view(), "cflinuxfs3"));
}

TEST_CASE("manifest_validate_stack rejects unknown stacks") {
  CHECK_THROWS_WITH_AS(bpack::manifest_validate_stack(make_view(), "windows2016"),
                       "Stack `windows2016` not found in manifest",
                       std::runtime_error);
}

TEST_CASE("manifest_validate_stack rejects stacks missing a default version") {
  // cflinuxfs4 only carries ruby 3.0.0, which does not satisfy 2.7.x
  CHECK_THROWS_WITH_AS(bpack::manifest_validate_stack(make_view(), "cflinuxfs4"),
                       "No matching default dependency `ruby` for stack `cflinuxfs4`",
                       std::runtime_error);
}

TEST_CASE("manifest_validate_stack ignores defaults when none are declared") {
  auto view{ make_view() };
  view.default_versions.clear();
  CHECK_NOTHROW(bpack::manifest_validate_stack(view, "cflinuxfs4"));
}
