#include "stage.h"

#include "platform.h"
#include "util.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

struct stage_fixture {
  stage_fixture() : src{ bpack::platform::make_temp_dir("bpack-stage-src-") } {}

  ~stage_fixture() {
    std::error_code ec;
    fs::remove_all(src, ec);
    if (!staged.empty()) { fs::remove_all(staged, ec); }
  }

  void write(fs::path const &rel, std::string_view content) const {
    fs::create_directories((src / rel).parent_path());
    bpack::util_write_file(src / rel, content);
  }

  std::string read_staged(fs::path const &rel) const {
    auto const bytes{ bpack::util_load_file(staged / rel) };
    return std::string(bytes.begin(), bytes.end());
  }

  fs::path src;
  fs::path staged;
};

}  // namespace

TEST_CASE("stage_is_excluded matches vcs and test directories only") {
  CHECK(bpack::stage_is_excluded(".git"));
  CHECK(bpack::stage_is_excluded("tests"));
  CHECK_FALSE(bpack::stage_is_excluded("test"));
  CHECK_FALSE(bpack::stage_is_excluded(".github"));
  CHECK_FALSE(bpack::stage_is_excluded("bin"));
}

TEST_CASE_FIXTURE(stage_fixture, "stage_directory copies files, dirs and symlinks") {
  write("manifest.yml", "language: ruby\n");
  write("bin/compile", "#!/bin/sh\necho compile\n");
  fs::create_symlink("compile", src / "bin" / "detect");
  fs::create_directories(src / "empty_dir");

  staged = bpack::stage_directory(src);

  CHECK(staged != src);
  CHECK(fs::is_directory(staged));
  CHECK(staged.filename().string().rfind("bpack-stage-", 0) == 0);
  CHECK(read_staged("manifest.yml") == "language: ruby\n");
  CHECK(read_staged("bin/compile") == "#!/bin/sh\necho compile\n");
  CHECK(fs::is_directory(staged / "empty_dir"));

  REQUIRE(fs::is_symlink(staged / "bin" / "detect"));
  CHECK(fs::read_symlink(staged / "bin" / "detect") == fs::path("compile"));
}

TEST_CASE_FIXTURE(stage_fixture, "stage_directory skips .git and tests at any depth") {
  write("README.md", "readme");
  write(".git/HEAD", "ref: refs/heads/main\n");
  write("tests/unit_test.sh", "exit 0\n");
  write("lib/tests/nested.rb", "nested");
  write("lib/.git/config", "[core]\n");
  write("lib/helper.rb", "helper");
  write("lib/tests.rb", "not a directory named tests");

  staged = bpack::stage_directory(src);

  CHECK(fs::exists(staged / "README.md"));
  CHECK(fs::exists(staged / "lib" / "helper.rb"));
  CHECK_FALSE(fs::exists(staged / ".git"));
  CHECK_FALSE(fs::exists(staged / "tests"));
  CHECK_FALSE(fs::exists(staged / "lib" / "tests"));
  CHECK_FALSE(fs::exists(staged / "lib" / ".git"));
  CHECK(fs::exists(staged / "lib" / "tests.rb"));
}

TEST_CASE_FIXTURE(stage_fixture, "stage_directory preserves permission bits") {
  write("bin/release", "#!/bin/sh\n");
  write("config.yml", "x: 1\n");
  fs::permissions(src / "bin" / "release",
                  fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                  fs::perm_options::replace);
  fs::permissions(src / "config.yml",
                  fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace);
  fs::permissions(src / "bin",
                  fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                      fs::perms::others_read | fs::perms::others_exec,
                  fs::perm_options::replace);

  staged = bpack::stage_directory(src);

  CHECK(fs::status(staged / "bin" / "release").permissions() ==
        (fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec));
  CHECK(fs::status(staged / "config.yml").permissions() ==
        (fs::perms::owner_read | fs::perms::owner_write));
  CHECK(fs::status(staged / "bin").permissions() == fs::status(src / "bin").permissions());
}

TEST_CASE_FIXTURE(stage_fixture, "stage_directory populates read-only directories") {
  write("ro/file.txt", "locked");
  fs::permissions(src / "ro",
                  fs::perms::owner_read | fs::perms::owner_exec,
                  fs::perm_options::replace);

  staged = bpack::stage_directory(src);

  CHECK(read_staged("ro/file.txt") == "locked");
  CHECK(fs::status(staged / "ro").permissions() ==
        (fs::perms::owner_read | fs::perms::owner_exec));

  fs::permissions(src / "ro", fs::perms::owner_all, fs::perm_options::replace);
  fs::permissions(staged / "ro", fs::perms::owner_all, fs::perm_options::replace);
}

TEST_CASE_FIXTURE(stage_fixture, "scoped_dir_cleanup removes staged read-only directories") {
  write("ro/nested/file.txt", "locked");
  fs::permissions(src / "ro" / "nested",
                  fs::perms::owner_read | fs::perms::owner_exec,
                  fs::perm_options::replace);
  fs::permissions(src / "ro",
                  fs::perms::owner_read | fs::perms::owner_exec,
                  fs::perm_options::replace);

  fs::path staged_path;
  {
    bpack::scoped_dir_cleanup const cleanup{ bpack::stage_directory(src) };
    staged_path = cleanup.path();
    REQUIRE(fs::is_regular_file(staged_path / "ro" / "nested" / "file.txt"));
    CHECK(fs::status(staged_path / "ro").permissions() ==
          (fs::perms::owner_read | fs::perms::owner_exec));
  }
  CHECK_FALSE(fs::exists(staged_path));

  fs::permissions(src / "ro", fs::perms::owner_all, fs::perm_options::replace);
  fs::permissions(src / "ro" / "nested", fs::perms::owner_all, fs::perm_options::replace);
}

TEST_CASE_FIXTURE(stage_fixture, "stage_directory produces distinct copies per call") {
  write("a.txt", "a");
  staged = bpack::stage_directory(src);
  auto const second{ bpack::stage_directory(src) };

  CHECK(second != staged);
  CHECK(fs::exists(second / "a.txt"));
  fs::remove_all(second);
}

TEST_CASE("stage_directory rejects missing source") {
  CHECK_THROWS_AS(bpack::stage_directory("/nonexistent/bpack/source/dir"),
                  std::runtime_error);
}
