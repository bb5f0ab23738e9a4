#include "zip_archive.h"

#include "platform.h"
#include "util.h"

#include <doctest/doctest.h>

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct zip_member {
  std::string name;
  std::string content;
  mode_t perm;
  time_t mtime;
};

std::vector<zip_member> read_zip(fs::path const &path) {
  std::unique_ptr<archive, decltype(&archive_read_free)> reader{ archive_read_new(),
                                                                 &archive_read_free };
  REQUIRE(reader);
  archive_read_support_format_zip(reader.get());
  REQUIRE(archive_read_open_filename(reader.get(), path.c_str(), 10240) == ARCHIVE_OK);

  std::vector<zip_member> members;
  archive_entry *entry{ nullptr };
  while (archive_read_next_header(reader.get(), &entry) == ARCHIVE_OK) {
    zip_member m{ .name = archive_entry_pathname(entry),
                  .content = {},
                  .perm = archive_entry_perm(entry),
                  .mtime = archive_entry_mtime(entry) };

    char buf[4096];
    la_ssize_t n;
    while ((n = archive_read_data(reader.get(), buf, sizeof(buf))) > 0) {
      m.content.append(buf, static_cast<std::size_t>(n));
    }
    REQUIRE(n == 0);
    members.push_back(std::move(m));
  }
  return members;
}

struct zip_fixture {
  zip_fixture() : dir{ bpack::platform::make_temp_dir("bpack-zip-test-") } {}
  ~zip_fixture() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  fs::path write(fs::path const &rel, std::string_view content) const {
    fs::create_directories((dir / rel).parent_path());
    bpack::util_write_file(dir / rel, content);
    return dir / rel;
  }

  std::vector<fs::path> listing() const {
    std::vector<fs::path> names;
    for (auto const &e : fs::directory_iterator(dir)) { names.push_back(e.path().filename()); }
    return names;
  }

  fs::path dir;
};

}  // namespace

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build writes entries with given names") {
  auto const x{ write("src/x.txt", "contents of x") };
  auto const y{ write("src/y.txt", "contents of y, a little longer") };
  auto const archive_path{ dir / "out.zip" };

  bpack::zip_archive_build(archive_path,
                           { { .name = "a.txt", .path = x }, { .name = "b/c.txt", .path = y } });

  auto const members{ read_zip(archive_path) };
  REQUIRE(members.size() == 2);
  CHECK(members[0].name == "a.txt");
  CHECK(members[0].content == "contents of x");
  CHECK(members[1].name == "b/c.txt");
  CHECK(members[1].content == "contents of y, a little longer");
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build uses deflate compression") {
  auto const x{ write("big.txt", std::string(8192, 'z')) };
  auto const archive_path{ dir / "deflate.zip" };

  bpack::zip_archive_build(archive_path, { { .name = "big.txt", .path = x } });

  auto const bytes{ bpack::util_load_file(archive_path) };
  REQUIRE(bytes.size() > 10);
  CHECK(bytes[0] == 'P');
  CHECK(bytes[1] == 'K');
  CHECK(bytes[2] == 3);
  CHECK(bytes[3] == 4);
  // local file header: compression method at offset 8, 8 == deflate
  CHECK((bytes[8] | (bytes[9] << 8)) == 8);
  CHECK(bytes.size() < 8192);
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build keeps caller order and duplicates") {
  auto const x{ write("x", "x") };
  auto const y{ write("y", "y") };
  auto const archive_path{ dir / "order.zip" };

  bpack::zip_archive_build(archive_path,
                           { { .name = "z-last-alphabetically", .path = x },
                             { .name = "a-first-alphabetically", .path = y },
                             { .name = "z-last-alphabetically", .path = y } });

  auto const members{ read_zip(archive_path) };
  REQUIRE(members.size() == 3);
  CHECK(members[0].name == "z-last-alphabetically");
  CHECK(members[1].name == "a-first-alphabetically");
  CHECK(members[2].name == "z-last-alphabetically");
  CHECK(members[2].content == "y");
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build records permissions and mtime") {
  auto const script{ write("bin/compile", "#!/bin/sh\n") };
  fs::permissions(script,
                  fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                      fs::perms::others_read | fs::perms::others_exec,
                  fs::perm_options::replace);

  auto const stamp{ fs::file_time_type::clock::now() - std::chrono::hours(48) };
  fs::last_write_time(script, stamp);

  struct stat st{};
  REQUIRE(::stat(script.c_str(), &st) == 0);

  auto const archive_path{ dir / "perm.zip" };
  bpack::zip_archive_build(archive_path, { { .name = "bin/compile", .path = script } });

  auto const members{ read_zip(archive_path) };
  REQUIRE(members.size() == 1);
  CHECK(members[0].perm == 0755);
  // zip stores DOS time at 2-second granularity; extended timestamps are exact
  CHECK(std::abs(static_cast<long>(members[0].mtime - st.st_mtim.tv_sec)) <= 2);
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build overwrites an existing archive") {
  auto const archive_path{ dir / "out.zip" };
  bpack::util_write_file(archive_path, "not a zip");
  auto const x{ write("x.txt", "fresh") };

  bpack::zip_archive_build(archive_path, { { .name = "x.txt", .path = x } });

  auto const members{ read_zip(archive_path) };
  REQUIRE(members.size() == 1);
  CHECK(members[0].content == "fresh");
  CHECK((fs::status(archive_path).permissions() & fs::perms::others_read) ==
        fs::perms::others_read);
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build leaves no temp file on success") {
  auto const x{ write("x.txt", "x") };
  bpack::zip_archive_build(dir / "out.zip", { { .name = "x.txt", .path = x } });

  auto names{ listing() };
  std::ranges::sort(names);
  CHECK(names == std::vector<fs::path>{ "out.zip", "x.txt" });
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build publishes nothing on failure") {
  auto const x{ write("x.txt", "x") };
  auto const archive_path{ dir / "out.zip" };

  CHECK_THROWS(bpack::zip_archive_build(
      archive_path,
      { { .name = "x.txt", .path = x }, { .name = "missing", .path = dir / "missing" } }));

  CHECK_FALSE(fs::exists(archive_path));
  CHECK(listing() == std::vector<fs::path>{ "x.txt" });
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build preserves previous archive on failure") {
  auto const archive_path{ dir / "keep.zip" };
  bpack::util_write_file(archive_path, "previous");

  CHECK_THROWS(bpack::zip_archive_build(archive_path,
                                        { { .name = "d", .path = dir / "no-such-file" } }));

  auto const bytes{ bpack::util_load_file(archive_path) };
  CHECK(std::string(bytes.begin(), bytes.end()) == "previous");
}

TEST_CASE_FIXTURE(zip_fixture, "zip_archive_build rejects directories as sources") {
  fs::create_directories(dir / "subdir");
  CHECK_THROWS_AS(bpack::zip_archive_build(dir / "out.zip",
                                           { { .name = "subdir", .path = dir / "subdir" } }),
                  std::runtime_error);
  CHECK_FALSE(fs::exists(dir / "out.zip"));
}

TEST_CASE("zip_archive_build fails when destination directory is missing") {
  CHECK_THROWS(bpack::zip_archive_build("/nonexistent/bpack/dir/out.zip", {}));
}
