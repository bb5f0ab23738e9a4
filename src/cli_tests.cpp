#include "cli.h"

#include "platform.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

bpack::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return bpack::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "bpack" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("subcommand") {
    auto const parsed{ parse({ "bpack", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<bpack::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("-v flag") {
    auto const parsed{ parse({ "bpack", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<bpack::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_package") {
  auto const src{ bpack::platform::make_temp_dir("bpack-cli-test-") };

  SUBCASE("all options") {
    auto const parsed{ parse({ "bpack",
                               "--cache-root",
                               "/tmp/bpack-cache",
                               "package",
                               "--source",
                               src.string(),
                               "--version",
                               "1.2.3",
                               "--stack",
                               "cflinuxfs3",
                               "--cached" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<bpack::cmd_package::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->source_dir == src);
    CHECK(cfg->version == "1.2.3");
    CHECK(cfg->stack == "cflinuxfs3");
    CHECK_FALSE(cfg->any_stack);
    CHECK(cfg->cached);
    REQUIRE(parsed.cache_root.has_value());
    CHECK(*parsed.cache_root == std::filesystem::path{ "/tmp/bpack-cache" });
  }

  SUBCASE("defaults") {
    auto const parsed{
      parse({ "bpack", "package", "--version", "2.0", "--stack", "cflinuxfs4" })
    };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<bpack::cmd_package::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->source_dir == std::filesystem::path{ "." });
    CHECK_FALSE(cfg->cached);
    CHECK_FALSE(parsed.cache_root.has_value());
  }

  SUBCASE("any stack") {
    auto const parsed{ parse({ "bpack", "package", "--version", "2.0", "--any-stack" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<bpack::cmd_package::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->any_stack);
    CHECK(cfg->stack.empty());
  }

  SUBCASE("stack or any-stack is required") {
    auto const parsed{ parse({ "bpack", "package", "--version", "2.0" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("--any-stack") != std::string::npos);
  }

  SUBCASE("stack and any-stack are exclusive") {
    auto const parsed{ parse(
        { "bpack", "package", "--version", "2.0", "--stack", "s", "--any-stack" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  SUBCASE("version is required") {
    auto const parsed{ parse({ "bpack", "package", "--stack", "cflinuxfs3" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  SUBCASE("source must exist") {
    auto const parsed{ parse({ "bpack",
                               "package",
                               "--source",
                               (src / "missing").string(),
                               "--version",
                               "1",
                               "--any-stack" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  std::error_code ec;
  std::filesystem::remove_all(src, ec);
}

TEST_CASE("cli_parse: cmd_extension") {
  auto const parsed{ parse({ "bpack", "extension", "--version", "0.9", "--cached" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<bpack::cmd_extension::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  CHECK(cfg->version == "0.9");
  CHECK(cfg->cached);
}

TEST_CASE("cli_parse: verbosity") {
  SUBCASE("default") {
    auto const parsed{ parse({ "bpack", "version" }) };
    REQUIRE(parsed.verbosity.has_value());
    CHECK(parsed.verbosity == bpack::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
  }

  SUBCASE("--verbose") {
    auto const parsed{ parse({ "bpack", "--verbose", "version" }) };
    REQUIRE(parsed.verbosity.has_value());
    CHECK(parsed.verbosity == bpack::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }
}

TEST_CASE("cli_parse: unknown subcommand") {
  auto const parsed{ parse({ "bpack", "frobnicate" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}
