#include "cli.h"

#include <CLI/CLI.hpp>

#include <string>

namespace bpack {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "bpack - buildpack packager" };

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  std::optional<std::filesystem::path> cache_root;
  app.add_option("--cache-root",
                 cache_root,
                 "Dependency cache directory (defaults to BPACK_CACHE_ROOT or "
                 "~/.buildpack-packager/cache)");

  bool version_flag{ false };
  app.add_flag("-v", version_flag, "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_package::register_cli(app, on_selected);
  cmd_extension::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) {
    args.cli_output = std::string(e.what());
    cmd_cfg.reset();
  }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  args.cache_root = cache_root;

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace bpack
