#include "cli.h"
#include "libcurl_util.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  bpack::tui::init();

  auto args{ bpack::cli_parse(argc, argv) };
  bpack::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      bpack::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    bpack::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  try {
    bpack::libcurl_ensure_initialized();

    auto cmd{ std::visit(
        [&args](auto const &cfg) { return bpack::cmd::create(cfg, args.cache_root); },
        *args.cmd_cfg) };
    cmd->execute();
  } catch (std::exception const &ex) {
    bpack::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
