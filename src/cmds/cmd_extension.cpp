#include "cmd_extension.h"

#include "packager.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace bpack {

void cmd_extension::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("extension",
                                "Package an extension buildpack with buildpack-packager") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--source", cfg_ptr->source_dir, "Buildpack source directory")
      ->check(CLI::ExistingDirectory);
  sub->add_option("--version", cfg_ptr->version, "Buildpack version")->required();
  sub->add_flag("--cached", cfg_ptr->cached, "Build the cached variant");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_extension::cmd_extension(cfg cfg,
                             std::optional<std::filesystem::path> const & /*cli_cache_root*/)
    : cfg_{ std::move(cfg) } {}

void cmd_extension::execute() {
  auto const archive{ package_extension(cfg_.source_dir, cfg_.version, cfg_.cached) };
  tui::print_stdout("%s\n", archive.string().c_str());
}

}  // namespace bpack
