#include "cmd_package.h"

#include "cmd_common.h"
#include "packager.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace bpack {

void cmd_package::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("package", "Package a buildpack into a zip archive") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--source", cfg_ptr->source_dir, "Buildpack source directory")
      ->check(CLI::ExistingDirectory);
  sub->add_option("--version", cfg_ptr->version, "Buildpack version")->required();
  auto *stack{
    sub->add_option("--stack", cfg_ptr->stack, "Stack to package dependencies for")
  };
  auto *any_stack{ sub->add_flag("--any-stack",
                                 cfg_ptr->any_stack,
                                 "Package dependencies for every stack") };
  stack->excludes(any_stack);
  sub->add_flag("--cached", cfg_ptr->cached, "Bundle dependencies into the archive");
  sub->callback([cfg_ptr, on_selected = std::move(on_selected)] {
    if (cfg_ptr->stack.empty() && !cfg_ptr->any_stack) {
      throw CLI::ValidationError("--stack", "required unless --any-stack is given");
    }
    on_selected(*cfg_ptr);
  });
}

cmd_package::cmd_package(cfg cfg,
                         std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

void cmd_package::execute() {
  package_options const options{ .source_dir = cfg_.source_dir,
                                 .cache_dir = resolve_cache_root(cli_cache_root_),
                                 .version = cfg_.version,
                                 .stack = cfg_.any_stack ? std::string{} : cfg_.stack,
                                 .cached = cfg_.cached };

  tui::debug("package: cache root %s", options.cache_dir.string().c_str());
  auto const archive{ package(options) };
  tui::print_stdout("%s\n", archive.string().c_str());
}

}  // namespace bpack
