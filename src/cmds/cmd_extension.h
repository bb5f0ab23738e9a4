#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace bpack {

class cmd_extension : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_extension> {
    std::filesystem::path source_dir{ "." };
    std::string version;
    bool cached{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_extension(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace bpack
