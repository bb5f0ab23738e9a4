#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bpack {

using process_env_t = std::unordered_map<std::string, std::string>;

struct process_result {
  int exit_code;
  std::optional<int> signal;
  std::string output;  // stdout and stderr, interleaved as written
};

struct process_run_cfg {
  std::function<void(std::string_view)> on_output_line;
  std::optional<std::filesystem::path> cwd;
  process_env_t env_overrides;  // applied on top of the current environment
};

// A child process exited unsuccessfully.
class process_error : public std::runtime_error {
 public:
  process_error(std::string const &message, int exit_code, std::string output)
      : std::runtime_error{ message }, exit_code_{ exit_code }, output_{ std::move(output) } {}

  int exit_code() const { return exit_code_; }
  std::string const &output() const { return output_; }

 private:
  int exit_code_;
  std::string output_;
};

// Run argv[0] (searched on PATH when it has no '/') and wait for it. Stdin is
// /dev/null. Never throws for a non-zero exit; throws std::system_error or
// std::runtime_error if the process cannot be started.
process_result process_run(std::vector<std::string> const &argv, process_run_cfg const &cfg);

// As process_run, but a non-zero exit throws process_error naming `what`.
process_result process_run_checked(std::string_view what,
                                   std::vector<std::string> const &argv,
                                   process_run_cfg const &cfg);

}  // namespace bpack
