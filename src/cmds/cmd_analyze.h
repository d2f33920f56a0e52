#pragma once

#include "cmd.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace graft {

struct analyzer_result;

class cmd_analyze : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_analyze> {
    std::vector<std::filesystem::path> tree_files;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> output_path;
    std::optional<std::size_t> jobs;
    std::vector<std::string> exclude_scopes;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_analyze(cfg cfg);

  // Fails only when a project reports an error-severity issue.
  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  void report(analyzer_result const &result) const;

  cfg cfg_;
};

}  // namespace graft
