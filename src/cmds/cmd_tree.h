#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace graft {

class dependency_graph;

class cmd_tree : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_tree> {
    std::filesystem::path graph_file;
    std::vector<std::string> scopes;  // qualified names; all scopes when empty
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_tree(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

  // Indented rendering of one scope's reference tree. Throws std::out_of_range for
  // unknown scopes.
  static std::string render(dependency_graph const &graph, std::string const &scope);

 private:
  cfg cfg_;
};

}  // namespace graft
