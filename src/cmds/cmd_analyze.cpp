#include "cmd_analyze.h"

#include "analyzer.h"
#include "analyzer_config.h"
#include "graph_json.h"
#include "termination.h"
#include "tree_json.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace graft {

void cmd_analyze::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("analyze",
                                "Build a dependency graph from dependency tree files") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("trees", cfg_ptr->tree_files, "Dependency tree JSON files, one per project")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--config", cfg_ptr->config_path, "Path to graft.lua");
  sub->add_option("--output,-o",
                  cfg_ptr->output_path,
                  "Write graph JSON here instead of stdout");
  sub->add_option("--jobs,-j", cfg_ptr->jobs, "Projects analyzed in parallel")
      ->check(CLI::PositiveNumber);
  sub->add_option("--exclude-scope",
                  cfg_ptr->exclude_scopes,
                  "Regular expression of scope names to skip (repeatable)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_analyze::cmd_analyze(cmd_analyze::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_analyze::execute() {
  std::unique_ptr<analyzer_config> config;
  if (auto const path{ analyzer_config::find_config_path(cfg_.config_path) }) {
    config = analyzer_config::load(*path);
  } else {
    tui::debug("No %s found, using defaults", analyzer_config::k_file_name);
    config = std::make_unique<analyzer_config>();
  }

  if (cfg_.jobs) { config->parallelism = *cfg_.jobs; }
  for (auto const &pattern : cfg_.exclude_scopes) { config->excludes.add(pattern); }

  auto const result{ tree_json_analyze(cfg_.tree_files, *config, termination_flag()) };
  auto const json{ graph_to_json(*result.graph, result.packages) };

  if (cfg_.output_path) {
    util_write_file(*cfg_.output_path, json);
    tui::info("Wrote %s", cfg_.output_path->string().c_str());
  } else {
    tui::print_stdout("%s\n", json.c_str());
  }

  report(result);
  return !result.has_errors();
}

void cmd_analyze::report(analyzer_result const &result) const {
  tui::info("Analyzed %zu project(s): %zu node(s), %zu scope(s), %zu package(s)",
            result.projects.size(),
            result.graph->nodes().size(),
            result.graph->scopes().size(),
            result.packages.size());

  for (auto const &project : result.projects) {
    auto const name{ project.project_id.to_coordinates() };
    for (auto const &i : project.issues) {
      switch (i.severity) {
        case severity::hint:
          tui::debug("%s: [%s] %s", name.c_str(), i.source.c_str(), i.message.c_str());
          break;
        case severity::warning:
          tui::warn("%s: [%s] %s", name.c_str(), i.source.c_str(), i.message.c_str());
          break;
        case severity::error:
          tui::error("%s: [%s] %s", name.c_str(), i.source.c_str(), i.message.c_str());
          break;
      }
    }
  }
}

}  // namespace graft
