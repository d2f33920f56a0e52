#include "cmd_tree.h"

#include "dependency_graph.h"
#include "graph_json.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>
#include <string>
#include <utility>

namespace graft {

namespace {

void render_reference(package_reference const &ref, std::string &out) {
  out.append(2 * ref.depth(), ' ');
  out += ref.id().to_coordinates();
  if (linkage_is_project(ref.linkage())) { out += " (project)"; }
  if (ref.is_cycle()) { out += " (cycle)"; }
  if (!ref.issues().empty()) {
    out += " [" + std::to_string(ref.issues().size()) + " issue(s)]";
  }
  out += '\n';

  for (auto const &child : ref.children()) { render_reference(child, out); }
}

}  // namespace

void cmd_tree::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("tree", "Print the dependency trees of a graph file") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("graph", cfg_ptr->graph_file, "Graph JSON written by 'graft analyze'")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("scopes",
                  cfg_ptr->scopes,
                  "Qualified scope names (namespace:name:version:scope); all if omitted");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_tree::cmd_tree(cmd_tree::cfg cfg) : cfg_{ std::move(cfg) } {}

std::string cmd_tree::render(dependency_graph const &graph, std::string const &scope) {
  std::string out{ scope };
  out += " (depth " + std::to_string(graph.dependency_tree_depth(scope)) + ", " +
         std::to_string(graph.scope_package_ids(scope).size()) + " package(s))\n";
  for (auto const &root : graph.reference_tree(scope)) { render_reference(root, out); }
  return out;
}

bool cmd_tree::execute() {
  auto const doc{ graph_from_json(util_load_file(cfg_.graph_file)) };

  auto const scopes{ cfg_.scopes.empty() ? doc.graph->scope_names() : cfg_.scopes };
  for (auto const &scope : scopes) {
    if (!doc.graph->scopes().contains(scope)) {
      tui::error("Unknown scope '%s' in %s", scope.c_str(), cfg_.graph_file.string().c_str());
      return false;
    }
    tui::print_stdout("%s", render(*doc.graph, scope).c_str());
  }
  return true;
}

}  // namespace graft
