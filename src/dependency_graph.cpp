#include "dependency_graph.h"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace graft {

std::string qualify_scope(identifier const &project_id, std::string_view scope) {
  std::string result{ project_id.namespace_ };
  result.append(":").append(project_id.name);
  result.append(":").append(project_id.version);
  result.append(":").append(scope);
  return result;
}

std::string unqualify_scope(std::string_view qualified) {
  std::size_t pos{ 0 };
  for (int i{ 0 }; i < 3; ++i) {
    auto const colon{ qualified.find(':', pos) };
    if (colon == std::string_view::npos) { return std::string(qualified); }
    pos = colon + 1;
  }
  return std::string(qualified.substr(pos));
}

package_reference::package_reference(dependency_graph const *graph,
                                     node_index index,
                                     std::shared_ptr<path_link const> parent,
                                     std::size_t depth)
    : graph_{ graph }, index_{ index }, depth_{ depth }, cycle_{ false } {
  for (auto const *link{ parent.get() }; link; link = link->parent.get()) {
    if (link->index == index) {
      cycle_ = true;
      break;
    }
  }
  path_ = std::make_shared<path_link const>(path_link{ index, std::move(parent) });
}

graph_node const &package_reference::node() const { return graph_->node(index_); }

std::vector<package_reference> package_reference::children() const {
  std::vector<package_reference> result;
  if (cycle_) { return result; }

  auto const &child_indices{ node().children };
  result.reserve(child_indices.size());
  for (auto const child : child_indices) {
    result.push_back(package_reference{ graph_, child, path_, depth_ + 1 });
  }
  return result;
}

dependency_graph::dependency_graph(std::vector<graph_node> nodes, scope_map scopes)
    : nodes_{ std::move(nodes) }, scopes_{ std::move(scopes) } {
  for (std::size_t i{ 0 }; i < nodes_.size(); ++i) {
    if (nodes_[i].index != i) {
      throw std::runtime_error("Invalid dependency graph: node at position " +
                               std::to_string(i) + " has index " +
                               std::to_string(nodes_[i].index));
    }
    for (auto const child : nodes_[i].children) {
      if (child >= nodes_.size()) {
        throw std::runtime_error("Invalid dependency graph: node " + std::to_string(i) +
                                 " (" + nodes_[i].id.to_coordinates() +
                                 ") has a dangling child reference");
      }
    }
  }

  for (auto const &[name, roots] : scopes_) {
    for (auto const root : roots) {
      if (root >= nodes_.size()) {
        throw std::runtime_error("Invalid dependency graph: scope '" + name +
                                 "' refers to missing node " + std::to_string(root));
      }
    }
  }
}

graph_node const &dependency_graph::node(node_index index) const {
  if (index >= nodes_.size()) {
    throw std::out_of_range("dependency_graph: no node with index " + std::to_string(index));
  }
  return nodes_[index];
}

std::vector<node_index> const &dependency_graph::scope_roots(std::string const &scope) const {
  auto const it{ scopes_.find(scope) };
  if (it == scopes_.end()) {
    throw std::out_of_range("dependency_graph: unknown scope '" + scope + "'");
  }
  return it->second;
}

std::vector<package_reference> dependency_graph::reference_tree(
    std::string const &scope) const {
  auto const &roots{ scope_roots(scope) };
  std::vector<package_reference> result;
  result.reserve(roots.size());
  for (auto const root : roots) { result.push_back(package_reference{ this, root, {}, 1 }); }
  return result;
}

namespace {

struct depth_walker {
  std::vector<graph_node> const &nodes;
  std::vector<bool> on_path;
  std::unordered_map<node_index, std::size_t> memo;  // depths that did not touch a cycle

  // Returns (depth, touched_cycle).
  std::pair<std::size_t, bool> walk(node_index index) {
    if (on_path[index]) { return { 1, true }; }
    if (auto const it{ memo.find(index) }; it != memo.end()) { return { it->second, false }; }

    on_path[index] = true;
    std::size_t deepest_child{ 0 };
    bool touched{ false };
    for (auto const child : nodes[index].children) {
      auto const [depth, child_touched] = walk(child);
      deepest_child = std::max(deepest_child, depth);
      touched = touched || child_touched;
    }
    on_path[index] = false;

    std::size_t const depth{ deepest_child + 1 };
    if (!touched) { memo.emplace(index, depth); }
    return { depth, touched };
  }
};

}  // namespace

std::size_t dependency_graph::dependency_tree_depth(std::string const &scope) const {
  depth_walker walker{ .nodes = nodes_,
                       .on_path = std::vector<bool>(nodes_.size(), false),
                       .memo = {} };
  std::size_t result{ 0 };
  for (auto const root : scope_roots(scope)) {
    result = std::max(result, walker.walk(root).first);
  }
  return result;
}

std::set<identifier> dependency_graph::scope_package_ids(std::string const &scope) const {
  std::set<identifier> result;
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<node_index> pending{ scope_roots(scope) };

  while (!pending.empty()) {
    auto const index{ pending.back() };
    pending.pop_back();
    if (visited[index]) { continue; }
    visited[index] = true;

    auto const &n{ nodes_[index] };
    if (!linkage_is_project(n.linkage)) { result.insert(n.id); }
    for (auto const child : n.children) { pending.push_back(child); }
  }
  return result;
}

std::vector<std::string> dependency_graph::scope_names() const {
  std::vector<std::string> result;
  result.reserve(scopes_.size());
  for (auto const &[name, roots] : scopes_) { result.push_back(name); }
  return result;
}

}  // namespace graft
