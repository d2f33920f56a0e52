#include "dependency_graph_builder.h"

#include <memory>
#include <stdexcept>
#include <string>

namespace graft {

graph_builder_core::graph_builder_core(package_resolver_fn resolver)
    : cache_{ std::move(resolver) } {}

std::shared_lock<std::shared_mutex> graph_builder_core::begin_add(
    char const *operation) const {
  std::shared_lock<std::shared_mutex> lock{ state_mutex_ };
  if (built_) {
    throw std::logic_error(std::string("dependency_graph_builder::") + operation +
                           " called after build()");
  }
  return lock;
}

void graph_builder_core::register_scope(std::string const &qualified_scope) {
  std::lock_guard<std::mutex> lock{ scopes_mutex_ };
  scopes_.try_emplace(qualified_scope);
}

void graph_builder_core::append_root(std::string const &qualified_scope, node_index root) {
  {
    std::lock_guard<std::mutex> lock{ scopes_mutex_ };
    scopes_[qualified_scope].push_back(root);
  }
  GRAFT_TRACE_SCOPE_ROOT_ADDED(qualified_scope, table_.node(root).id.to_coordinates(), root);
}

void graph_builder_core::resolve_into(identifier const &id,
                                      linkage l,
                                      std::vector<issue> &issues) {
  if (linkage_is_project(l)) { return; }
  auto const r{ cache_.resolve(id) };
  if (r.failure) { issues.push_back(*r.failure); }
}

std::vector<std::string> graph_builder_core::scopes_for(identifier const &project_id,
                                                        bool unqualify) const {
  auto const prefix{ qualify_scope(project_id, "") };
  std::vector<std::string> result;

  std::lock_guard<std::mutex> lock{ scopes_mutex_ };
  for (auto it{ scopes_.lower_bound(prefix) };
       it != scopes_.end() && it->first.starts_with(prefix);
       ++it) {
    result.push_back(unqualify ? it->first.substr(prefix.size()) : it->first);
  }
  return result;
}

package_map graph_builder_core::packages() const {
  auto const ids{ table_.identifiers() };
  package_map result;
  for (auto &[id, pkg] : cache_.resolved()) {
    if (ids.contains(id)) { result.emplace(id, pkg); }
  }
  return result;
}

bool graph_builder_core::built() const {
  std::shared_lock<std::shared_mutex> lock{ state_mutex_ };
  return built_;
}

dependency_graph_ptr graph_builder_core::build() {
  std::unique_lock<std::shared_mutex> lock{ state_mutex_ };
  if (built_) { return graph_; }

  scope_map scopes;
  {
    std::lock_guard<std::mutex> scopes_lock{ scopes_mutex_ };
    scopes = scopes_;
  }

  graph_ = std::make_shared<dependency_graph const>(table_.snapshot(), std::move(scopes));
  built_ = true;

  GRAFT_TRACE_GRAPH_BUILT(graph_->nodes().size(), graph_->scopes().size(), packages().size());
  return graph_;
}

}  // namespace graft
