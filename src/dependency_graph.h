#pragma once

#include "identifier.h"
#include "issue.h"
#include "linkage.h"
#include "node_table.h"

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace graft {

using scope_map = std::map<std::string, std::vector<node_index>>;

// "namespace:name:version:scope" for the project `project_id`.
std::string qualify_scope(identifier const &project_id, std::string_view scope);

// Strips the three project fields from a qualified scope name. Names with fewer
// fields are returned unchanged.
std::string unqualify_scope(std::string_view qualified);

class dependency_graph;

// Lazily expanded view of one occurrence of a node within a scope's tree. Cheap to
// copy; expansion is pure and may be repeated. An occurrence whose node already
// appears on the path from the scope root is a cycle marker and has no children.
class package_reference {
 public:
  graph_node const &node() const;
  identifier const &id() const { return node().id; }
  graft::linkage linkage() const { return node().linkage; }
  std::vector<issue> const &issues() const { return node().issues; }

  node_index index() const { return index_; }
  bool is_cycle() const { return cycle_; }
  std::size_t depth() const { return depth_; }  // 1 for scope roots

  std::vector<package_reference> children() const;

 private:
  friend class dependency_graph;

  struct path_link {
    node_index index;
    std::shared_ptr<path_link const> parent;
  };

  package_reference(dependency_graph const *graph,
                    node_index index,
                    std::shared_ptr<path_link const> parent,
                    std::size_t depth);

  dependency_graph const *graph_;
  node_index index_;
  std::shared_ptr<path_link const> path_;
  std::size_t depth_;
  bool cycle_;
};

// Immutable output of the builder. Node indices are positions in nodes().
class dependency_graph {
 public:
  // Throws std::runtime_error if a child or scope root refers to a missing node.
  dependency_graph(std::vector<graph_node> nodes, scope_map scopes);

  std::vector<graph_node> const &nodes() const { return nodes_; }
  scope_map const &scopes() const { return scopes_; }

  graph_node const &node(node_index index) const;  // throws std::out_of_range

  // Throw std::out_of_range for unknown scopes.
  std::vector<node_index> const &scope_roots(std::string const &scope) const;
  std::vector<package_reference> reference_tree(std::string const &scope) const;
  std::size_t dependency_tree_depth(std::string const &scope) const;

  // Identifiers of every non-project node reachable from the scope.
  std::set<identifier> scope_package_ids(std::string const &scope) const;

  std::vector<std::string> scope_names() const;

 private:
  std::vector<graph_node> nodes_;
  scope_map scopes_;
};

using dependency_graph_ptr = std::shared_ptr<dependency_graph const>;

}  // namespace graft
