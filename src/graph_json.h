#pragma once

#include "dependency_graph.h"
#include "package.h"

#include <string>
#include <string_view>

namespace graft {

// Persisted analysis output:
//   { "nodes":    [ { "index", "id", "linkage", "issues": [...], "children": [...] } ],
//     "scopes":   { "<qualified scope>": [ root indices ] },
//     "packages": [ { "id", "description", ..., "vcs": {...} } ] }
struct graph_document {
  dependency_graph_ptr graph;
  package_map packages;
};

std::string graph_to_json(dependency_graph const &graph,
                          package_map const &packages,
                          bool pretty = true);

// Throws std::runtime_error on malformed input.
graph_document graph_from_json(std::string_view json);

}  // namespace graft
