#pragma once

#include "identifier.h"
#include "issue.h"
#include "linkage.h"

#include <concepts>
#include <vector>

namespace graft {

// Adapter between an ecosystem's native tree type and the graph builder. All four
// queries must be free of side effects; native node identity is its address.
template <typename H>
concept dependency_handler = requires(H const &h, typename H::node_t const &n) {
  typename H::node_t;
  { h.identifier_for(n) } -> std::convertible_to<identifier>;
  { h.linkage_for(n) } -> std::convertible_to<linkage>;
  { h.children_for(n) } -> std::convertible_to<std::vector<typename H::node_t const *>>;
  { h.issues_for(n) } -> std::convertible_to<std::vector<issue>>;
};

}  // namespace graft
