#pragma once

#include "blake3_util.h"
#include "identifier.h"
#include "issue.h"
#include "linkage.h"
#include "util.h"

#include <tbb/concurrent_hash_map.h>

#include <cstddef>
#include <mutex>
#include <set>
#include <vector>

namespace graft {

using node_index = std::size_t;

struct graph_node {
  node_index index;
  identifier id;
  graft::linkage linkage;
  std::vector<issue> issues;
  std::vector<node_index> children;
};

// Structural identity of a node whose children are all interned.
struct fragment {
  identifier id;
  graft::linkage linkage;
  std::vector<node_index> children;
};

struct intern_result {
  node_index index;
  bool inserted;
  std::size_t merged_issues;  // issues appended to an existing node
};

// Deduplicating node store. Indices are dense, assigned in insertion order and never
// reused. Safe for concurrent intern() calls: the lookup and insert for one
// fingerprint form a single atomic step.
class node_table : unmovable {
 public:
  static blake3_t fingerprint(fragment const &f);

  intern_result intern(fragment const &f, std::vector<issue> const &issues);

  // Interns a node that lies on a dependency cycle under a caller-computed `key`
  // (which must never equal a fragment fingerprint). A freshly inserted node has no
  // children until link_children() is called; its index is needed to fingerprint
  // the nodes below it that refer back to it.
  intern_result reserve(blake3_t const &key,
                        identifier const &id,
                        graft::linkage linkage,
                        std::vector<issue> const &issues);

  // Sets the children of a node inserted by reserve(). Throws std::logic_error if
  // the node was not reserved or is already linked, std::out_of_range on a bad index.
  void link_children(node_index index, std::vector<node_index> children);

  std::size_t size() const;
  graph_node node(node_index index) const;  // throws std::out_of_range
  std::vector<graph_node> snapshot() const;
  std::set<identifier> identifiers() const;

 private:
  intern_result reuse(node_index index, identifier const &id, std::vector<issue> const &issues);

  struct fingerprint_compare {
    static std::size_t hash(blake3_t const &key);
    static bool equal(blake3_t const &a, blake3_t const &b) { return a == b; }
  };

  tbb::concurrent_hash_map<blake3_t, node_index, fingerprint_compare> index_;
  mutable std::mutex mutex_;  // guards nodes_; always taken after an index_ accessor
  std::vector<graph_node> nodes_;
  std::set<node_index> reserved_;  // awaiting link_children; guarded by mutex_
};

}  // namespace graft
