#pragma once

#include "blake3_util.h"
#include "dependency_graph.h"
#include "dependency_handler.h"
#include "issue.h"
#include "node_table.h"
#include "package.h"
#include "package_cache.h"
#include "trace.h"
#include "util.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graft {

// State shared by every builder instantiation: the node table, the package cache,
// the scope map and the Accumulating -> Built lifecycle. One instance per analysis
// run; add_dependency may be called from many threads at once.
class graph_builder_core : unmovable {
 public:
  explicit graph_builder_core(package_resolver_fn resolver);

  // Sorted names of the scopes registered for `project_id`.
  std::vector<std::string> scopes_for(identifier const &project_id,
                                      bool unqualify = true) const;

  // Resolved packages whose identifier occurs in at least one node.
  package_map packages() const;

  // Freezes nodes and scopes. Idempotent; later calls return the same graph.
  dependency_graph_ptr build();
  bool built() const;

  std::size_t node_count() const { return table_.size(); }
  package_cache &cache() { return cache_; }

 protected:
  // Shared lock held for the whole of one add_dependency call; throws
  // std::logic_error once build() has run.
  std::shared_lock<std::shared_mutex> begin_add(char const *operation) const;

  void register_scope(std::string const &qualified_scope);
  void append_root(std::string const &qualified_scope, node_index root);

  // Adds the resolution failure for `id` (if any) to `issues`. Project nodes are
  // not resolved.
  void resolve_into(identifier const &id, linkage l, std::vector<issue> &issues);

  node_table table_;

 private:
  package_cache cache_;

  mutable std::shared_mutex state_mutex_;
  bool built_{ false };
  dependency_graph_ptr graph_;

  mutable std::mutex scopes_mutex_;
  scope_map scopes_;
};

// Facade used by ecosystem adapters. Walks each native tree post-order, interning
// every node after its children so that identical subtrees collapse to one node.
template <dependency_handler Handler>
class dependency_graph_builder : public graph_builder_core {
 public:
  using node_t = typename Handler::node_t;

  dependency_graph_builder(Handler handler, package_resolver_fn resolver)
      : graph_builder_core{ std::move(resolver) }, handler_{ std::move(handler) } {}

  // Interns the tree below `root` and appends it to `qualified_scope`. Returns the
  // root's node index. When `issues` is given, the issues of every visited node are
  // appended to it, skipping exact duplicates.
  node_index add_dependency(std::string const &qualified_scope,
                            node_t const &root,
                            std::vector<issue> *issues = nullptr) {
    auto const lock{ begin_add("add_dependency") };
    traversal t{ .builder = *this };
    auto const index{ t.finalize_root(t.visit(root)) };
    append_root(qualified_scope, index);
    if (issues) { issue_merge_unique(*issues, t.issues); }
    return index;
  }

  // Registers the scope even when `roots` is empty, then adds each root in order.
  std::vector<node_index> add_dependencies(identifier const &project_id,
                                           std::string const &scope_name,
                                           std::vector<node_t const *> const &roots,
                                           std::vector<issue> *issues = nullptr) {
    auto const qualified{ qualify_scope(project_id, scope_name) };
    {
      auto const lock{ begin_add("add_dependencies") };
      register_scope(qualified);
    }

    std::vector<node_index> result;
    result.reserve(roots.size());
    for (auto const *root : roots) {
      result.push_back(add_dependency(qualified, *root, issues));
    }
    return result;
  }

  Handler const &handler() const { return handler_; }

 private:
  struct pending_node;

  // A child as seen by its parent. Exactly one of: an interned index, a subtree that
  // still refers back to an open ancestor, or a reference back to such an ancestor.
  struct child_ref {
    node_index index{ 0 };
    std::shared_ptr<pending_node> pending;
    node_t const *back{ nullptr };
  };

  // A node on a cycle. It cannot be fingerprinted until every ancestor it refers back
  // to has an index, so it waits for the outermost one to finish.
  struct pending_node {
    node_t const *native{ nullptr };
    identifier id;
    graft::linkage linkage{ graft::linkage::dynamic };
    std::vector<issue> issues;
    std::vector<child_ref> children;
    std::set<node_t const *> open;  // ancestors referred back to from below
    bool is_target{ false };        // referred back to from its own subtree
    std::optional<node_index> index;
  };

  struct path_entry {
    identifier id;
    bool targeted{ false };
  };

  // State of one add_dependency call.
  struct traversal {
    dependency_graph_builder &builder;
    std::unordered_map<node_t const *, node_index> done;
    std::unordered_map<node_t const *, std::shared_ptr<pending_node>> waiting;
    std::unordered_map<node_t const *, path_entry> path;
    std::unordered_map<node_t const *, node_index> heads;  // cycle nodes being linked
    std::vector<issue> issues;

    child_ref visit(node_t const &n) {
      if (auto const it{ done.find(&n) }; it != done.end()) {
        return { .index = it->second, .pending = nullptr, .back = nullptr };
      }

      if (auto const it{ path.find(&n) }; it != path.end()) {
        GRAFT_TRACE_CYCLE_DETECTED(it->second.id.to_coordinates(), path.size());
        it->second.targeted = true;
        return { .index = 0, .pending = nullptr, .back = &n };
      }

      // A waiting subtree is only valid while the ancestors it refers to are open.
      if (auto const it{ waiting.find(&n) }; it != waiting.end() && still_open(*it->second)) {
        return { .index = 0, .pending = it->second, .back = nullptr };
      }

      auto const &h{ builder.handler_ };
      auto p{ std::make_shared<pending_node>() };
      p->native = &n;
      p->id = h.identifier_for(n);
      p->linkage = h.linkage_for(n);

      path.emplace(&n, path_entry{ .id = p->id, .targeted = false });
      for (auto const *child : h.children_for(n)) {
        auto r{ visit(*child) };
        if (r.back) { p->open.insert(r.back); }
        if (r.pending) { p->open.insert(r.pending->open.begin(), r.pending->open.end()); }
        p->children.push_back(std::move(r));
      }
      p->is_target = path.at(&n).targeted;
      path.erase(&n);
      p->open.erase(&n);

      p->issues = h.issues_for(n);
      builder.resolve_into(p->id, p->linkage, p->issues);
      issue_merge_unique(issues, p->issues);

      if (!p->open.empty()) {
        waiting.insert_or_assign(&n, p);
        return { .index = 0, .pending = std::move(p), .back = nullptr };
      }
      return { .index = finalize(*p), .pending = nullptr, .back = nullptr };
    }

    node_index finalize_root(child_ref const &r) {
      if (r.pending || r.back) {
        throw std::logic_error("dependency_graph_builder: root left an open cycle");
      }
      return r.index;
    }

    bool still_open(pending_node const &p) const {
      for (auto const *ancestor : p.open) {
        if (!path.contains(ancestor)) { return false; }
      }
      return true;
    }

    // Interns `p` and the waiting nodes below it, top-down. A node that is referred
    // back to is reserved first so the nodes below can be fingerprinted by its index.
    node_index finalize(pending_node &p) {
      if (p.index) { return *p.index; }

      std::vector<node_index> children;
      if (p.is_target) {
        auto const r{ builder.table_.reserve(cycle_key(p), p.id, p.linkage, p.issues) };
        p.index = r.index;
        heads.emplace(p.native, r.index);
        children = child_indices(p);
        heads.erase(p.native);
        if (r.inserted) { builder.table_.link_children(r.index, children); }
      } else {
        children = child_indices(p);
        p.index = builder.table_
                      .intern(fragment{ .id = p.id, .linkage = p.linkage, .children = children },
                              p.issues)
                      .index;
      }

      for (std::size_t slot{ 0 }; slot < p.children.size(); ++slot) {
        if (p.children[slot].back) {
          GRAFT_TRACE_BACK_REFERENCE_LINKED(*p.index, slot, children[slot]);
        }
      }
      if (p.open.empty()) { done.emplace(p.native, *p.index); }
      return *p.index;
    }

    std::vector<node_index> child_indices(pending_node const &p) {
      std::vector<node_index> result;
      result.reserve(p.children.size());
      for (auto const &c : p.children) {
        if (c.back) {
          result.push_back(heads.at(c.back));
        } else if (c.pending) {
          result.push_back(finalize(*c.pending));
        } else {
          result.push_back(c.index);
        }
      }
      return result;
    }

    // Structure of the whole cycle below `p`. References back into the subtree are
    // hashed by distance up the path; those leaving it by the ancestor's index.
    blake3_t cycle_key(pending_node const &p) const {
      blake3_builder b;
      b.update("cycle");
      std::vector<node_t const *> stack;
      hash_subtree(b, p, stack);
      return b.finalize();
    }

    void hash_subtree(blake3_builder &b,
                      pending_node const &p,
                      std::vector<node_t const *> &stack) const {
      b.update(p.id.to_coordinates());
      b.update(static_cast<std::uint64_t>(p.linkage));
      b.update(static_cast<std::uint64_t>(p.children.size()));

      stack.push_back(p.native);
      for (auto const &c : p.children) {
        if (c.back) {
          if (auto const it{ std::ranges::find(stack, c.back) }; it != stack.end()) {
            b.update("up");
            b.update(static_cast<std::uint64_t>(stack.end() - it));
          } else {
            b.update("head");
            b.update(static_cast<std::uint64_t>(heads.at(c.back)));
          }
        } else if (c.pending) {
          b.update("pending");
          hash_subtree(b, *c.pending, stack);
        } else {
          b.update("node");
          b.update(static_cast<std::uint64_t>(c.index));
        }
      }
      stack.pop_back();
    }
  };

  Handler handler_;
};

}  // namespace graft
