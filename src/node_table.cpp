#include "node_table.h"

#include "trace.h"

#include <cstring>
#include <stdexcept>
#include <string>

namespace graft {

std::size_t node_table::fingerprint_compare::hash(blake3_t const &key) {
  std::size_t result;
  std::memcpy(&result, key.data(), sizeof result);
  return result;
}

blake3_t node_table::fingerprint(fragment const &f) {
  blake3_builder b;
  b.update("fragment");
  b.update(f.id.to_coordinates());
  b.update(static_cast<std::uint64_t>(f.linkage));
  b.update(static_cast<std::uint64_t>(f.children.size()));
  for (auto const child : f.children) { b.update(static_cast<std::uint64_t>(child)); }
  return b.finalize();
}

intern_result node_table::intern(fragment const &f, std::vector<issue> const &issues) {
  decltype(index_)::accessor acc;
  if (index_.insert(acc, fingerprint(f))) {
    node_index index;
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      index = nodes_.size();
      nodes_.push_back(graph_node{ .index = index,
                                   .id = f.id,
                                   .linkage = f.linkage,
                                   .issues = issues,
                                   .children = f.children });
    }
    acc->second = index;
    GRAFT_TRACE_NODE_INTERNED(f.id.to_coordinates(), f.linkage, index);
    return { .index = index, .inserted = true, .merged_issues = 0 };
  }

  return reuse(acc->second, f.id, issues);
}

intern_result node_table::reserve(blake3_t const &key,
                                  identifier const &id,
                                  graft::linkage linkage,
                                  std::vector<issue> const &issues) {
  decltype(index_)::accessor acc;
  if (index_.insert(acc, key)) {
    node_index index;
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      index = nodes_.size();
      nodes_.push_back(graph_node{ .index = index,
                                   .id = id,
                                   .linkage = linkage,
                                   .issues = issues,
                                   .children = {} });
      reserved_.insert(index);
    }
    acc->second = index;
    GRAFT_TRACE_NODE_INTERNED(id.to_coordinates(), linkage, index);
    return { .index = index, .inserted = true, .merged_issues = 0 };
  }

  return reuse(acc->second, id, issues);
}

intern_result node_table::reuse(node_index index,
                                identifier const &id,
                                std::vector<issue> const &issues) {
  std::size_t merged{ 0 };
  if (!issues.empty()) {
    std::lock_guard<std::mutex> lock{ mutex_ };
    merged = issue_merge_unique(nodes_[index].issues, issues);
  }
  GRAFT_TRACE_NODE_REUSED(id.to_coordinates(), index, merged);
  return { .index = index, .inserted = false, .merged_issues = merged };
}

void node_table::link_children(node_index index, std::vector<node_index> children) {
  std::lock_guard<std::mutex> lock{ mutex_ };
  if (index >= nodes_.size()) {
    throw std::out_of_range("node_table::link_children: unknown node index " +
                            std::to_string(index));
  }
  if (!reserved_.contains(index)) {
    throw std::logic_error("node_table::link_children: node " + std::to_string(index) +
                           " is not awaiting children");
  }
  for (auto const child : children) {
    if (child >= nodes_.size()) {
      throw std::out_of_range("node_table::link_children: unknown child index " +
                              std::to_string(child));
    }
  }
  nodes_[index].children = std::move(children);
  reserved_.erase(index);
}

std::size_t node_table::size() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return nodes_.size();
}

graph_node node_table::node(node_index index) const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  if (index >= nodes_.size()) {
    throw std::out_of_range("node_table: no node with index " + std::to_string(index));
  }
  return nodes_[index];
}

std::vector<graph_node> node_table::snapshot() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return nodes_;
}

std::set<identifier> node_table::identifiers() const {
  std::set<identifier> result;
  std::lock_guard<std::mutex> lock{ mutex_ };
  for (auto const &n : nodes_) { result.insert(n.id); }
  return result;
}

}  // namespace graft
