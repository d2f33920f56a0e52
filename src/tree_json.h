#pragma once

#include "analyzer.h"
#include "analyzer_config.h"
#include "dependency_graph_builder.h"
#include "excludes.h"
#include "identifier.h"
#include "issue.h"
#include "linkage.h"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace graft {

// One node of the JSON tree written by `mvn dependency:tree -DoutputType=json`.
struct tree_json_node {
  std::string group_id;
  std::string artifact_id;
  std::string version;
  std::string type;
  std::string scope;
  std::string classifier;
  bool optional{ false };
  std::vector<std::unique_ptr<tree_json_node>> children;

  identifier id() const;  // Maven:groupId:artifactId:version
};

struct tree_json_project {
  std::filesystem::path definition_file;
  std::unique_ptr<tree_json_node> root;
};

// Throws std::runtime_error naming `definition_file` on malformed input.
tree_json_project tree_json_parse(std::string_view json,
                                  std::filesystem::path const &definition_file);
tree_json_project tree_json_load(std::filesystem::path const &definition_file);

// Direct dependencies of `root` grouped by their scope field (default "compile").
std::map<std::string, std::vector<tree_json_node const *>> tree_json_scopes(
    tree_json_node const &root);

class tree_json_handler {
 public:
  using node_t = tree_json_node;

  static constexpr char const *k_issue_source{ "Maven" };

  // `project_ids` are the projects of the current run; dependencies on them get a
  // project linkage.
  explicit tree_json_handler(std::set<identifier> project_ids = {});

  identifier identifier_for(node_t const &n) const;
  linkage linkage_for(node_t const &n) const;
  std::vector<node_t const *> children_for(node_t const &n) const;
  std::vector<issue> issues_for(node_t const &n) const;

 private:
  std::set<identifier> project_ids_;
};

using tree_json_builder = dependency_graph_builder<tree_json_handler>;

inline constexpr char const *k_nexus_pom_description{ "POM was created by Sonatype Nexus" };

// Adds every non-excluded scope of `project` to `builder`. Stops between roots once
// `cancelled` is set. The result carries the issues of every node visited, plus a
// hint for each newly discovered package whose POM was generated by Nexus.
project_analyzer_result tree_json_add_project(tree_json_builder &builder,
                                              tree_json_project const &project,
                                              scope_excludes const &excludes,
                                              std::atomic<bool> const *cancelled);

// Loads each tree file, analyzes the projects in parallel and builds the graph.
// Files that fail to load become error issues on their project result.
analyzer_result tree_json_analyze(std::vector<std::filesystem::path> const &files,
                                  analyzer_config const &config,
                                  std::atomic<bool> const *cancelled = nullptr);

}  // namespace graft
