#pragma once

#include "dependency_graph.h"
#include "identifier.h"
#include "issue.h"
#include "package.h"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace graft {

inline constexpr char const *k_analyzer_issue_source{ "analyzer" };
inline constexpr char const *k_analysis_cancelled{ "analysis cancelled" };

struct project_analyzer_result {
  identifier project_id;
  std::filesystem::path definition_file;
  std::vector<std::string> scope_names;
  std::vector<issue> issues;

  bool has_errors() const;
};

struct analyzer_result {
  dependency_graph_ptr graph;
  package_map packages;
  std::vector<project_analyzer_result> projects;  // in definition file order

  bool has_errors() const;
};

struct analyzer_options {
  std::size_t parallelism{ 0 };                 // 0 = hardware concurrency
  std::atomic<bool> const *cancelled{ nullptr };  // checked before each project
};

// Analyzes one definition file; usually adds scopes to a shared builder.
using project_fn = std::function<project_analyzer_result(
    std::filesystem::path const &definition_file)>;

// Runs `fn` once per definition file on a task arena limited to
// options.parallelism workers. A std::exception thrown by `fn` becomes an error
// issue on that project's result; the other projects still run. Results are
// returned in input order.
std::vector<project_analyzer_result> analyze_projects(
    std::vector<std::filesystem::path> const &definition_files,
    project_fn const &fn,
    analyzer_options const &options);

bool is_cancelled(std::atomic<bool> const *cancelled);

// Marks `result` as cancelled: adds the hint issue once and emits the trace event.
void mark_cancelled(project_analyzer_result &result);

}  // namespace graft
