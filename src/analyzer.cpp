#include "analyzer.h"

#include "trace.h"
#include "tui.h"

#include "tbb/task_arena.h"
#include "tbb/task_group.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace graft {

namespace {

bool any_error(std::vector<issue> const &issues) {
  return std::any_of(issues.begin(), issues.end(), [](issue const &i) {
    return i.severity == severity::error;
  });
}

// Placeholder identity for a definition file whose project could not be read.
identifier unknown_project(std::filesystem::path const &definition_file) {
  return identifier{ .type = "Unknown",
                     .namespace_ = "",
                     .name = definition_file.filename().string(),
                     .version = "" };
}

project_analyzer_result analyze_one(std::filesystem::path const &definition_file,
                                    project_fn const &fn,
                                    std::atomic<bool> const *cancelled) {
  project_trace_scope trace{ definition_file.filename().string(),
                             definition_file.string(),
                             std::chrono::steady_clock::now() };

  project_analyzer_result result;
  if (is_cancelled(cancelled)) {
    result.project_id = unknown_project(definition_file);
    result.definition_file = definition_file;
    mark_cancelled(result);
  } else {
    try {
      result = fn(definition_file);
    } catch (std::exception const &e) {
      result = project_analyzer_result{};
      result.project_id = unknown_project(definition_file);
      result.issues.push_back(create_and_log_issue(
          k_analyzer_issue_source,
          "Analysis of '" + definition_file.string() + "' failed: " + e.what()));
    }
    result.definition_file = definition_file;
  }

  trace.project = result.project_id.to_coordinates();
  trace.issue_count = static_cast<std::int64_t>(result.issues.size());
  tui::debug("Project %s: %zu scope(s), %zu issue(s)",
             trace.project.c_str(),
             result.scope_names.size(),
             result.issues.size());
  return result;
}

}  // namespace

bool project_analyzer_result::has_errors() const { return any_error(issues); }

bool analyzer_result::has_errors() const {
  return std::any_of(projects.begin(), projects.end(), [](auto const &p) {
    return p.has_errors();
  });
}

bool is_cancelled(std::atomic<bool> const *cancelled) {
  return cancelled && cancelled->load(std::memory_order_relaxed);
}

void mark_cancelled(project_analyzer_result &result) {
  issue const hint{ .source = k_analyzer_issue_source,
                    .message = k_analysis_cancelled,
                    .severity = severity::hint };
  if (std::find(result.issues.begin(), result.issues.end(), hint) != result.issues.end()) {
    return;
  }
  result.issues.push_back(hint);
  GRAFT_TRACE_PROJECT_CANCELLED(result.project_id.to_coordinates());
}

std::vector<project_analyzer_result> analyze_projects(
    std::vector<std::filesystem::path> const &definition_files,
    project_fn const &fn,
    analyzer_options const &options) {
  std::vector<project_analyzer_result> results(definition_files.size());
  if (definition_files.empty()) { return results; }

  auto workers{ options.parallelism };
  if (workers == 0) { workers = std::max(1u, std::thread::hardware_concurrency()); }

  tui::debug("Analyzing %zu project(s) with %zu worker(s)", definition_files.size(), workers);

  tbb::task_arena arena{ static_cast<int>(workers) };
  arena.execute([&] {
    tbb::task_group tg;
    for (size_t i{ 0 }; i < definition_files.size(); ++i) {
      tg.run([&, i]() { results[i] = analyze_one(definition_files[i], fn, options.cancelled); });
    }
    tg.wait();
  });

  return results;
}

}  // namespace graft
