#pragma once

#include "linkage.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace graft {

namespace trace_events {

struct node_interned {
  std::string id;
  graft::linkage linkage;
  std::int64_t index;
};

struct node_reused {
  std::string id;
  std::int64_t index;
  std::int64_t merged_issues;
};

struct back_reference_linked {
  std::int64_t owner;
  std::int64_t slot;
  std::int64_t target;
};

struct cycle_detected {
  std::string id;
  std::int64_t depth;
};

struct scope_root_added {
  std::string scope;
  std::string id;
  std::int64_t index;
};

struct package_resolve_start {
  std::string id;
};

struct package_resolve_complete {
  std::string id;
  bool success;
  std::int64_t duration_ms;
};

struct package_resolve_wait {
  std::string id;
};

struct project_start {
  std::string project;
  std::string definition_file;
};

struct project_complete {
  std::string project;
  std::int64_t issue_count;
  std::int64_t duration_ms;
};

struct project_cancelled {
  std::string project;
};

struct graph_built {
  std::int64_t node_count;
  std::int64_t scope_count;
  std::int64_t package_count;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::node_interned,
                                   trace_events::node_reused,
                                   trace_events::back_reference_linked,
                                   trace_events::cycle_detected,
                                   trace_events::scope_root_added,
                                   trace_events::package_resolve_start,
                                   trace_events::package_resolve_complete,
                                   trace_events::package_resolve_wait,
                                   trace_events::project_start,
                                   trace_events::project_complete,
                                   trace_events::project_cancelled,
                                   trace_events::graph_built>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits project_start on construction and project_complete on destruction.
struct project_trace_scope {
  std::string project;
  std::int64_t issue_count{ 0 };
  std::chrono::steady_clock::time_point start;

  project_trace_scope(std::string project_id,
                      std::string definition_file,
                      std::chrono::steady_clock::time_point start_time);
  ~project_trace_scope();
};

}  // namespace graft

#define GRAFT_TRACE_UNLIKELY [[unlikely]]

#define GRAFT_TRACE_EMIT(event_expr) \
  do { \
    if (::graft::tui::g_trace_enabled) GRAFT_TRACE_UNLIKELY { \
        ::graft::tui::trace event_expr; \
      } \
  } while (0)

#define GRAFT_TRACE_NODE_INTERNED(id_value, linkage_value, index_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::node_interned{ \
      .id = (id_value), \
      .linkage = (linkage_value), \
      .index = static_cast<std::int64_t>(index_value), \
  }))

#define GRAFT_TRACE_NODE_REUSED(id_value, index_value, merged_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::node_reused{ \
      .id = (id_value), \
      .index = static_cast<std::int64_t>(index_value), \
      .merged_issues = static_cast<std::int64_t>(merged_value), \
  }))

#define GRAFT_TRACE_BACK_REFERENCE_LINKED(owner_value, slot_value, target_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::back_reference_linked{ \
      .owner = static_cast<std::int64_t>(owner_value), \
      .slot = static_cast<std::int64_t>(slot_value), \
      .target = static_cast<std::int64_t>(target_value), \
  }))

#define GRAFT_TRACE_CYCLE_DETECTED(id_value, depth_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::cycle_detected{ \
      .id = (id_value), \
      .depth = static_cast<std::int64_t>(depth_value), \
  }))

#define GRAFT_TRACE_SCOPE_ROOT_ADDED(scope_value, id_value, index_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::scope_root_added{ \
      .scope = (scope_value), \
      .id = (id_value), \
      .index = static_cast<std::int64_t>(index_value), \
  }))

#define GRAFT_TRACE_PACKAGE_RESOLVE_START(id_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::package_resolve_start{ \
      .id = (id_value), \
  }))

#define GRAFT_TRACE_PACKAGE_RESOLVE_COMPLETE(id_value, success_value, duration_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::package_resolve_complete{ \
      .id = (id_value), \
      .success = (success_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define GRAFT_TRACE_PACKAGE_RESOLVE_WAIT(id_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::package_resolve_wait{ \
      .id = (id_value), \
  }))

#define GRAFT_TRACE_PROJECT_START(project_value, definition_file_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::project_start{ \
      .project = (project_value), \
      .definition_file = (definition_file_value), \
  }))

#define GRAFT_TRACE_PROJECT_COMPLETE(project_value, issue_count_value, duration_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::project_complete{ \
      .project = (project_value), \
      .issue_count = static_cast<std::int64_t>(issue_count_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define GRAFT_TRACE_PROJECT_CANCELLED(project_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::project_cancelled{ \
      .project = (project_value), \
  }))

#define GRAFT_TRACE_GRAPH_BUILT(node_count_value, scope_count_value, package_count_value) \
  GRAFT_TRACE_EMIT((::graft::trace_events::graph_built{ \
      .node_count = static_cast<std::int64_t>(node_count_value), \
      .scope_count = static_cast<std::int64_t>(scope_count_value), \
      .package_count = static_cast<std::int64_t>(package_count_value), \
  }))
