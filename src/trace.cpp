#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace graft {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(bool_string(value));
}

}  // namespace

project_trace_scope::project_trace_scope(std::string project_id,
                                         std::string definition_file,
                                         std::chrono::steady_clock::time_point start_time)
    : project{ std::move(project_id) }, start{ start_time } {
  GRAFT_TRACE_PROJECT_START(project, std::move(definition_file));
}

project_trace_scope::~project_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  GRAFT_TRACE_PROJECT_COMPLETE(project, issue_count, duration_ms);
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(node_interned),
                        TRACE_NAME(node_reused),
                        TRACE_NAME(back_reference_linked),
                        TRACE_NAME(cycle_detected),
                        TRACE_NAME(scope_root_added),
                        TRACE_NAME(package_resolve_start),
                        TRACE_NAME(package_resolve_complete),
                        TRACE_NAME(package_resolve_wait),
                        TRACE_NAME(project_start),
                        TRACE_NAME(project_complete),
                        TRACE_NAME(project_cancelled),
                        TRACE_NAME(graph_built),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::node_interned const &value) {
            std::ostringstream oss;
            oss << "node_interned id=" << value.id
                << " linkage=" << linkage_name(value.linkage) << " index=" << value.index;
            return oss.str();
          },
          [](trace_events::node_reused const &value) {
            std::ostringstream oss;
            oss << "node_reused id=" << value.id << " index=" << value.index
                << " merged_issues=" << value.merged_issues;
            return oss.str();
          },
          [](trace_events::back_reference_linked const &value) {
            std::ostringstream oss;
            oss << "back_reference_linked owner=" << value.owner << " slot=" << value.slot
                << " target=" << value.target;
            return oss.str();
          },
          [](trace_events::cycle_detected const &value) {
            std::ostringstream oss;
            oss << "cycle_detected id=" << value.id << " depth=" << value.depth;
            return oss.str();
          },
          [](trace_events::scope_root_added const &value) {
            std::ostringstream oss;
            oss << "scope_root_added scope=" << value.scope << " id=" << value.id
                << " index=" << value.index;
            return oss.str();
          },
          [](trace_events::package_resolve_start const &value) {
            std::ostringstream oss;
            oss << "package_resolve_start id=" << value.id;
            return oss.str();
          },
          [](trace_events::package_resolve_complete const &value) {
            std::ostringstream oss;
            oss << "package_resolve_complete id=" << value.id
                << " success=" << bool_string(value.success)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::package_resolve_wait const &value) {
            std::ostringstream oss;
            oss << "package_resolve_wait id=" << value.id;
            return oss.str();
          },
          [](trace_events::project_start const &value) {
            std::ostringstream oss;
            oss << "project_start project=" << value.project
                << " definition_file=" << value.definition_file;
            return oss.str();
          },
          [](trace_events::project_complete const &value) {
            std::ostringstream oss;
            oss << "project_complete project=" << value.project
                << " issues=" << value.issue_count << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::project_cancelled const &value) {
            std::ostringstream oss;
            oss << "project_cancelled project=" << value.project;
            return oss.str();
          },
          [](trace_events::graph_built const &value) {
            std::ostringstream oss;
            oss << "graph_built nodes=" << value.node_count
                << " scopes=" << value.scope_count << " packages=" << value.package_count;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::node_interned const &value) {
            append_kv(output, "id", value.id);
            append_kv(output, "linkage", linkage_name(value.linkage));
            append_kv(output, "index", value.index);
          },
          [&](trace_events::node_reused const &value) {
            append_kv(output, "id", value.id);
            append_kv(output, "index", value.index);
            append_kv(output, "merged_issues", value.merged_issues);
          },
          [&](trace_events::back_reference_linked const &value) {
            append_kv(output, "owner", value.owner);
            append_kv(output, "slot", value.slot);
            append_kv(output, "target", value.target);
          },
          [&](trace_events::cycle_detected const &value) {
            append_kv(output, "id", value.id);
            append_kv(output, "depth", value.depth);
          },
          [&](trace_events::scope_root_added const &value) {
            append_kv(output, "scope", value.scope);
            append_kv(output, "id", value.id);
            append_kv(output, "index", value.index);
          },
          [&](trace_events::package_resolve_start const &value) {
            append_kv(output, "id", value.id);
          },
          [&](trace_events::package_resolve_complete const &value) {
            append_kv(output, "id", value.id);
            append_kv(output, "success", value.success);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::package_resolve_wait const &value) {
            append_kv(output, "id", value.id);
          },
          [&](trace_events::project_start const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "definition_file", value.definition_file);
          },
          [&](trace_events::project_complete const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "issue_count", value.issue_count);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::project_cancelled const &value) {
            append_kv(output, "project", value.project);
          },
          [&](trace_events::graph_built const &value) {
            append_kv(output, "node_count", value.node_count);
            append_kv(output, "scope_count", value.scope_count);
            append_kv(output, "package_count", value.package_count);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace graft
