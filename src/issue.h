#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graft {

enum class severity : int { hint = 0, warning = 1, error = 2 };

std::string_view severity_name(severity s);
std::optional<severity> severity_parse(std::string_view name);

// Diagnostic attached to a graph node or a project result.
struct issue {
  std::string source;  // Name of the producing component, e.g. "Maven" or "package-cache"
  std::string message;
  graft::severity severity{ graft::severity::error };

  bool operator==(issue const &other) const = default;
};

// Create an issue and log it at the level matching its severity.
issue create_and_log_issue(std::string source,
                           std::string message,
                           severity sev = severity::error);

// Append each issue of `incoming` that has no exact duplicate in `existing`.
// Returns the number of issues appended.
size_t issue_merge_unique(std::vector<issue> &existing, std::vector<issue> const &incoming);

}  // namespace graft
