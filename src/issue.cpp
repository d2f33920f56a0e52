#include "issue.h"

#include "tui.h"

#include <algorithm>
#include <array>
#include <utility>

namespace graft {

namespace {

constinit std::array<std::string_view, 3> const severity_name_table{ {
    "HINT",     // severity::hint (0)
    "WARNING",  // severity::warning (1)
    "ERROR",    // severity::error (2)
} };

}  // namespace

std::string_view severity_name(severity s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= severity_name_table.size()) { return "unknown"; }
  return severity_name_table[idx];
}

std::optional<severity> severity_parse(std::string_view name) {
  if (auto it{ std::ranges::find(severity_name_table, name) };
      it != severity_name_table.end()) {
    return static_cast<severity>(std::distance(severity_name_table.begin(), it));
  }
  return std::nullopt;
}

issue create_and_log_issue(std::string source, std::string message, severity sev) {
  switch (sev) {
    case severity::hint:
      tui::debug("[%s] %s", source.c_str(), message.c_str());
      break;
    case severity::warning:
      tui::warn("[%s] %s", source.c_str(), message.c_str());
      break;
    case severity::error:
      tui::error("[%s] %s", source.c_str(), message.c_str());
      break;
  }

  return issue{ .source = std::move(source), .message = std::move(message), .severity = sev };
}

size_t issue_merge_unique(std::vector<issue> &existing, std::vector<issue> const &incoming) {
  size_t appended{ 0 };
  for (auto const &candidate : incoming) {
    if (std::ranges::find(existing, candidate) != existing.end()) { continue; }
    existing.push_back(candidate);
    ++appended;
  }
  return appended;
}

}  // namespace graft
