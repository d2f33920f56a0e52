#pragma once

#include <optional>
#include <string_view>

namespace graft {

// How a dependency is attached to its parent. Part of a graph node's identity.
enum class linkage : int {
  dynamic = 0,
  static_ = 1,
  project_dynamic = 2,  // Another project of the same analysis run
  project_static = 3,
};

std::string_view linkage_name(linkage l);
std::optional<linkage> linkage_parse(std::string_view name);

inline bool linkage_is_project(linkage l) {
  return l == linkage::project_dynamic || l == linkage::project_static;
}

}  // namespace graft
