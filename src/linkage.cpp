#include "linkage.h"

#include <algorithm>
#include <array>

namespace graft {

namespace {

// Order must match linkage enum in linkage.h
constinit std::array<std::string_view, 4> const linkage_name_table{ {
    "DYNAMIC",          // linkage::dynamic (0)
    "STATIC",           // linkage::static_ (1)
    "PROJECT_DYNAMIC",  // linkage::project_dynamic (2)
    "PROJECT_STATIC",   // linkage::project_static (3)
} };

}  // namespace

std::string_view linkage_name(linkage l) {
  auto const idx{ static_cast<std::size_t>(l) };
  if (idx >= linkage_name_table.size()) { return "unknown"; }
  return linkage_name_table[idx];
}

std::optional<linkage> linkage_parse(std::string_view name) {
  if (auto it{ std::ranges::find(linkage_name_table, name) };
      it != linkage_name_table.end()) {
    return static_cast<linkage>(std::distance(linkage_name_table.begin(), it));
  }
  return std::nullopt;
}

}  // namespace graft
