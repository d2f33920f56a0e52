#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace graft {

// Natural key of a package release: "type:namespace:name:version".
// Fields may be empty (e.g. npm packages without a scope have no namespace).
struct identifier {
  std::string type;
  std::string namespace_;
  std::string name;
  std::string version;

  // Parses exactly four colon-separated fields. Throws std::runtime_error otherwise.
  static identifier from_coordinates(std::string_view coordinates);

  std::string to_coordinates() const;

  bool operator==(identifier const &other) const = default;
  auto operator<=>(identifier const &other) const = default;

  size_t hash() const;
};

}  // namespace graft

template <>
struct std::hash<graft::identifier> {
  size_t operator()(graft::identifier const &id) const { return id.hash(); }
};
