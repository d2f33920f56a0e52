#include "identifier.h"

#include "util.h"

#include <functional>
#include <stdexcept>

namespace graft {

identifier identifier::from_coordinates(std::string_view coordinates) {
  auto const fields{ util_split(coordinates, ':') };
  if (fields.size() != 4) {
    throw std::runtime_error("Invalid identifier (expected type:namespace:name:version): " +
                             std::string(coordinates));
  }

  return identifier{ .type = std::string(fields[0]),
                     .namespace_ = std::string(fields[1]),
                     .name = std::string(fields[2]),
                     .version = std::string(fields[3]) };
}

std::string identifier::to_coordinates() const {
  std::string result;
  result.reserve(type.size() + namespace_.size() + name.size() + version.size() + 3);
  result.append(type).append(":");
  result.append(namespace_).append(":");
  result.append(name).append(":");
  result.append(version);
  return result;
}

size_t identifier::hash() const {
  std::hash<std::string> h;
  size_t seed{ h(type) };
  for (auto const *field : { &namespace_, &name, &version }) {
    seed ^= h(*field) + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
  }
  return seed;
}

}  // namespace graft
