#include "excludes.h"

#include <stdexcept>

namespace graft {

scope_excludes::scope_excludes(std::vector<std::string> patterns) {
  for (auto const &p : patterns) { add(p); }
}

void scope_excludes::add(std::string const &pattern) {
  try {
    compiled_.emplace_back(pattern, std::regex::ECMAScript);
  } catch (std::regex_error const &e) {
    throw std::runtime_error("Invalid scope exclude pattern '" + pattern + "': " + e.what());
  }
  patterns_.push_back(pattern);
}

bool scope_excludes::is_excluded(std::string_view scope_name) const {
  for (auto const &re : compiled_) {
    if (std::regex_match(scope_name.begin(), scope_name.end(), re)) { return true; }
  }
  return false;
}

}  // namespace graft
