#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace graft {

// Scope exclusion patterns. A scope is excluded when one pattern matches its whole
// unqualified name.
class scope_excludes {
 public:
  scope_excludes() = default;
  explicit scope_excludes(std::vector<std::string> patterns);  // throws on a bad regex

  bool is_excluded(std::string_view scope_name) const;

  void add(std::string const &pattern);
  std::vector<std::string> const &patterns() const { return patterns_; }
  bool empty() const { return patterns_.empty(); }

 private:
  std::vector<std::string> patterns_;
  std::vector<std::regex> compiled_;
};

}  // namespace graft
