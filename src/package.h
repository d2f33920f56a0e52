#pragma once

#include "identifier.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace graft {

struct remote_artifact {
  std::string url;
  std::string hash;  // "<algorithm>:<hex>" or empty when unknown

  bool operator==(remote_artifact const &other) const = default;
};

struct vcs_info {
  std::string type;  // "Git", "Mercurial", ... or empty
  std::string url;
  std::string revision;
  std::string path;

  bool operator==(vcs_info const &other) const = default;
};

// Resolved metadata for one identifier. Immutable once created by the package cache.
struct package {
  graft::identifier id;
  std::string description;
  std::string homepage_url;
  std::vector<std::string> authors;
  std::vector<std::string> declared_licenses;
  remote_artifact binary_artifact;
  remote_artifact source_artifact;
  vcs_info vcs;

  bool operator==(package const &other) const = default;
};

using package_ptr = std::shared_ptr<package const>;
using package_map = std::map<identifier, package_ptr>;

// Supplied by the ecosystem plugin; may perform I/O. Throws to signal failure.
using package_resolver_fn = std::function<package(identifier const &)>;

// Try `primary`; if it throws, try `fallback`. If both fail the primary's error is
// rethrown.
package_resolver_fn package_resolver_with_fallback(package_resolver_fn primary,
                                                   package_resolver_fn fallback);

// Packages present in `current` but not in `known`.
package_map package_map_difference(package_map const &current, package_map const &known);

}  // namespace graft
