#pragma once

#include "excludes.h"
#include "identifier.h"
#include "package.h"
#include "sol_util.h"
#include "util.h"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace graft {

// Settings read from graft.lua. A default-constructed config has no excludes, no
// package metadata and uses hardware concurrency.
struct analyzer_config : unmovable {
  static constexpr char const *k_file_name{ "graft.lua" };

  std::filesystem::path config_path;  // empty when not loaded from a file
  std::size_t parallelism{ 0 };       // 0 = hardware concurrency
  scope_excludes excludes;
  std::map<identifier, package> packages;

  analyzer_config() = default;

  // Walks up from the current directory looking for graft.lua. Stops at the first
  // directory containing a .git directory.
  static std::optional<std::filesystem::path> discover();

  // `explicit_path` if given (must exist), otherwise discover(). Returns nullopt
  // only when nothing was requested and nothing was discovered.
  static std::optional<std::filesystem::path> find_config_path(
      std::optional<std::filesystem::path> const &explicit_path);

  static std::unique_ptr<analyzer_config> load(std::filesystem::path const &path);
  static std::unique_ptr<analyzer_config> load(std::string const &script,
                                               std::filesystem::path const &path);

  std::size_t effective_parallelism() const;

  bool has_resolve_function() const { return resolve_.has_value(); }

  // PACKAGES entry if present, else RESOLVE(coordinates) if defined, else a package
  // carrying only the identifier. The returned function refers to this config.
  package_resolver_fn make_resolver() const;

 private:
  package call_resolve(identifier const &id) const;

  sol_state_ptr lua_;
  std::optional<sol::protected_function> resolve_;
  mutable std::mutex lua_mutex_;
};

// Reads one PACKAGES-style metadata table.
package package_from_lua(sol::table const &table,
                         identifier const &id,
                         std::string const &context);

}  // namespace graft
