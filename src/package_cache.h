#pragma once

#include "identifier.h"
#include "issue.h"
#include "package.h"
#include "util.h"

#include <atomic>
#include <cstddef>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace graft {

// Outcome of resolving one identifier. Exactly one of `pkg` / `failure` is set.
struct resolution {
  package_ptr pkg;
  std::optional<issue> failure;

  bool ok() const { return pkg != nullptr; }
};

// Memoizes package metadata lookups. The resolver runs at most once per identifier;
// concurrent callers for the same identifier block on the first caller's result.
class package_cache : unmovable {
 public:
  static constexpr char const *k_issue_source{ "package-cache" };

  explicit package_cache(package_resolver_fn resolver);

  // Resolver failures (std::exception) are returned as `failure`, never thrown.
  // Anything else escaping the resolver is rethrown to every caller.
  resolution resolve(identifier const &id);

  // Finished result for `id`, if any. Never blocks or throws; an identifier whose
  // resolver escaped with a non-standard exception has no result.
  std::optional<resolution> find(identifier const &id) const;

  // Every successfully resolved package so far.
  package_map resolved() const;

  std::size_t computation_count() const { return computations_.load(); }

 private:
  resolution compute(identifier const &id);

  package_resolver_fn resolver_;
  mutable std::mutex mutex_;
  std::unordered_map<identifier, std::shared_future<resolution>> entries_;
  std::unordered_set<identifier> thrown_;  // futures holding an exception
  std::atomic_size_t computations_{ 0 };
};

}  // namespace graft
