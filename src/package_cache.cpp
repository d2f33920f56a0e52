#include "package_cache.h"

#include "trace.h"

#include <chrono>
#include <exception>
#include <memory>
#include <utility>

namespace graft {

package_cache::package_cache(package_resolver_fn resolver) : resolver_{ std::move(resolver) } {}

resolution package_cache::compute(identifier const &id) {
  ++computations_;
  auto const coordinates{ id.to_coordinates() };
  auto const start{ std::chrono::steady_clock::now() };
  GRAFT_TRACE_PACKAGE_RESOLVE_START(coordinates);

  resolution result;
  try {
    auto pkg{ resolver_(id) };
    pkg.id = id;
    result.pkg = std::make_shared<package const>(std::move(pkg));
  } catch (std::exception const &e) {
    result.failure = create_and_log_issue(
        k_issue_source,
        "Resolution failed for '" + coordinates + "': " + e.what(),
        severity::error);
  }

  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  GRAFT_TRACE_PACKAGE_RESOLVE_COMPLETE(coordinates, result.ok(), duration_ms);
  return result;
}

resolution package_cache::resolve(identifier const &id) {
  std::promise<resolution> promise;
  std::shared_future<resolution> future;
  bool owner{ false };

  {
    std::lock_guard<std::mutex> lock{ mutex_ };
    if (auto it{ entries_.find(id) }; it != entries_.end()) {
      future = it->second;
    } else {
      future = promise.get_future().share();
      entries_.emplace(id, future);
      owner = true;
    }
  }

  if (!owner) {
    if (future.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready) {
      GRAFT_TRACE_PACKAGE_RESOLVE_WAIT(id.to_coordinates());
    }
    return future.get();
  }

  try {
    promise.set_value(compute(id));
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      thrown_.insert(id);
    }
    promise.set_exception(std::current_exception());  // waiters see the same error
  }
  return future.get();
}

std::optional<resolution> package_cache::find(identifier const &id) const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  auto const it{ entries_.find(id) };
  if (it == entries_.end() || thrown_.contains(id)) { return std::nullopt; }
  if (it->second.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready) {
    return std::nullopt;
  }
  return it->second.get();
}

package_map package_cache::resolved() const {
  package_map result;
  std::lock_guard<std::mutex> lock{ mutex_ };
  for (auto const &[id, future] : entries_) {
    if (thrown_.contains(id)) { continue; }
    if (future.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready) {
      continue;
    }
    auto const &r{ future.get() };
    if (r.ok()) { result.emplace(id, r.pkg); }
  }
  return result;
}

}  // namespace graft
