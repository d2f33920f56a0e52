#include "package.h"

#include <exception>
#include <utility>

namespace graft {

package_resolver_fn package_resolver_with_fallback(package_resolver_fn primary,
                                                   package_resolver_fn fallback) {
  return [primary = std::move(primary),
          fallback = std::move(fallback)](identifier const &id) -> package {
    try {
      return primary(id);
    } catch (std::exception const &) {
      std::exception_ptr const primary_error{ std::current_exception() };
      try {
        return fallback(id);
      } catch (std::exception const &) {
        std::rethrow_exception(primary_error);
      }
    }
  };
}

package_map package_map_difference(package_map const &current, package_map const &known) {
  package_map result;
  for (auto const &[id, pkg] : current) {
    if (!known.contains(id)) { result.emplace(id, pkg); }
  }
  return result;
}

}  // namespace graft
