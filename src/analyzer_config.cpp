#include "analyzer_config.h"

#include "tui.h"

#include <stdexcept>
#include <thread>
#include <utility>

namespace graft {

namespace {

remote_artifact artifact_from_lua(sol::table const &table,
                                  std::string_view key,
                                  std::string const &context) {
  remote_artifact result;
  auto const t{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!t) { return result; }

  auto const nested{ context + "." + std::string(key) };
  result.url = sol_util_get_or_default<std::string>(*t, "url", "", nested);
  result.hash = sol_util_get_or_default<std::string>(*t, "hash", "", nested);
  return result;
}

}  // namespace

package package_from_lua(sol::table const &table,
                         identifier const &id,
                         std::string const &context) {
  package result{ .id = id };
  result.description = sol_util_get_or_default<std::string>(table, "description", "", context);
  result.homepage_url = sol_util_get_or_default<std::string>(table, "homepage", "", context);
  result.authors = sol_util_get_string_list(table, "authors", context);
  result.declared_licenses = sol_util_get_string_list(table, "licenses", context);
  result.binary_artifact = artifact_from_lua(table, "binary", context);
  result.source_artifact = artifact_from_lua(table, "source", context);

  if (auto const vcs{ sol_util_get_optional<sol::table>(table, "vcs", context) }) {
    auto const nested{ context + ".vcs" };
    result.vcs.type = sol_util_get_or_default<std::string>(*vcs, "type", "", nested);
    result.vcs.url = sol_util_get_or_default<std::string>(*vcs, "url", "", nested);
    result.vcs.revision = sol_util_get_or_default<std::string>(*vcs, "revision", "", nested);
    result.vcs.path = sol_util_get_or_default<std::string>(*vcs, "path", "", nested);
  }

  return result;
}

std::optional<std::filesystem::path> analyzer_config::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const config_path{ cur / k_file_name };
    if (fs::exists(config_path)) { return config_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }
    cur = parent;
  }
}

std::optional<std::filesystem::path> analyzer_config::find_config_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("config not found: " + path.string());
    }
    return path;
  }
  return discover();
}

std::unique_ptr<analyzer_config> analyzer_config::load(std::filesystem::path const &path) {
  tui::debug("Loading config from file: %s", path.string().c_str());
  return load(util_load_file(path), path);
}

std::unique_ptr<analyzer_config> analyzer_config::load(std::string const &script,
                                                       std::filesystem::path const &path) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error("Failed to execute config script " + path.string() + ": " +
                             err.what());
  }

  auto cfg{ std::make_unique<analyzer_config>() };
  cfg->config_path = path;

  std::string const ctx{ path.filename().string() };
  sol::table const globals = (*state)["_G"];

  auto const parallelism{ sol_util_get_or_default<int>(globals, "PARALLELISM", 0, ctx) };
  if (parallelism < 0) {
    throw std::runtime_error(ctx + ": PARALLELISM must not be negative");
  }
  cfg->parallelism = static_cast<std::size_t>(parallelism);

  if (auto const excludes{ sol_util_get_optional<sol::table>(globals, "EXCLUDES", ctx) }) {
    cfg->excludes = scope_excludes{ sol_util_get_string_list(*excludes, "scopes", "EXCLUDES") };
  }

  if (auto packages{ sol_util_get_optional<sol::table>(globals, "PACKAGES", ctx) }) {
    for (auto const &[key, value] : *packages) {
      if (!key.is<std::string>()) {
        throw std::runtime_error(ctx + ": PACKAGES keys must be coordinate strings");
      }
      auto const coords{ key.as<std::string>() };
      if (!value.is<sol::table>()) {
        throw std::runtime_error(ctx + ": PACKAGES['" + coords + "'] must be a table");
      }
      auto const id{ identifier::from_coordinates(coords) };
      cfg->packages.insert_or_assign(
          id,
          package_from_lua(value.as<sol::table>(), id, "PACKAGES['" + coords + "']"));
    }
  }

  cfg->resolve_ = sol_util_get_optional<sol::protected_function>(globals, "RESOLVE", ctx);
  cfg->lua_ = std::move(state);  // keep alive for RESOLVE

  tui::debug("Config %s: parallelism=%zu excludes=%zu packages=%zu resolve=%s",
             path.string().c_str(),
             cfg->parallelism,
             cfg->excludes.patterns().size(),
             cfg->packages.size(),
             cfg->resolve_ ? "yes" : "no");
  return cfg;
}

std::size_t analyzer_config::effective_parallelism() const {
  if (parallelism > 0) { return parallelism; }
  auto const hw{ std::thread::hardware_concurrency() };
  return hw > 0 ? hw : 1;
}

package analyzer_config::call_resolve(identifier const &id) const {
  auto const coords{ id.to_coordinates() };

  std::lock_guard<std::mutex> lock{ lua_mutex_ };
  sol::protected_function_result const result{ (*resolve_)(coords) };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error("RESOLVE failed: " + std::string{ err.what() });
  }

  sol::object const value{ result.get<sol::object>() };
  if (!value.valid() || value.get_type() == sol::type::lua_nil) {
    throw std::runtime_error("RESOLVE returned nil");
  }
  if (!value.is<sol::table>()) {
    throw std::runtime_error("RESOLVE must return a table or nil");
  }
  return package_from_lua(value.as<sol::table>(), id, "RESOLVE('" + coords + "')");
}

package_resolver_fn analyzer_config::make_resolver() const {
  return [this](identifier const &id) -> package {
    if (auto const it{ packages.find(id) }; it != packages.end()) { return it->second; }
    if (resolve_) { return call_resolve(id); }
    return package{ .id = id };
  };
}

}  // namespace graft
