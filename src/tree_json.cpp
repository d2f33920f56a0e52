#include "tree_json.h"

#include "tui.h"
#include "util.h"

#include "picojson.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace graft {

namespace {

constexpr char const *k_default_scope{ "compile" };

class tree_parser {
 public:
  explicit tree_parser(std::filesystem::path const &file) : file_{ file } {}

  std::unique_ptr<tree_json_node> parse_node(picojson::value const &v,
                                             std::string const &where) const {
    if (!v.is<picojson::object>()) { fail(where + " is not an object"); }
    auto const &obj{ v.get<picojson::object>() };

    auto node{ std::make_unique<tree_json_node>() };
    node->group_id = required_string(obj, "groupId", where);
    node->artifact_id = required_string(obj, "artifactId", where);
    node->version = optional_string(obj, "version", where);
    node->type = optional_string(obj, "type", where);
    node->scope = optional_string(obj, "scope", where);
    node->classifier = optional_string(obj, "classifier", where);
    node->optional = optional_flag(obj, "optional", where);

    if (auto const it{ obj.find("children") }; it != obj.end()) {
      if (!it->second.is<picojson::array>()) { fail(where + ".children is not an array"); }
      auto const &children{ it->second.get<picojson::array>() };
      node->children.reserve(children.size());
      for (size_t i{ 0 }; i < children.size(); ++i) {
        node->children.push_back(
            parse_node(children[i], where + ".children[" + std::to_string(i) + "]"));
      }
    }
    return node;
  }

  [[noreturn]] void fail(std::string const &what) const {
    throw std::runtime_error("Invalid dependency tree " + file_.string() + ": " + what);
  }

 private:
  std::string required_string(picojson::object const &obj,
                              char const *key,
                              std::string const &where) const {
    auto const it{ obj.find(key) };
    if (it == obj.end() || !it->second.is<std::string>() ||
        it->second.get<std::string>().empty()) {
      fail(where + " is missing '" + key + "'");
    }
    return it->second.get<std::string>();
  }

  std::string optional_string(picojson::object const &obj,
                              char const *key,
                              std::string const &where) const {
    auto const it{ obj.find(key) };
    if (it == obj.end() || it->second.is<picojson::null>()) { return {}; }
    if (!it->second.is<std::string>()) { fail(where + "." + key + " is not a string"); }
    return it->second.get<std::string>();
  }

  // The plugin writes "true"/"false" strings; plain booleans are accepted too.
  bool optional_flag(picojson::object const &obj,
                     char const *key,
                     std::string const &where) const {
    auto const it{ obj.find(key) };
    if (it == obj.end() || it->second.is<picojson::null>()) { return false; }
    if (it->second.is<bool>()) { return it->second.get<bool>(); }
    if (it->second.is<std::string>()) {
      auto const &s{ it->second.get<std::string>() };
      if (s == "true") { return true; }
      if (s == "false" || s.empty()) { return false; }
    }
    fail(where + "." + key + " is not a boolean");
  }

  std::filesystem::path const &file_;
};

}  // namespace

identifier tree_json_node::id() const {
  return identifier{ .type = "Maven",
                     .namespace_ = group_id,
                     .name = artifact_id,
                     .version = version };
}

tree_json_project tree_json_parse(std::string_view json,
                                  std::filesystem::path const &definition_file) {
  tree_parser const parser{ definition_file };

  std::string const json_str{ json };
  picojson::value root;
  if (auto const err{ picojson::parse(root, json_str) }; !err.empty()) { parser.fail(err); }

  return tree_json_project{ .definition_file = definition_file,
                            .root = parser.parse_node(root, "root") };
}

tree_json_project tree_json_load(std::filesystem::path const &definition_file) {
  tui::debug("Loading dependency tree: %s", definition_file.string().c_str());
  return tree_json_parse(util_load_file(definition_file), definition_file);
}

std::map<std::string, std::vector<tree_json_node const *>> tree_json_scopes(
    tree_json_node const &root) {
  std::map<std::string, std::vector<tree_json_node const *>> result;
  for (auto const &child : root.children) {
    result[child->scope.empty() ? k_default_scope : child->scope].push_back(child.get());
  }
  return result;
}

tree_json_handler::tree_json_handler(std::set<identifier> project_ids)
    : project_ids_{ std::move(project_ids) } {}

identifier tree_json_handler::identifier_for(node_t const &n) const { return n.id(); }

linkage tree_json_handler::linkage_for(node_t const &n) const {
  return project_ids_.contains(n.id()) ? linkage::project_dynamic : linkage::dynamic;
}

std::vector<tree_json_node const *> tree_json_handler::children_for(node_t const &n) const {
  std::vector<tree_json_node const *> result;
  result.reserve(n.children.size());
  for (auto const &c : n.children) { result.push_back(c.get()); }
  return result;
}

std::vector<issue> tree_json_handler::issues_for(node_t const &n) const {
  std::vector<issue> result;
  if (n.version.empty()) {
    result.push_back(issue{ .source = k_issue_source,
                            .message = "Dependency '" + n.group_id + ":" + n.artifact_id +
                                       "' has no version.",
                            .severity = severity::warning });
  }
  if (n.optional) {
    result.push_back(issue{ .source = k_issue_source,
                            .message = "Dependency '" + n.id().to_coordinates() +
                                       "' is optional.",
                            .severity = severity::hint });
  }
  return result;
}

project_analyzer_result tree_json_add_project(tree_json_builder &builder,
                                              tree_json_project const &project,
                                              scope_excludes const &excludes,
                                              std::atomic<bool> const *cancelled) {
  project_analyzer_result result;
  result.project_id = project.root->id();
  result.definition_file = project.definition_file;
  auto const known_packages{ builder.packages() };

  for (auto const &[scope, roots] : tree_json_scopes(*project.root)) {
    if (excludes.is_excluded(scope)) {
      tui::debug("Skipping excluded scope '%s' of %s",
                 scope.c_str(),
                 result.project_id.to_coordinates().c_str());
      continue;
    }

    builder.add_dependencies(result.project_id, scope, {});
    auto const qualified{ qualify_scope(result.project_id, scope) };
    for (auto const *root : roots) {
      if (is_cancelled(cancelled)) { break; }
      builder.add_dependency(qualified, *root, &result.issues);
    }
    if (is_cancelled(cancelled)) {
      mark_cancelled(result);
      break;
    }
  }

  result.scope_names = builder.scopes_for(result.project_id);

  for (auto const &[id, pkg] : package_map_difference(builder.packages(), known_packages)) {
    if (pkg->description != k_nexus_pom_description) { continue; }
    issue_merge_unique(
        result.issues,
        { create_and_log_issue(tree_json_handler::k_issue_source,
                               "Package '" + id.to_coordinates() +
                                   "' seems to use an auto-generated POM which might lack "
                                   "metadata.",
                               severity::hint) });
  }
  return result;
}

analyzer_result tree_json_analyze(std::vector<std::filesystem::path> const &files,
                                  analyzer_config const &config,
                                  std::atomic<bool> const *cancelled) {
  // Trees are read up front: every project's identity must be known before the
  // first dependency is classified.
  std::map<std::filesystem::path, tree_json_project> projects;
  std::map<std::filesystem::path, std::exception_ptr> load_errors;
  std::set<identifier> project_ids;

  for (auto const &file : files) {
    try {
      auto project{ tree_json_load(file) };
      project_ids.insert(project.root->id());
      projects.insert_or_assign(file, std::move(project));
    } catch (std::runtime_error const &) {
      load_errors[file] = std::current_exception();
    }
  }

  tree_json_builder builder{ tree_json_handler{ project_ids }, config.make_resolver() };

  auto const project_results{ analyze_projects(
      files,
      [&](std::filesystem::path const &file) {
        if (auto const it{ load_errors.find(file) }; it != load_errors.end()) {
          std::rethrow_exception(it->second);
        }
        return tree_json_add_project(builder, projects.at(file), config.excludes, cancelled);
      },
      analyzer_options{ .parallelism = config.effective_parallelism(),
                        .cancelled = cancelled }) };

  analyzer_result result;
  result.graph = builder.build();
  result.packages = builder.packages();
  result.projects = project_results;
  return result;
}

}  // namespace graft
