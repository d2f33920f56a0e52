#include "graph_json.h"

#include "picojson.h"

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

namespace graft {

namespace {

constexpr double k_max_exact_index{ 9007199254740992.0 };  // 2^53

picojson::value str(std::string const &value) { return picojson::value(value); }

picojson::value num(std::size_t value) { return picojson::value(static_cast<double>(value)); }

picojson::value string_array(std::vector<std::string> const &values) {
  picojson::array out;
  out.reserve(values.size());
  for (auto const &v : values) { out.push_back(str(v)); }
  return picojson::value(out);
}

picojson::value artifact_to_json(remote_artifact const &artifact) {
  picojson::object obj;
  obj["url"] = str(artifact.url);
  obj["hash"] = str(artifact.hash);
  return picojson::value(obj);
}

picojson::value node_to_json(graph_node const &n) {
  picojson::array issues;
  for (auto const &i : n.issues) {
    picojson::object obj;
    obj["source"] = str(i.source);
    obj["message"] = str(i.message);
    obj["severity"] = str(std::string(severity_name(i.severity)));
    issues.push_back(picojson::value(obj));
  }

  picojson::array children;
  for (auto const child : n.children) { children.push_back(num(child)); }

  picojson::object obj;
  obj["index"] = num(n.index);
  obj["id"] = str(n.id.to_coordinates());
  obj["linkage"] = str(std::string(linkage_name(n.linkage)));
  obj["issues"] = picojson::value(issues);
  obj["children"] = picojson::value(children);
  return picojson::value(obj);
}

picojson::value package_to_json(package const &p) {
  picojson::object vcs;
  vcs["type"] = str(p.vcs.type);
  vcs["url"] = str(p.vcs.url);
  vcs["revision"] = str(p.vcs.revision);
  vcs["path"] = str(p.vcs.path);

  picojson::object obj;
  obj["id"] = str(p.id.to_coordinates());
  obj["description"] = str(p.description);
  obj["homepage_url"] = str(p.homepage_url);
  obj["authors"] = string_array(p.authors);
  obj["declared_licenses"] = string_array(p.declared_licenses);
  obj["binary_artifact"] = artifact_to_json(p.binary_artifact);
  obj["source_artifact"] = artifact_to_json(p.source_artifact);
  obj["vcs"] = picojson::value(vcs);
  return picojson::value(obj);
}

[[noreturn]] void fail(std::string const &what) {
  throw std::runtime_error("Invalid graph JSON: " + what);
}

template <typename T>
T const &member(picojson::object const &obj, char const *key, char const *context) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<T>()) {
    fail(std::string(context) + " is missing '" + key + "' of the expected type");
  }
  return it->second.get<T>();
}

picojson::value const &required(picojson::object const &obj,
                                char const *key,
                                char const *context) {
  auto const it{ obj.find(key) };
  if (it == obj.end()) { fail(std::string(context) + " is missing '" + key + "'"); }
  return it->second;
}

// Absent string members read as empty.
std::string optional_string(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<std::string>()) { return {}; }
  return it->second.get<std::string>();
}

node_index to_index(picojson::value const &value, char const *context) {
  if (!value.is<double>()) { fail(std::string(context) + " must be a number"); }
  double const d{ value.get<double>() };
  if (d < 0 || std::floor(d) != d) {
    fail(std::string(context) + " must be a non-negative integer");
  }
  // Doubles are exact up to 2^53; anything larger is not a real index.
  if (d >= k_max_exact_index ||
      d > static_cast<double>(std::numeric_limits<node_index>::max())) {
    fail(std::string(context) + " is out of range");
  }
  return static_cast<node_index>(d);
}

identifier to_identifier(std::string const &coordinates) {
  try {
    return identifier::from_coordinates(coordinates);
  } catch (std::runtime_error const &e) {
    fail(e.what());
  }
}

std::vector<std::string> to_string_array(picojson::object const &obj, char const *key) {
  std::vector<std::string> result;
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<picojson::array>()) { return result; }
  for (auto const &v : it->second.get<picojson::array>()) {
    if (v.is<std::string>()) { result.push_back(v.get<std::string>()); }
  }
  return result;
}

remote_artifact to_artifact(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<picojson::object>()) { return {}; }
  auto const &a{ it->second.get<picojson::object>() };
  return remote_artifact{ .url = optional_string(a, "url"), .hash = optional_string(a, "hash") };
}

graph_node node_from_json(picojson::value const &value) {
  if (!value.is<picojson::object>()) { fail("node entries must be objects"); }
  auto const &obj{ value.get<picojson::object>() };

  auto const &linkage_str{ member<std::string>(obj, "linkage", "node") };
  auto const parsed_linkage{ linkage_parse(linkage_str) };
  if (!parsed_linkage) { fail("unknown linkage '" + linkage_str + "'"); }

  graph_node n{ .index = to_index(required(obj, "index", "node"), "node index"),
                .id = to_identifier(member<std::string>(obj, "id", "node")),
                .linkage = *parsed_linkage,
                .issues = {},
                .children = {} };

  for (auto const &i : member<picojson::array>(obj, "issues", "node")) {
    if (!i.is<picojson::object>()) { fail("issue entries must be objects"); }
    auto const &io{ i.get<picojson::object>() };
    auto const &sev_str{ member<std::string>(io, "severity", "issue") };
    auto const sev{ severity_parse(sev_str) };
    if (!sev) { fail("unknown severity '" + sev_str + "'"); }
    n.issues.push_back(issue{ .source = member<std::string>(io, "source", "issue"),
                              .message = member<std::string>(io, "message", "issue"),
                              .severity = *sev });
  }

  for (auto const &c : member<picojson::array>(obj, "children", "node")) {
    n.children.push_back(to_index(c, "child index"));
  }
  return n;
}

package package_from_json(picojson::value const &value) {
  if (!value.is<picojson::object>()) { fail("package entries must be objects"); }
  auto const &obj{ value.get<picojson::object>() };

  package p;
  p.id = to_identifier(member<std::string>(obj, "id", "package"));
  p.description = optional_string(obj, "description");
  p.homepage_url = optional_string(obj, "homepage_url");
  p.authors = to_string_array(obj, "authors");
  p.declared_licenses = to_string_array(obj, "declared_licenses");
  p.binary_artifact = to_artifact(obj, "binary_artifact");
  p.source_artifact = to_artifact(obj, "source_artifact");

  if (auto const it{ obj.find("vcs") };
      it != obj.end() && it->second.is<picojson::object>()) {
    auto const &v{ it->second.get<picojson::object>() };
    p.vcs = vcs_info{ .type = optional_string(v, "type"),
                      .url = optional_string(v, "url"),
                      .revision = optional_string(v, "revision"),
                      .path = optional_string(v, "path") };
  }
  return p;
}

}  // namespace

std::string graph_to_json(dependency_graph const &graph,
                          package_map const &packages,
                          bool pretty) {
  picojson::array nodes;
  nodes.reserve(graph.nodes().size());
  for (auto const &n : graph.nodes()) { nodes.push_back(node_to_json(n)); }

  picojson::object scopes;
  for (auto const &[name, roots] : graph.scopes()) {
    picojson::array indices;
    for (auto const root : roots) { indices.push_back(num(root)); }
    scopes[name] = picojson::value(indices);
  }

  picojson::array pkgs;
  for (auto const &[id, p] : packages) { pkgs.push_back(package_to_json(*p)); }

  picojson::object root;
  root["nodes"] = picojson::value(nodes);
  root["scopes"] = picojson::value(scopes);
  root["packages"] = picojson::value(pkgs);
  return picojson::value(root).serialize(pretty);
}

graph_document graph_from_json(std::string_view json) {
  picojson::value root;
  std::string const json_str{ json };
  if (auto const err{ picojson::parse(root, json_str) }; !err.empty()) { fail(err); }
  if (!root.is<picojson::object>()) { fail("top level must be an object"); }
  auto const &obj{ root.get<picojson::object>() };

  std::vector<graph_node> nodes;
  for (auto const &n : member<picojson::array>(obj, "nodes", "document")) {
    nodes.push_back(node_from_json(n));
  }

  scope_map scopes;
  for (auto const &[name, roots] : member<picojson::object>(obj, "scopes", "document")) {
    if (!roots.is<picojson::array>()) { fail("scope '" + name + "' must be an array"); }
    auto &indices{ scopes[name] };
    for (auto const &r : roots.get<picojson::array>()) {
      indices.push_back(to_index(r, "scope root"));
    }
  }

  graph_document doc;
  doc.graph = std::make_shared<dependency_graph const>(std::move(nodes), std::move(scopes));

  if (auto const it{ obj.find("packages") };
      it != obj.end() && it->second.is<picojson::array>()) {
    for (auto const &p : it->second.get<picojson::array>()) {
      auto pkg{ package_from_json(p) };
      auto id{ pkg.id };
      doc.packages.emplace(std::move(id), std::make_shared<package const>(std::move(pkg)));
    }
  }
  return doc;
}

}  // namespace graft
