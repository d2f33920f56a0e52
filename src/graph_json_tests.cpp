#include "graph_json.h"

#include "doctest.h"

#include "picojson.h"

#include <memory>
#include <stdexcept>
#include <string>

namespace graft {

namespace {

dependency_graph sample_graph() {
  return dependency_graph{
    { graph_node{ .index = 0,
                  .id = identifier::from_coordinates("Maven:lib:a:1"),
                  .linkage = linkage::dynamic,
                  .issues = { { .source = "Maven",
                                .message = "ambiguous \"license\"",
                                .severity = severity::hint } },
                  .children = { 1 } },
      graph_node{ .index = 1,
                  .id = identifier::from_coordinates("Maven:lib:b:1"),
                  .linkage = linkage::static_,
                  .issues = {},
                  .children = { 0 } },
      graph_node{ .index = 2,
                  .id = identifier::from_coordinates("Maven:org.example:module:1.0"),
                  .linkage = linkage::project_dynamic,
                  .issues = {},
                  .children = {} } },
    { { "org.example:app:1.0:compile", { 0, 2 } }, { "org.example:app:1.0:test", {} } }
  };
}

package_map sample_packages() {
  package p;
  p.id = identifier::from_coordinates("Maven:lib:a:1");
  p.description = "Library A";
  p.homepage_url = "https://example.org/a";
  p.authors = { "Jane Doe" };
  p.declared_licenses = { "Apache-2.0", "MIT" };
  p.binary_artifact = { .url = "https://repo/a-1.jar", .hash = "sha1:abc" };
  p.vcs = { .type = "Git", .url = "https://git/a.git", .revision = "v1", .path = "" };

  package_map packages;
  packages.emplace(p.id, std::make_shared<package const>(p));
  return packages;
}

}  // namespace

TEST_CASE("graph_json: writes the documented schema") {
  auto const json{ graph_to_json(sample_graph(), sample_packages(), false) };

  picojson::value root;
  REQUIRE(picojson::parse(root, json).empty());
  auto const &obj{ root.get<picojson::object>() };

  auto const &nodes{ obj.at("nodes").get<picojson::array>() };
  REQUIRE(nodes.size() == 3);
  auto const &first{ nodes[0].get<picojson::object>() };
  CHECK(first.at("id").get<std::string>() == "Maven:lib:a:1");
  CHECK(first.at("linkage").get<std::string>() == "DYNAMIC");
  CHECK(first.at("issues").get<picojson::array>().size() == 1);
  CHECK(nodes[2].get<picojson::object>().at("linkage").get<std::string>() ==
        "PROJECT_DYNAMIC");

  auto const &scopes{ obj.at("scopes").get<picojson::object>() };
  CHECK(scopes.at("org.example:app:1.0:compile").get<picojson::array>().size() == 2);
  CHECK(scopes.at("org.example:app:1.0:test").get<picojson::array>().empty());

  CHECK(obj.at("packages").get<picojson::array>().size() == 1);
}

TEST_CASE("graph_json: read back preserves nodes, scopes and packages") {
  auto const original{ sample_graph() };
  auto const doc{ graph_from_json(graph_to_json(original, sample_packages())) };

  REQUIRE(doc.graph);
  REQUIRE(doc.graph->nodes().size() == original.nodes().size());
  for (std::size_t i{ 0 }; i < original.nodes().size(); ++i) {
    auto const &a{ original.node(i) };
    auto const &b{ doc.graph->node(i) };
    CHECK(a.id == b.id);
    CHECK(a.linkage == b.linkage);
    CHECK(a.issues == b.issues);
    CHECK(a.children == b.children);
  }
  CHECK(doc.graph->scopes() == original.scopes());

  REQUIRE(doc.packages.size() == 1);
  auto const &p{ *doc.packages.begin()->second };
  CHECK(p == *sample_packages().begin()->second);

  // The cycle survives persistence
  auto const roots{ doc.graph->reference_tree("org.example:app:1.0:compile") };
  CHECK(roots[0].children()[0].children()[0].is_cycle());
}

TEST_CASE("graph_json: packages member is optional") {
  auto const doc{ graph_from_json(R"({"nodes":[],"scopes":{}})") };
  CHECK(doc.graph->nodes().empty());
  CHECK(doc.packages.empty());
}

TEST_CASE("graph_json: malformed documents are rejected") {
  CHECK_THROWS_AS(graph_from_json("{not json"), std::runtime_error);
  CHECK_THROWS_AS(graph_from_json("[]"), std::runtime_error);
  CHECK_THROWS_AS(graph_from_json(R"({"scopes":{}})"), std::runtime_error);

  CHECK_THROWS_WITH(
      graph_from_json(
          R"({"nodes":[{"index":0,"id":"Maven:a:b:1","linkage":"WEIRD","issues":[],"children":[]}],"scopes":{}})"),
      "Invalid graph JSON: unknown linkage 'WEIRD'");

  CHECK_THROWS_AS(
      graph_from_json(
          R"({"nodes":[{"index":0,"id":"bad","linkage":"DYNAMIC","issues":[],"children":[]}],"scopes":{}})"),
      std::runtime_error);

  CHECK_THROWS_AS(
      graph_from_json(
          R"({"nodes":[{"index":0,"id":"Maven:a:b:1","linkage":"DYNAMIC","issues":[],"children":[-1]}],"scopes":{}})"),
      std::runtime_error);

  CHECK_THROWS_AS(
      graph_from_json(
          R"({"nodes":[{"index":0,"id":"Maven:a:b:1","linkage":"DYNAMIC","issues":[],"children":[5]}],"scopes":{}})"),
      std::runtime_error);

  CHECK_THROWS_AS(graph_from_json(R"({"nodes":[],"scopes":{"s":[0]}})"), std::runtime_error);
}

TEST_CASE("graph_json: huge indices are rejected before conversion") {
  CHECK_THROWS_WITH_AS(
      graph_from_json(
          R"({"nodes":[{"index":0,"id":"Maven:a:b:1","linkage":"DYNAMIC","issues":[],"children":[1e300]}],"scopes":{}})"),
      "Invalid graph JSON: child index is out of range",
      std::runtime_error);

  CHECK_THROWS_AS(graph_from_json(R"({"nodes":[],"scopes":{"s":[9007199254740992]}})"),
                  std::runtime_error);
}

}  // namespace graft
