#include "dependency_graph_builder.h"

#include "doctest.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace graft {

namespace {

struct test_node {
  std::string coordinates;
  linkage link{ linkage::dynamic };
  std::vector<test_node const *> children;
  std::vector<issue> issues;
  bool broken{ false };
};

struct test_handler {
  using node_t = test_node;

  identifier identifier_for(test_node const &n) const {
    if (n.broken) { throw std::runtime_error("cannot read " + n.coordinates); }
    return identifier::from_coordinates(n.coordinates);
  }
  linkage linkage_for(test_node const &n) const { return n.link; }
  std::vector<test_node const *> children_for(test_node const &n) const {
    return n.children;
  }
  std::vector<issue> issues_for(test_node const &n) const { return n.issues; }
};

static_assert(dependency_handler<test_handler>);

using test_builder = dependency_graph_builder<test_handler>;

// Records every resolver call; identifiers named "broken-*" fail.
struct counting_resolver {
  std::shared_ptr<std::mutex> mutex{ std::make_shared<std::mutex>() };
  std::shared_ptr<std::multiset<std::string>> calls{
    std::make_shared<std::multiset<std::string>>()
  };

  package operator()(identifier const &id) const {
    {
      std::lock_guard<std::mutex> lock{ *mutex };
      calls->insert(id.to_coordinates());
    }
    if (id.name.starts_with("broken")) { throw std::runtime_error("no metadata"); }
    package p;
    p.id = id;
    p.description = id.name;
    return p;
  }

  std::size_t count(std::string const &coordinates) const {
    std::lock_guard<std::mutex> lock{ *mutex };
    return calls->count(coordinates);
  }
};

identifier const k_app{ identifier::from_coordinates("Maven:org.example:app:1.0") };
identifier const k_lib{ identifier::from_coordinates("Maven:org.example:lib:1.0") };

}  // namespace

TEST_CASE("builder: identical subtrees from two projects share nodes and packages") {
  counting_resolver resolver;
  test_builder builder{ test_handler{}, resolver };

  test_node const util_a{ .coordinates = "Maven:lib:util:1.0" };
  test_node const core_a{ .coordinates = "Maven:lib:core:1.0", .children = { &util_a } };
  test_node const util_b{ .coordinates = "Maven:lib:util:1.0" };
  test_node const core_b{ .coordinates = "Maven:lib:core:1.0", .children = { &util_b } };

  auto const a{ builder.add_dependency(qualify_scope(k_app, "compile"), core_a) };
  auto const b{ builder.add_dependency(qualify_scope(k_lib, "compile"), core_b) };
  CHECK(a == b);

  auto const graph{ builder.build() };
  CHECK(graph->nodes().size() == 2);
  CHECK(graph->scope_roots("org.example:app:1.0:compile") ==
        graph->scope_roots("org.example:lib:1.0:compile"));

  auto const packages{ builder.packages() };
  CHECK(packages.size() == 2);
  CHECK(packages.contains(identifier::from_coordinates("Maven:lib:core:1.0")));
  CHECK(resolver.count("Maven:lib:core:1.0") == 1);
  CHECK(resolver.count("Maven:lib:util:1.0") == 1);
}

TEST_CASE("builder: node count equals distinct fragments, not visits") {
  test_builder builder{ test_handler{}, counting_resolver{} };

  test_node const x{ .coordinates = "NPM::x:1" };
  test_node const y{ .coordinates = "NPM::y:1" };
  test_node const p_with_x{ .coordinates = "NPM::p:1", .children = { &x } };
  test_node const p_with_y{ .coordinates = "NPM::p:1", .children = { &y } };
  test_node const root{ .coordinates = "NPM::root:1",
                        .children = { &p_with_x, &p_with_y, &p_with_x, &x } };

  builder.add_dependency("ns:app:1:dependencies", root);
  builder.add_dependency("ns:app:1:dependencies", p_with_x);

  // x, y, p[x], p[y], root
  auto const graph{ builder.build() };
  CHECK(graph->nodes().size() == 5);

  auto const &r{ graph->node(graph->scope_roots("ns:app:1:dependencies")[0]) };
  REQUIRE(r.children.size() == 4);
  CHECK(r.children[0] == r.children[2]);
  CHECK(r.children[0] != r.children[1]);
  CHECK(graph->node(r.children[0]).id == graph->node(r.children[1]).id);
  CHECK(graph->scope_roots("ns:app:1:dependencies")[1] == r.children[0]);
}

TEST_CASE("builder: scope roots keep declaration order") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  test_node const x{ .coordinates = "Maven:lib:x:1" };
  test_node const y{ .coordinates = "Maven:lib:y:1" };
  test_node const z{ .coordinates = "Maven:lib:z:1" };

  // Intern in a different order first so indices differ from declaration order
  builder.add_dependency("warmup", z);
  builder.add_dependency("warmup", y);

  auto const indices{ builder.add_dependencies(k_app, "runtime", { &x, &y, &z }) };
  auto const graph{ builder.build() };

  auto const &roots{ graph->scope_roots("org.example:app:1.0:runtime") };
  CHECK(roots == indices);
  REQUIRE(roots.size() == 3);
  CHECK(graph->node(roots[0]).id.name == "x");
  CHECK(graph->node(roots[1]).id.name == "y");
  CHECK(graph->node(roots[2]).id.name == "z");
}

TEST_CASE("builder: resolution failure becomes a node issue") {
  counting_resolver resolver;
  test_builder builder{ test_handler{}, resolver };

  test_node const x{ .coordinates = "Maven:lib:broken-x:2.0" };
  test_node const ok{ .coordinates = "Maven:lib:fine:1.0", .children = { &x } };

  CHECK_NOTHROW(builder.add_dependency(qualify_scope(k_app, "compile"), ok));
  CHECK_NOTHROW(builder.add_dependency(qualify_scope(k_lib, "compile"), x));

  auto const graph{ builder.build() };
  auto const &failed{ graph->node(graph->scope_roots("org.example:lib:1.0:compile")[0]) };
  REQUIRE(failed.issues.size() == 1);
  CHECK(failed.issues[0].source == package_cache::k_issue_source);
  CHECK(failed.issues[0].severity == severity::error);
  CHECK(failed.issues[0].message.starts_with("Resolution failed for 'Maven:lib:broken-x:2.0'"));

  auto const packages{ builder.packages() };
  CHECK(packages.size() == 1);
  CHECK_FALSE(packages.contains(identifier::from_coordinates("Maven:lib:broken-x:2.0")));
  CHECK(resolver.count("Maven:lib:broken-x:2.0") == 1);
}

TEST_CASE("builder: add_dependency after build is a state error") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  test_node const x{ .coordinates = "Maven:lib:x:1" };
  test_node const y{ .coordinates = "Maven:lib:y:1" };

  builder.add_dependency("lib:app:1:compile", x);
  auto const graph{ builder.build() };
  CHECK(builder.built());

  CHECK_THROWS_AS(builder.add_dependency("lib:app:1:compile", y), std::logic_error);
  CHECK_THROWS_AS(builder.add_dependencies(k_app, "test", {}), std::logic_error);

  CHECK(graph->nodes().size() == 1);
  CHECK(graph->scope_roots("lib:app:1:compile").size() == 1);
  CHECK(builder.build() == graph);
  CHECK(builder.node_count() == 1);
}

TEST_CASE("builder: cycle A -> B -> A yields two nodes and a cycle marker") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  test_node a{ .coordinates = "Maven:lib:a:1" };
  test_node const b{ .coordinates = "Maven:lib:b:1", .children = { &a } };
  a.children = { &b };

  builder.add_dependency("lib:app:1:compile", a);
  auto const graph{ builder.build() };
  REQUIRE(graph->nodes().size() == 2);

  auto const a_idx{ graph->scope_roots("lib:app:1:compile")[0] };
  auto const &a_node{ graph->node(a_idx) };
  REQUIRE(a_node.children.size() == 1);
  auto const &b_node{ graph->node(a_node.children[0]) };
  CHECK(b_node.id.name == "b");
  CHECK(b_node.children == std::vector<node_index>{ a_idx });

  auto const roots{ graph->reference_tree("lib:app:1:compile") };
  auto const second_a{ roots[0].children()[0].children() };
  REQUIRE(second_a.size() == 1);
  CHECK(second_a[0].id().name == "a");
  CHECK(second_a[0].is_cycle());
  CHECK(graph->dependency_tree_depth("lib:app:1:compile") == 3);
}

TEST_CASE("builder: self loop links a node to itself") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  test_node a{ .coordinates = "Maven:lib:a:1" };
  a.children = { &a };

  auto const idx{ builder.add_dependency("s", a) };
  auto const graph{ builder.build() };
  REQUIRE(graph->nodes().size() == 1);
  CHECK(graph->node(idx).children == std::vector<node_index>{ idx });
  CHECK(graph->reference_tree("s")[0].children()[0].is_cycle());
}

TEST_CASE("builder: a node inside a cycle reached twice is interned once") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  // root -> [a, b]; a -> b; b -> a
  test_node a{ .coordinates = "Maven:lib:a:1" };
  test_node b{ .coordinates = "Maven:lib:b:1" };
  a.children = { &b };
  b.children = { &a };
  test_node const root{ .coordinates = "Maven:lib:root:1", .children = { &a, &b } };

  builder.add_dependency("s", root);
  auto const graph{ builder.build() };
  CHECK(graph->nodes().size() == 3);

  auto const &r{ graph->node(graph->scope_roots("s")[0]) };
  REQUIRE(r.children.size() == 2);
  auto const &a_node{ graph->node(r.children[0]) };
  CHECK(a_node.children[0] == r.children[1]);
  CHECK(graph->node(r.children[1]).children[0] == r.children[0]);
}

TEST_CASE("builder: handler issues are attached once per node") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  issue const warning{ .source = "Maven",
                       .message = "could not resolve version",
                       .severity = severity::warning };
  test_node const x{ .coordinates = "Maven:lib:x:1", .issues = { warning } };

  builder.add_dependency("lib:app:1:compile", x);
  builder.add_dependency("lib:app:1:test", x);

  auto const graph{ builder.build() };
  REQUIRE(graph->nodes().size() == 1);
  CHECK(graph->node(0).issues == std::vector<issue>{ warning });
}

TEST_CASE("builder: project nodes are not resolved") {
  counting_resolver resolver;
  test_builder builder{ test_handler{}, resolver };
  test_node const dep{ .coordinates = "Maven:lib:x:1" };
  test_node const module{ .coordinates = "Maven:org.example:lib:1.0",
                          .link = linkage::project_dynamic,
                          .children = { &dep } };

  builder.add_dependency(qualify_scope(k_app, "compile"), module);
  CHECK(resolver.count("Maven:org.example:lib:1.0") == 0);
  CHECK(resolver.count("Maven:lib:x:1") == 1);
  CHECK(builder.packages().size() == 1);
}

TEST_CASE("builder: scopes_for lists sorted scopes of one project") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  test_node const x{ .coordinates = "Maven:lib:x:1" };

  builder.add_dependencies(k_app, "test", { &x });
  builder.add_dependencies(k_app, "compile", { &x });
  builder.add_dependencies(k_app, "provided", {});
  builder.add_dependencies(k_lib, "compile", { &x });

  CHECK(builder.scopes_for(k_app) == std::vector<std::string>{ "compile", "provided", "test" });
  CHECK(builder.scopes_for(k_app, false) ==
        std::vector<std::string>{ "org.example:app:1.0:compile",
                                  "org.example:app:1.0:provided",
                                  "org.example:app:1.0:test" });
  CHECK(builder.scopes_for(k_lib) == std::vector<std::string>{ "compile" });
  CHECK(builder.scopes_for(identifier::from_coordinates("Maven:x:y:z")).empty());

  auto const graph{ builder.build() };
  CHECK(graph->scope_roots("org.example:app:1.0:provided").empty());
}

TEST_CASE("builder: packages can be diffed between calls") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  test_node const x{ .coordinates = "Maven:lib:x:1" };
  test_node const y{ .coordinates = "Maven:lib:y:1" };

  builder.add_dependency("lib:app:1:compile", x);
  auto const before{ builder.packages() };
  builder.add_dependency("lib:other:1:compile", y);
  auto const after{ builder.packages() };

  auto const added{ package_map_difference(after, before) };
  REQUIRE(added.size() == 1);
  CHECK(added.begin()->first.name == "y");

  builder.build();
  CHECK(builder.packages() == after);
}

TEST_CASE("builder: packages excludes identifiers resolved outside the graph") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  builder.cache().resolve(identifier::from_coordinates("Maven:lib:unused:1"));
  CHECK(builder.packages().empty());
}

TEST_CASE("builder: failed traversal leaves a buildable graph") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  // a -> [b, broken]; b -> a. b waits for a, then the traversal aborts before a
  // is interned, so neither reaches the table.
  test_node a{ .coordinates = "Maven:lib:a:1" };
  test_node const b{ .coordinates = "Maven:lib:b:1", .children = { &a } };
  test_node const broken{ .coordinates = "Maven:lib:c:1", .broken = true };
  a.children = { &b, &broken };

  CHECK_THROWS_AS(builder.add_dependency("s", a), std::runtime_error);
  CHECK(builder.node_count() == 0);

  test_node const ok{ .coordinates = "Maven:lib:ok:1" };
  builder.add_dependency("s", ok);

  auto const graph{ builder.build() };
  CHECK(graph->nodes().size() == 1);
  CHECK(graph->scope_roots("s").size() == 1);
}

TEST_CASE("builder: same identifiers in two cycle contexts stay separate") {
  test_builder builder{ test_handler{}, counting_resolver{} };

  // p1: a -> b -> a
  test_node a1{ .coordinates = "Maven:lib:a:1" };
  test_node const b1{ .coordinates = "Maven:lib:b:1", .children = { &a1 } };
  a1.children = { &b1 };

  // p2: a -> [b -> a, c]
  test_node a2{ .coordinates = "Maven:lib:a:1" };
  test_node const b2{ .coordinates = "Maven:lib:b:1", .children = { &a2 } };
  test_node const c2{ .coordinates = "Maven:lib:c:1" };
  a2.children = { &b2, &c2 };

  builder.add_dependency("lib:p1:1:compile", a1);
  builder.add_dependency("lib:p2:1:compile", a2);
  auto const graph{ builder.build() };

  // a, b for p1; a, b, c for p2
  CHECK(graph->nodes().size() == 5);

  auto const p1{ graph->reference_tree("lib:p1:1:compile") };
  auto const p2{ graph->reference_tree("lib:p2:1:compile") };
  REQUIRE(p1.size() == 1);
  REQUIRE(p2.size() == 1);
  CHECK(p1[0].index() != p2[0].index());

  auto const p2_children{ p2[0].children() };
  REQUIRE(p2_children.size() == 2);
  auto const &b{ p2_children[0] };
  CHECK(b.id().name == "b");
  CHECK_FALSE(b.is_cycle());
  CHECK(p2_children[1].id().name == "c");

  auto const back{ b.children() };
  REQUIRE(back.size() == 1);
  CHECK(back[0].id().name == "a");
  CHECK(back[0].index() == p2[0].index());
  CHECK(back[0].is_cycle());

  auto const p1_b{ p1[0].children() };
  REQUIRE(p1_b.size() == 1);
  CHECK(p1_b[0].index() != b.index());
  CHECK(p1_b[0].children()[0].index() == p1[0].index());
  CHECK(p1_b[0].children()[0].is_cycle());
}

TEST_CASE("builder: identical cycles from two projects share nodes") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  test_node a1{ .coordinates = "Maven:lib:a:1" };
  test_node const b1{ .coordinates = "Maven:lib:b:1", .children = { &a1 } };
  a1.children = { &b1 };
  test_node a2{ .coordinates = "Maven:lib:a:1" };
  test_node const b2{ .coordinates = "Maven:lib:b:1", .children = { &a2 } };
  a2.children = { &b2 };

  auto const first{ builder.add_dependency("lib:p1:1:compile", a1) };
  auto const second{ builder.add_dependency("lib:p2:1:compile", a2) };
  CHECK(first == second);
  CHECK(builder.build()->nodes().size() == 2);
}

TEST_CASE("builder: nested cycles close on their own heads") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  // a -> b -> c -> [b, a]
  test_node a{ .coordinates = "Maven:lib:a:1" };
  test_node b{ .coordinates = "Maven:lib:b:1" };
  test_node c{ .coordinates = "Maven:lib:c:1" };
  a.children = { &b };
  b.children = { &c };
  c.children = { &b, &a };

  auto const a_idx{ builder.add_dependency("s", a) };
  auto const graph{ builder.build() };
  REQUIRE(graph->nodes().size() == 3);

  auto const b_idx{ graph->node(a_idx).children[0] };
  auto const c_idx{ graph->node(b_idx).children[0] };
  CHECK(graph->node(c_idx).children == std::vector<node_index>{ b_idx, a_idx });

  auto const c_ref{ graph->reference_tree("s")[0].children()[0].children()[0] };
  auto const back{ c_ref.children() };
  REQUIRE(back.size() == 2);
  CHECK(back[0].is_cycle());
  CHECK(back[1].is_cycle());
}

TEST_CASE("builder: add_dependency reports the issues of visited nodes") {
  test_builder builder{ test_handler{}, counting_resolver{} };
  issue const warning{ .source = "Maven",
                       .message = "could not resolve version",
                       .severity = severity::warning };
  test_node const x{ .coordinates = "Maven:lib:x:1", .issues = { warning } };
  test_node const y{ .coordinates = "Maven:lib:y:1", .issues = { warning } };
  test_node const broken{ .coordinates = "Maven:lib:broken-z:1" };
  test_node const top{ .coordinates = "Maven:lib:top:1", .children = { &x, &y, &broken } };

  std::vector<issue> issues;
  builder.add_dependency("lib:app:1:compile", top, &issues);

  REQUIRE(issues.size() == 2);
  CHECK(issues[0] == warning);
  CHECK(issues[1].source == package_cache::k_issue_source);
  CHECK(issues[1].severity == severity::error);
  CHECK(issues[1].message.starts_with("Resolution failed for 'Maven:lib:broken-z:1'"));

  // Already known issues are not repeated
  builder.add_dependencies(k_app, "test", { &x, &broken }, &issues);
  CHECK(issues.size() == 2);
}

TEST_CASE("builder: concurrent projects share nodes and resolve once") {
  counting_resolver resolver;
  test_builder builder{ test_handler{}, resolver };

  // Each thread builds its own native copy of the same tree
  constexpr int kThreads{ 8 };
  struct tree {
    test_node leaf{ .coordinates = "Maven:lib:leaf:1" };
    test_node mid{ .coordinates = "Maven:lib:mid:1" };
    test_node top{ .coordinates = "Maven:lib:top:1" };
    tree() {
      mid.children = { &leaf };
      top.children = { &mid, &leaf };
    }
  };
  std::vector<std::unique_ptr<tree>> trees;
  for (int i{ 0 }; i < kThreads; ++i) { trees.push_back(std::make_unique<tree>()); }

  std::atomic_bool go{ false };
  std::vector<node_index> roots(kThreads);
  std::vector<std::thread> threads;
  for (int i{ 0 }; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) { std::this_thread::yield(); }
      auto const project{ identifier{ .type = "Maven",
                                      .namespace_ = "org.example",
                                      .name = "p" + std::to_string(i),
                                      .version = "1" } };
      roots[i] = builder.add_dependencies(project, "compile", { &trees[i]->top })[0];
    });
  }
  go = true;
  for (auto &t : threads) { t.join(); }

  for (auto const r : roots) { CHECK(r == roots[0]); }
  CHECK(resolver.count("Maven:lib:leaf:1") == 1);
  CHECK(resolver.count("Maven:lib:mid:1") == 1);
  CHECK(resolver.count("Maven:lib:top:1") == 1);

  auto const graph{ builder.build() };
  CHECK(graph->nodes().size() == 3);
  CHECK(graph->scopes().size() == kThreads);
}

}  // namespace graft
