#include "package_cache.h"

#include "doctest.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace graft {

namespace {

package describe(identifier const &id) {
  package p;
  p.id = id;
  p.description = "metadata for " + id.name;
  p.declared_licenses = { "Apache-2.0" };
  return p;
}

}  // namespace

TEST_CASE("package_cache: resolves and memoizes") {
  int calls{ 0 };
  package_cache cache{ [&](identifier const &id) {
    ++calls;
    return describe(id);
  } };

  auto const id{ identifier::from_coordinates("Maven:lib:core:1.0") };
  auto const first{ cache.resolve(id) };
  auto const second{ cache.resolve(id) };

  REQUIRE(first.ok());
  CHECK(first.pkg->description == "metadata for core");
  CHECK(first.pkg->id == id);
  CHECK(first.pkg == second.pkg);
  CHECK(calls == 1);
  CHECK(cache.computation_count() == 1);
}

TEST_CASE("package_cache: resolver id is normalized to the requested identifier") {
  package_cache cache{ [](identifier const &) {
    package p;
    p.id = identifier::from_coordinates("Other:x:y:z");
    return p;
  } };

  auto const id{ identifier::from_coordinates("NPM::lodash:4.17.21") };
  auto const r{ cache.resolve(id) };
  REQUIRE(r.ok());
  CHECK(r.pkg->id == id);
}

TEST_CASE("package_cache: failure becomes an issue and is not retried") {
  int calls{ 0 };
  package_cache cache{ [&](identifier const &) -> package {
    ++calls;
    throw std::runtime_error("POM not found");
  } };

  auto const id{ identifier::from_coordinates("Maven:lib:x:2.0") };
  auto const first{ cache.resolve(id) };
  CHECK_FALSE(first.ok());
  REQUIRE(first.failure.has_value());
  CHECK(first.failure->source == package_cache::k_issue_source);
  CHECK(first.failure->severity == severity::error);
  CHECK(first.failure->message ==
        "Resolution failed for 'Maven:lib:x:2.0': POM not found");

  auto const second{ cache.resolve(id) };
  CHECK_FALSE(second.ok());
  CHECK(second.failure == first.failure);
  CHECK(calls == 1);

  CHECK(cache.resolved().empty());
}

TEST_CASE("package_cache: find does not compute") {
  package_cache cache{ describe };
  auto const id{ identifier::from_coordinates("PyPI::requests:2.31.0") };

  CHECK_FALSE(cache.find(id).has_value());
  CHECK(cache.computation_count() == 0);

  cache.resolve(id);
  auto const found{ cache.find(id) };
  REQUIRE(found.has_value());
  CHECK(found->ok());
  CHECK(cache.computation_count() == 1);
}

TEST_CASE("package_cache: resolved lists only successes") {
  package_cache cache{ [](identifier const &id) -> package {
    if (id.name == "broken") { throw std::runtime_error("no metadata"); }
    return describe(id);
  } };

  cache.resolve(identifier::from_coordinates("Maven:lib:a:1"));
  cache.resolve(identifier::from_coordinates("Maven:lib:broken:1"));
  cache.resolve(identifier::from_coordinates("Maven:lib:b:1"));

  auto const packages{ cache.resolved() };
  REQUIRE(packages.size() == 2);
  CHECK(packages.begin()->first.name == "a");
  CHECK(packages.rbegin()->first.name == "b");
  CHECK(cache.computation_count() == 3);
}

TEST_CASE("package_cache: non-standard exceptions reach every caller") {
  package_cache cache{ [](identifier const &) -> package { throw 42; } };
  auto const id{ identifier::from_coordinates("Maven:lib:odd:1") };
  CHECK_THROWS_AS(cache.resolve(id), int);
  CHECK_THROWS_AS(cache.resolve(id), int);
  CHECK(cache.computation_count() == 1);
}

TEST_CASE("package_cache: lookups skip identifiers whose resolver threw") {
  package_cache cache{ [](identifier const &id) -> package {
    if (id.name == "odd") { throw 42; }
    return package{ .id = id };
  } };
  auto const odd{ identifier::from_coordinates("Maven:lib:odd:1") };
  auto const fine{ identifier::from_coordinates("Maven:lib:fine:1") };

  CHECK_THROWS_AS(cache.resolve(odd), int);
  cache.resolve(fine);

  CHECK_FALSE(cache.find(odd).has_value());
  REQUIRE(cache.find(fine).has_value());

  package_map packages;
  CHECK_NOTHROW(packages = cache.resolved());
  CHECK(packages.size() == 1);
  CHECK(packages.contains(fine));
}

TEST_CASE("package_cache: concurrent callers share one computation") {
  std::atomic_int calls{ 0 };
  std::atomic_bool release{ false };
  package_cache cache{ [&](identifier const &id) {
    ++calls;
    while (!release.load()) { std::this_thread::yield(); }
    return describe(id);
  } };

  auto const id{ identifier::from_coordinates("Maven:lib:core:1.0") };
  constexpr int kThreads{ 16 };
  std::vector<package_ptr> results(kThreads);
  std::vector<std::thread> threads;
  for (int i{ 0 }; i < kThreads; ++i) {
    threads.emplace_back([&, i] { results[i] = cache.resolve(id).pkg; });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
  release = true;
  for (auto &t : threads) { t.join(); }

  CHECK(calls.load() == 1);
  CHECK(cache.computation_count() == 1);
  REQUIRE(results[0] != nullptr);
  for (auto const &p : results) { CHECK(p == results[0]); }
}

TEST_CASE("package_cache: distinct identifiers resolve independently in parallel") {
  std::atomic_int calls{ 0 };
  package_cache cache{ [&](identifier const &id) {
    ++calls;
    return describe(id);
  } };

  std::vector<std::thread> threads;
  for (int t{ 0 }; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i{ 0 }; i < 20; ++i) {
        cache.resolve(identifier{ .type = "Maven",
                                  .namespace_ = "lib",
                                  .name = "m" + std::to_string(i),
                                  .version = "1" });
      }
    });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(calls.load() == 20);
  CHECK(cache.resolved().size() == 20);
}

}  // namespace graft
