#include "dependency_graph.h"

#include "errors.h"

#include "doctest/doctest.h"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace anvil {

namespace {

formula make(std::string name, std::vector<std::string> deps = {}) {
  return formula{ .name = std::move(name), .dependencies = std::move(deps) };
}

struct catalog {
  std::map<std::string, formula> formulas;
  std::set<std::string> installed;
  std::vector<std::string> resolved;

  formula_resolver_t resolver() {
    return [this](std::string const &name) {
      resolved.push_back(name);
      auto const it{ formulas.find(name) };
      if (it == formulas.end()) { throw formula_not_found{ name }; }
      return it->second;
    };
  }

  installed_predicate_t installed_predicate() const {
    return [this](std::string const &name) { return installed.contains(name); };
  }

  void add(formula f) {
    auto const name{ f.name };
    formulas.emplace(name, std::move(f));
  }
};

}  // namespace

TEST_CASE("dependency_graph_resolve orders dependencies first") {
  catalog c;
  c.add(make("b", { "d" }));
  c.add(make("c", { "d" }));
  c.add(make("d"));

  auto const plan{ dependency_graph_resolve(make("a", { "b", "c" }),
                                            c.resolver(),
                                            c.installed_predicate()) };
  CHECK(plan.order == std::vector<std::string>{ "d", "b", "c" });
  CHECK(plan.edges.at("b") == std::vector<std::string>{ "d" });
  CHECK(plan.edges.at("c") == std::vector<std::string>{ "d" });
  CHECK(plan.edges.at("d").empty());
  CHECK(c.resolved == std::vector<std::string>{ "b", "d", "c" });
}

TEST_CASE("dependency_graph_resolve skips installed subtrees") {
  catalog c;
  c.add(make("b", { "d" }));
  c.add(make("d"));
  c.installed.insert("b");

  auto const plan{ dependency_graph_resolve(make("a", { "b" }),
                                            c.resolver(),
                                            c.installed_predicate()) };
  CHECK(plan.order.empty());
  CHECK(c.resolved.empty());
}

TEST_CASE("dependency_graph_resolve detects cycles before any build") {
  catalog c;
  c.add(make("b", { "c" }));
  c.add(make("c", { "b" }));

  try {
    dependency_graph_resolve(make("a", { "b" }), c.resolver(), c.installed_predicate());
    FAIL("expected dependency_cycle_error");
  } catch (dependency_cycle_error const &e) {
    CHECK(e.cycle() == std::vector<std::string>{ "b", "c", "b" });
    CHECK(std::string{ e.what() }.find("b -> c -> b") != std::string::npos);
  }

  SUBCASE("cycle through the root") {
    catalog r;
    r.add(make("b", { "a" }));
    CHECK_THROWS_AS(
        dependency_graph_resolve(make("a", { "b" }), r.resolver(), r.installed_predicate()),
        dependency_cycle_error);
  }
}

TEST_CASE("dependency_graph_resolve propagates unknown dependencies") {
  catalog c;
  CHECK_THROWS_AS(
      dependency_graph_resolve(make("a", { "ghost" }), c.resolver(), c.installed_predicate()),
      formula_not_found);
}

TEST_CASE("dependency_graph_execute respects edges") {
  catalog c;
  c.add(make("b", { "d" }));
  c.add(make("c", { "d" }));
  c.add(make("d"));
  auto const plan{ dependency_graph_resolve(make("a", { "b", "c" }),
                                            c.resolver(),
                                            c.installed_predicate()) };

  std::mutex m;
  std::vector<std::string> built;
  dependency_graph_execute(plan, [&](formula const &f) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::lock_guard const lock{ m };
    built.push_back(f.name);
  });

  REQUIRE(built.size() == 3);
  CHECK(built.front() == "d");
}

TEST_CASE("dependency_graph_execute stops after the first failure") {
  catalog c;
  c.add(make("b", { "d" }));
  c.add(make("d"));
  auto const plan{ dependency_graph_resolve(make("a", { "b" }),
                                            c.resolver(),
                                            c.installed_predicate()) };

  std::atomic_int calls{ 0 };
  CHECK_THROWS_WITH_AS(dependency_graph_execute(plan,
                                                [&](formula const &f) {
                                                  ++calls;
                                                  if (f.name == "d") {
                                                    throw std::runtime_error("d broke");
                                                  }
                                                }),
                       "d broke",
                       std::runtime_error);
  CHECK(calls.load() == 1);
}

}  // namespace anvil
