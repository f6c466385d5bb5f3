#include "dependency_graph.h"

#include "errors.h"
#include "tui.h"

#include "tbb/flow_graph.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>

namespace anvil {
namespace {

enum class mark { GRAY, BLACK };

struct resolver_state {
  formula_resolver_t const &resolve;
  installed_predicate_t const &is_installed;
  std::map<std::string, mark> marks;
  std::vector<std::string> stack;
  dependency_plan plan;
};

void visit(resolver_state &s, formula const &f, bool record) {
  s.marks[f.name] = mark::GRAY;
  s.stack.push_back(f.name);

  std::vector<std::string> pending;
  for (auto const &dep : f.dependencies) {
    if (auto const it{ s.marks.find(dep) }; it != s.marks.end()) {
      if (it->second == mark::GRAY) {
        std::vector<std::string> cycle{ std::find(s.stack.begin(), s.stack.end(), dep),
                                        s.stack.end() };
        cycle.push_back(dep);
        throw dependency_cycle_error{ std::move(cycle) };
      }
      if (s.plan.formulas.contains(dep)) { pending.push_back(dep); }
      continue;
    }

    if (s.is_installed(dep)) {
      tui::debug("Dependency %s already installed", dep.c_str());
      s.marks[dep] = mark::BLACK;
      continue;
    }

    visit(s, s.resolve(dep), true);
    pending.push_back(dep);
  }

  s.stack.pop_back();
  s.marks[f.name] = mark::BLACK;

  if (record) {
    s.plan.order.push_back(f.name);
    s.plan.edges[f.name] = std::move(pending);
    s.plan.formulas.emplace(f.name, f);
  }
}

using node_t = tbb::flow::continue_node<tbb::flow::continue_msg>;

}  // namespace

dependency_plan dependency_graph_resolve(formula const &root,
                                         formula_resolver_t const &resolve,
                                         installed_predicate_t const &is_installed) {
  resolver_state s{ .resolve = resolve, .is_installed = is_installed };
  visit(s, root, false);
  return std::move(s.plan);
}

void dependency_graph_execute(dependency_plan const &plan, build_node_fn_t const &build) {
  if (plan.order.empty()) { return; }

  tbb::flow::graph g;
  std::map<std::string, std::unique_ptr<node_t>> nodes;

  std::atomic_bool failed{ false };
  std::mutex failure_mutex;
  std::exception_ptr failure;

  for (auto const &name : plan.order) {
    formula const &f{ plan.formulas.at(name) };
    nodes.emplace(name,
                  std::make_unique<node_t>(
                      g, [&failed, &failure_mutex, &failure, &build, &f](
                             tbb::flow::continue_msg const &) {
                    if (failed.load()) {
                      tui::debug("Skipping %s after an earlier failure", f.name.c_str());
                      return;
                    }
                    try {
                      build(f);
                    } catch (...) {
                      std::lock_guard const lock{ failure_mutex };
                      if (!failure) { failure = std::current_exception(); }
                      failed = true;
                    }
                  }));
  }

  std::vector<node_t *> roots;
  for (auto const &name : plan.order) {
    auto const &deps{ plan.edges.at(name) };
    if (deps.empty()) { roots.push_back(nodes.at(name).get()); }
    for (auto const &dep : deps) { tbb::flow::make_edge(*nodes.at(dep), *nodes.at(name)); }
  }

  for (auto *node : roots) { node->try_put(tbb::flow::continue_msg{}); }
  g.wait_for_all();

  if (failure) { std::rethrow_exception(failure); }
}

}  // namespace anvil
