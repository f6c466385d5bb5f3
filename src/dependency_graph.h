#pragma once

#include "formula.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace anvil {

using formula_resolver_t = std::function<formula(std::string const &name)>;
using installed_predicate_t = std::function<bool(std::string const &name)>;

struct dependency_plan {
  std::vector<std::string> order;  // dependencies before dependents, root excluded
  std::map<std::string, std::vector<std::string>> edges;  // name -> dependencies to build
  std::map<std::string, formula> formulas;
};

// Depth-first walk of `root`'s dependencies with gray/black marking. Installed
// dependencies and their subtrees are skipped. Throws dependency_cycle_error before any
// build runs, and whatever `resolve` throws for unknown names.
dependency_plan dependency_graph_resolve(formula const &root,
                                         formula_resolver_t const &resolve,
                                         installed_predicate_t const &is_installed);

using build_node_fn_t = std::function<void(formula const &)>;

// Builds every planned dependency once, after its own dependencies, on a TBB flow graph.
// Independent nodes run concurrently. After the first failure no further node starts;
// that failure is rethrown once the graph drains.
void dependency_graph_execute(dependency_plan const &plan, build_node_fn_t const &build);

}  // namespace anvil
