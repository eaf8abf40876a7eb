// bench_graph.cpp

#include "flowcore/executor/predicate_evaluator.hpp"
#include "flowcore/graph/dependency_graph.hpp"
#include "flowcore/graph/dependency_resolver.hpp"

#include "test_utils.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace flowcore {
namespace {

class KeyPool {
public:
  explicit KeyPool(std::size_t count) {
    keys_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      keys_.push_back(std::format("s_{}", i));
    }
  }

  [[nodiscard]] auto at(std::size_t i) const -> const std::string & {
    return keys_[i];
  }

private:
  std::vector<std::string> keys_;
};

[[nodiscard]] auto make_chain(const KeyPool &keys, std::size_t nodes)
    -> DependencyGraph {
  DependencyGraph graph;
  for (std::size_t i = 0; i < nodes; ++i) {
    if (!graph.add_node(keys.at(i))) {
      return graph;
    }
    if (i > 0 && !graph.add_edge(static_cast<NodeIndex>(i - 1),
                                 static_cast<NodeIndex>(i))) {
      return graph;
    }
  }
  return graph;
}

// root -> width middle steps -> sink, as a workflow graph.
[[nodiscard]] auto make_wide_workflow(const KeyPool &keys, std::size_t width)
    -> WorkflowGraph {
  std::vector<WorkflowStep> steps;
  std::vector<StepDependency> deps;
  steps.reserve(width + 2);
  steps.push_back(test::task_step("root"));
  for (std::size_t i = 0; i < width; ++i) {
    steps.push_back(test::task_step(keys.at(i)));
    deps.push_back(test::depend(keys.at(i), "root"));
    deps.push_back(test::depend("sink", keys.at(i)));
  }
  steps.push_back(test::task_step("sink"));
  return test::make_graph("bench", std::move(steps), std::move(deps));
}

// ===================================================================
// BM_GraphBuildChain
// Measures: add_node + add_edge appending to a chain of N nodes.
// ===================================================================
void BM_GraphBuildChain(benchmark::State &state) {
  const auto nodes = static_cast<std::size_t>(state.range(0));
  KeyPool keys(nodes);

  for (auto _ : state) {
    auto graph = make_chain(keys, nodes);
    benchmark::DoNotOptimize(graph.size());
  }
  state.SetItemsProcessed(static_cast<int64_t>(nodes) * state.iterations());
}

// ===================================================================
// BM_GraphBuildReversed
// Measures: edges inserted against the current order, forcing the
// incremental topological order to shift on every insert.
// ===================================================================
void BM_GraphBuildReversed(benchmark::State &state) {
  const auto nodes = static_cast<std::size_t>(state.range(0));
  KeyPool keys(nodes);

  for (auto _ : state) {
    DependencyGraph graph;
    for (std::size_t i = 0; i < nodes; ++i) {
      (void)graph.add_node(keys.at(i));
    }
    for (std::size_t i = nodes - 1; i > 0; --i) {
      (void)graph.add_edge(static_cast<NodeIndex>(i),
                           static_cast<NodeIndex>(i - 1));
    }
    benchmark::DoNotOptimize(graph.edge_count());
  }
  state.SetItemsProcessed(static_cast<int64_t>(nodes) * state.iterations());
}

// ===================================================================
// BM_GraphCycleCheck
// Measures: rejecting a back edge on a long chain.
// ===================================================================
void BM_GraphCycleCheck(benchmark::State &state) {
  const auto nodes = static_cast<std::size_t>(state.range(0));
  KeyPool keys(nodes);
  auto graph = make_chain(keys, nodes);

  for (auto _ : state) {
    auto cyclic = graph.would_create_cycle(static_cast<NodeIndex>(nodes - 1),
                                           0);
    benchmark::DoNotOptimize(cyclic);
  }
  state.SetItemsProcessed(static_cast<int64_t>(nodes) * state.iterations());
}

// ===================================================================
// BM_ResolverReadySet
// Measures: one resolve pass over a fan-out where the root has
// completed and every middle step becomes ready.
// ===================================================================
void BM_ResolverReadySet(benchmark::State &state) {
  const auto width = static_cast<std::size_t>(state.range(0));
  KeyPool keys(width);
  auto graph = make_wide_workflow(keys, width);
  auto resolver = DependencyResolver::from_graph(graph);
  if (!resolver) {
    state.SkipWithError("failed to build resolver");
    return;
  }
  graph.steps.front().lifecycle.status = NodeStatus::Completed;

  ComparisonPredicateEvaluator evaluator;
  const ResolveContext ctx{.steps = graph.steps,
                           .context = graph.workflow.context,
                           .evaluator = evaluator};

  std::size_t ready = 0;
  for (auto _ : state) {
    auto set = resolver->ready_set(ctx);
    ready = set.size();
    benchmark::DoNotOptimize(set);
  }
  state.counters["ready_per_call"] = benchmark::Counter(
      static_cast<double>(ready), benchmark::Counter::kDefaults);
  state.SetItemsProcessed(static_cast<int64_t>(width) * state.iterations());
}

// ===================================================================
// BM_ResolverFromGraph
// Measures: building the step graph with its implicit edges.
// ===================================================================
void BM_ResolverFromGraph(benchmark::State &state) {
  const auto width = static_cast<std::size_t>(state.range(0));
  KeyPool keys(width);
  const auto graph = make_wide_workflow(keys, width);

  for (auto _ : state) {
    auto resolver = DependencyResolver::from_graph(graph);
    benchmark::DoNotOptimize(resolver);
  }
  state.SetItemsProcessed(static_cast<int64_t>(width + 2) *
                          state.iterations());
}

BENCHMARK(BM_GraphBuildChain)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_GraphBuildReversed)
    ->Arg(64)
    ->Arg(256)
    ->Arg(1024)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_GraphCycleCheck)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_ResolverReadySet)
    ->Arg(64)
    ->Arg(256)
    ->Arg(1024)
    ->Arg(4096)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_ResolverFromGraph)
    ->Arg(64)
    ->Arg(256)
    ->Arg(1024)
    ->Unit(benchmark::kMicrosecond);

} // namespace
} // namespace flowcore
