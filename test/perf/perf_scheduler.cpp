#include <opflow/scheduler.hpp>
#include <opflow/block_task.hpp>
#include <opflow/composed_conditions.hpp>
#include <opflow/inline_executor.hpp>
#include <opflow/profiling.hpp>

#include <benchmark/benchmark.h>

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

namespace {

opflow::scheduler_options options(bool use_inline) {
    opflow::scheduler_options opts;
    opts.name_ = "perf";
    if (use_inline)
        opts.executor_ = opflow::inline_executor{};
    return opts;
}

std::vector<opflow::task_ptr> make_tasks(int count) {
    std::vector<opflow::task_ptr> res;
    res.reserve(count);
    for (int i = 0; i < count; i++)
        res.push_back(std::make_shared<opflow::block_task>([]() {}, "empty"));
    return res;
}

} // namespace

//! Independent tasks; measures the admission overhead
static void BM_independent_tasks(benchmark::State& state) {
    const int num_tasks = static_cast<int>(state.range(0));
    const bool use_inline = state.range(1) != 0;
    for (auto _ : state) {
        OPFLOW_PROFILING_SCOPE_N("perf iter");
        opflow::scheduler sched{options(use_inline)};
        sched.submit(make_tasks(num_tasks));
        sched.wait_for_idle(10s);
    }
    state.SetItemsProcessed(state.iterations() * num_tasks);
}

//! A chain of tasks, each one depending on the previous one
static void BM_dependency_chain(benchmark::State& state) {
    const int num_tasks = static_cast<int>(state.range(0));
    const bool use_inline = state.range(1) != 0;
    for (auto _ : state) {
        OPFLOW_PROFILING_SCOPE_N("perf iter");
        auto tasks = make_tasks(num_tasks);
        for (int i = 1; i < num_tasks; i++)
            tasks[i]->add_dependency(tasks[i - 1]);
        opflow::scheduler sched{options(use_inline)};
        sched.submit(tasks);
        sched.wait_for_idle(10s);
    }
    state.SetItemsProcessed(state.iterations() * num_tasks);
}

//! Tasks that all claim the same exclusivity category
static void BM_exclusive_tasks(benchmark::State& state) {
    const int num_tasks = static_cast<int>(state.range(0));
    const bool use_inline = state.range(1) != 0;
    for (auto _ : state) {
        OPFLOW_PROFILING_SCOPE_N("perf iter");
        auto tasks = make_tasks(num_tasks);
        for (auto& t : tasks)
            t->add_condition(std::make_shared<opflow::mutually_exclusive_condition>("perf"));
        opflow::scheduler sched{options(use_inline)};
        sched.submit(tasks);
        sched.wait_for_idle(10s);
    }
    state.SetItemsProcessed(state.iterations() * num_tasks);
}

#define BENCHMARK_CASE(fun)                                                                        \
    BENCHMARK(fun)->UseRealTime()->Unit(benchmark::kMillisecond)->Args({1000, 1})->Args({1000, 0})

BENCHMARK_CASE(BM_independent_tasks);
BENCHMARK_CASE(BM_dependency_chain);
BENCHMARK_CASE(BM_exclusive_tasks);

BENCHMARK_MAIN();
