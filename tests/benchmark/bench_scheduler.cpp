/**
 * @file bench_scheduler.cpp
 * @brief Performance benchmarks for the batch scheduling pipeline.
 *
 * Measures partitioning, horizon sizing, model construction, CP-SAT solve
 * time and full multi-batch runs on the reference farm.
 *
 * Usage: ./bench_scheduler [--csv]
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/batch_orchestrator.hpp"
#include "scheduler/batch_model.hpp"
#include "scheduler/batch_partitioner.hpp"
#include "scheduler/horizon_estimator.hpp"
#include "scheduler/objective.hpp"
#include "solver/solve_driver.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/job_generator.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace print_scheduler;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

/// Timings in milliseconds.
struct BenchResult {
    std::string name;
    std::string category;
    double median_ms;
    double mean_ms;
    double min_ms;
    double max_ms;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    // Warmup
    fn();

    std::vector<double> samples(iterations);
    for (auto& sample : samples) {
        const auto t0 = Clock::now();
        fn();
        sample = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    }
    std::sort(samples.begin(), samples.end());

    const double total = std::accumulate(samples.begin(), samples.end(), 0.0);
    const size_t mid = samples.size() / 2;
    const double median = samples.size() % 2 ? samples[mid]
                                             : (samples[mid - 1] + samples[mid]) / 2.0;
    return BenchResult{
        .name = name, .category = category,
        .median_ms = median, .mean_ms = total / static_cast<double>(samples.size()),
        .min_ms = samples.front(), .max_ms = samples.back(),
        .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,median_ms,mean_ms,min_ms,max_ms,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << ',' << r.name << ','
                      << std::fixed << std::setprecision(3)
                      << r.median_ms << ',' << r.mean_ms << ','
                      << r.min_ms << ',' << r.max_ms << ','
                      << r.iterations << ",\"" << r.extra << "\"\n";
        }
        return;
    }

    std::string category;
    for (const auto& r : results) {
        if (r.category != category) {
            category = r.category;
            std::cout << "\n── " << category << " ──\n"
                      << std::left << std::setw(34) << "Benchmark" << std::right
                      << std::setw(12) << "Median(ms)" << std::setw(12) << "Mean(ms)"
                      << std::setw(12) << "Max(ms)" << "  Info\n"
                      << std::string(90, '-') << '\n';
        }
        std::cout << std::left << std::setw(34) << r.name << std::right
                  << std::fixed << std::setprecision(3)
                  << std::setw(12) << r.median_ms << std::setw(12) << r.mean_ms
                  << std::setw(12) << r.max_ms << "  " << r.extra << '\n';
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Config bench_config() {
    Config config;
    config.solver.time_limit_seconds = 30.0;
    config.solver.num_workers = 4;
    return config;
}

std::vector<Job> random_jobs(const PrinterRoster& roster, size_t n, unsigned seed = 42) {
    std::mt19937 rng(seed);
    return JobGenerator::random_for_roster(roster, n, 60, 600, rng);
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_partitioning() {
    std::vector<BenchResult> R;
    const auto roster = JobGenerator::reference_roster();
    const Minutes capacity = batch_capacity(720, roster.size());
    GreedyTitlePartitioner partitioner;

    for (size_t n : {100, 1000, 10000}) {
        auto jobs = random_jobs(roster, n);
        size_t batches = partitioner.partition(jobs, capacity).size();
        R.push_back(run_bench("greedy_title(" + std::to_string(n) + ")", "Partitioning", 200,
            [&]{ auto b = partitioner.partition(jobs, capacity); (void)b; },
            std::to_string(batches) + " batches"));
    }
    return R;
}

std::vector<BenchResult> bench_model() {
    std::vector<BenchResult> R;
    const auto roster = JobGenerator::reference_roster();
    const auto config = bench_config();
    Logger logger(std::make_unique<NullSink>());

    HorizonEstimator estimator(roster, HorizonSettings::from_config(config), logger);
    ConstraintModelBuilder builder(roster, ModelSettings::from_config(config), logger);
    ObjectiveComposer composer(ObjectiveWeights::from_config(config),
                               ProximitySettings::from_config(config));

    for (size_t n : {10, 25, 50}) {
        auto jobs = random_jobs(roster, n);
        const auto horizon = estimator.estimate(jobs);
        auto label = std::to_string(n) + " jobs";

        R.push_back(run_bench("horizon(" + std::to_string(n) + ")", "Model", 500,
            [&]{ auto h = estimator.estimate(jobs); (void)h; }, label));
        R.push_back(run_bench("build(" + std::to_string(n) + ")", "Model", 100,
            [&]{ auto m = builder.build(jobs, horizon.horizon); (void)m; }, label));
        R.push_back(run_bench("build+objective(" + std::to_string(n) + ")", "Model", 100,
            [&]{
                auto m = builder.build(jobs, horizon.horizon);
                if (m) { auto t = composer.compose(*m); (void)t; }
            }, label));
    }
    return R;
}

std::vector<BenchResult> bench_solve() {
    std::vector<BenchResult> R;
    const auto roster = JobGenerator::reference_roster();
    const auto config = bench_config();
    Logger logger(std::make_unique<NullSink>());
    CpSatSolver solver;

    HorizonEstimator estimator(roster, HorizonSettings::from_config(config), logger);
    ConstraintModelBuilder builder(roster, ModelSettings::from_config(config), logger);
    ObjectiveComposer composer(ObjectiveWeights::from_config(config),
                               ProximitySettings::from_config(config));
    SolveDriver driver(solver, SolveLimits::from_config(config), roster, logger);

    for (size_t n : {5, 10, 20}) {
        auto jobs = random_jobs(roster, n);
        const auto horizon = estimator.estimate(jobs);
        std::string status = "n/a";

        R.push_back(run_bench("cp_sat(" + std::to_string(n) + ")", "Solve", 5, [&]{
            auto model = builder.build(jobs, horizon.horizon);
            if (!model) return;
            auto terms = composer.compose(*model);
            auto solution = driver.solve(*model, terms);
            status = solution ? std::string(to_string(solution->status)) : "failed";
        }, std::to_string(n) + " jobs"));
        R.back().extra += ", " + status;
    }
    return R;
}

std::vector<BenchResult> bench_orchestrator() {
    std::vector<BenchResult> R;
    const auto roster = JobGenerator::reference_roster();

    for (size_t parallel : {1, 4}) {
        auto config = bench_config();
        config.solver.parallel_batches = parallel;
        config.solver.num_workers = parallel > 1 ? 2 : 4;
        config.batching.capacity_override_minutes = 1500;

        BatchOrchestrator orchestrator({.config = config, .roster = roster});
        auto jobs = random_jobs(roster, 40, 7);
        size_t solved = 0, batches = 0;

        R.push_back(run_bench("run_40_jobs(parallel=" + std::to_string(parallel) + ")",
            "Orchestrator", 3, [&]{
                auto result = orchestrator.run(jobs);
                if (result) {
                    solved = result->solved_batches();
                    batches = result->batches.size();
                }
            }));
        R.back().extra = std::to_string(solved) + "/" + std::to_string(batches) + " batches";
    }
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  PrintScheduler Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_partitioning());
    append(bench_model());
    append(bench_solve());
    append(bench_orchestrator());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
