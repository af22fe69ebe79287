/**
 * @file batch_orchestrator.hpp
 * @brief Top-level facade: partitions a job list and solves it batch by batch.
 *
 * Per run:
 *   1. Validate configuration and roster (fatal on failure)
 *   2. Route: jobs with no compatible printer go to the unscheduled list
 *   3. Partition into capacity-bounded batches
 *   4. Per batch: horizon → model → objective → solve
 *   5. Merge solved batches in partition order under a running offset
 *
 * A failed batch only affects its own jobs. The offset advances by two shift
 * lengths after every solved batch and stays put after a failed one.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "orchestrator/schedule_result.hpp"
#include "roster/printer_roster.hpp"
#include "scheduler/batch_partitioner.hpp"
#include "solver/constraint_solver.hpp"
#include "solver/solve_driver.hpp"
#include "telemetry/run_recorder.hpp"

#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <vector>

namespace print_scheduler {

class BatchOrchestrator {
public:
    struct Options {
        Config config;
        PrinterRoster roster;
        std::unique_ptr<IConstraintSolver> solver;          ///< Default: CpSatSolver
        std::unique_ptr<IBatchPartitioner> partitioner;     ///< Default: GreedyTitlePartitioner
        std::unique_ptr<ILogSink> log_sink;                 ///< Default: NullSink
        std::unique_ptr<ILogSink> event_sink;               ///< Default: NullSink
        LogLevel log_level = LogLevel::Info;
    };

    explicit BatchOrchestrator(Options opts);

    // Non-copyable, non-movable
    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

    /**
     * @brief Schedule `jobs` onto the roster.
     *
     * Fatal errors (invalid configuration, empty roster, a non-positive job
     * duration, or an unroutable job under the "fail" policy) are returned
     * before any batch is attempted. Otherwise the result always holds every
     * input job exactly once, either scheduled or unscheduled.
     *
     * `stop` is checked between batches; batches not yet attempted when it
     * fires are reported Cancelled.
     */
    Result<ScheduleResult> run(std::span<const Job> jobs, std::stop_token stop = {});

    /// Total work one batch may carry.
    [[nodiscard]] Minutes batch_capacity() const noexcept;

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    const PrinterRoster& roster() const { return roster_; }
    const IConstraintSolver& solver() const { return *solver_; }
    const IBatchPartitioner& partitioner() const { return *partitioner_; }

private:
    /// Outcome of one batch before the offset is applied.
    struct BatchAttempt {
        BatchReport report;
        Batch jobs;
        std::optional<BatchSolution> solution;
    };

    [[nodiscard]] BatchAttempt solve_batch(size_t number, Batch jobs);
    [[nodiscard]] std::vector<BatchAttempt> solve_sequential(std::vector<Batch> batches,
                                                             std::stop_token stop);
    [[nodiscard]] std::vector<BatchAttempt> solve_parallel(std::vector<Batch> batches,
                                                           std::stop_token stop);

    void merge(BatchAttempt& attempt, Minutes& offset, ScheduleResult& result);
    static BatchAttempt cancelled(size_t number, Batch jobs);

    Config config_;
    PrinterRoster roster_;
    std::unique_ptr<IConstraintSolver> solver_;
    std::unique_ptr<IBatchPartitioner> partitioner_;
    Logger logger_;
    RunRecorder recorder_;
};

}  // namespace print_scheduler
