/**
 * @file batch_orchestrator.cpp
 * @brief BatchOrchestrator: routing, partitioning, per-batch solves and merge.
 */

#include "orchestrator/batch_orchestrator.hpp"

#include "executor/thread_pool.hpp"
#include "scheduler/batch_model.hpp"
#include "scheduler/horizon_estimator.hpp"
#include "scheduler/objective.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <set>

namespace print_scheduler {

// ─────────────────────────────────────────────
// ScheduleResult
// ─────────────────────────────────────────────

Minutes ScheduleResult::makespan() const noexcept {
    Minutes latest = 0;
    for (const auto& job : scheduled) {
        latest = std::max(latest, job.true_end);
    }
    return latest;
}

size_t ScheduleResult::printers_used() const {
    std::set<PrinterId> printers;
    for (const auto& job : scheduled) {
        printers.insert(job.printer_id);
    }
    return printers.size();
}

size_t ScheduleResult::solved_batches() const noexcept {
    return static_cast<size_t>(std::count_if(batches.begin(), batches.end(),
        [](const BatchReport& b) { return b.status == BatchStatus::Solved; }));
}

size_t ScheduleResult::failed_batches() const noexcept {
    return static_cast<size_t>(std::count_if(batches.begin(), batches.end(),
        [](const BatchReport& b) { return b.status == BatchStatus::Failed; }));
}

// ─────────────────────────────────────────────
// BatchOrchestrator
// ─────────────────────────────────────────────

namespace {

template <typename Default, typename Base>
std::unique_ptr<Base> or_default(std::unique_ptr<Base> given) {
    if (given) return given;
    return std::make_unique<Default>();
}

}  // namespace

BatchOrchestrator::BatchOrchestrator(Options opts)
    : config_(std::move(opts.config))
    , roster_(std::move(opts.roster))
    , solver_(or_default<CpSatSolver>(std::move(opts.solver)))
    , partitioner_(or_default<GreedyTitlePartitioner>(std::move(opts.partitioner)))
    , logger_(or_default<NullSink>(std::move(opts.log_sink)), opts.log_level, "orchestrator")
    , recorder_(or_default<NullSink>(std::move(opts.event_sink))) {
}

Minutes BatchOrchestrator::batch_capacity() const noexcept {
    if (config_.batching.capacity_override_minutes > 0) {
        return config_.batching.capacity_override_minutes;
    }
    return print_scheduler::batch_capacity(config_.shift.length_minutes(), roster_.size());
}

Result<ScheduleResult> BatchOrchestrator::run(std::span<const Job> jobs, std::stop_token stop) {
    if (auto valid = validate_config(config_); !valid) {
        logger_.error("Invalid configuration: " + valid.error().message);
        return valid.error();
    }
    if (roster_.empty()) {
        logger_.error("Printer roster is empty");
        return Error{ErrorKind::EmptyRoster, "Printer roster is empty"};
    }
    for (const auto& job : jobs) {
        if (job.duration <= 0) {
            return Error{ErrorKind::Parse,
                         std::format("Job {} ({}) has non-positive duration {}",
                                     job.id, job.title, job.duration)};
        }
    }

    ScheduleResult result;
    const Minutes capacity = batch_capacity();
    recorder_.record_run_started(jobs.size(), roster_.size(), capacity);

    // ── Routing ──────────────────────────────
    std::vector<Job> routable;
    routable.reserve(jobs.size());
    for (const auto& job : jobs) {
        if (roster_.is_routable(job)) {
            routable.push_back(job);
            continue;
        }
        const auto message = std::format("No printer supports job {} ({}: {}/{}/{})",
                                         job.id, job.title, job.material,
                                         job.technology, job.machine_model);
        if (config_.jobs.unroutable_policy == "fail") {
            logger_.error(message);
            return Error{ErrorKind::UnroutableJob, message};
        }
        logger_.warn(message);
        recorder_.record_unroutable(job);
        result.unscheduled.push_back(UnscheduledJob{
            .job = job,
            .reason = UnscheduledReason::UnroutableJob,
            .batch_number = std::nullopt
        });
    }

    // ── Partition ────────────────────────────
    auto batches = partitioner_->partition(routable, capacity);
    logger_.info(std::format("Scheduling {} jobs on {} printers: {} batches of at most {} min "
                             "({} partitioner, {} solver)",
                             routable.size(), roster_.size(), batches.size(), capacity,
                             partitioner_->name(), solver_->name()));

    // ── Solve ────────────────────────────────
    auto attempts = config_.solver.parallel_batches > 1 && batches.size() > 1
                        ? solve_parallel(std::move(batches), stop)
                        : solve_sequential(std::move(batches), stop);

    // ── Merge in partition order ─────────────
    Minutes offset = 0;
    for (auto& attempt : attempts) {
        merge(attempt, offset, result);
    }

    logger_.info(std::format("Run finished: {} scheduled, {} unscheduled, {}/{} batches solved, "
                             "makespan {} min",
                             result.scheduled.size(), result.unscheduled.size(),
                             result.solved_batches(), result.batches.size(),
                             result.makespan()));
    recorder_.record_run_finished(result);
    recorder_.flush();
    logger_.flush();
    return result;
}

std::vector<BatchOrchestrator::BatchAttempt>
BatchOrchestrator::solve_sequential(std::vector<Batch> batches, std::stop_token stop) {
    std::vector<BatchAttempt> attempts;
    attempts.reserve(batches.size());

    for (size_t i = 0; i < batches.size(); ++i) {
        const size_t number = i + 1;
        if (stop.stop_requested()) {
            logger_.warn(std::format("Run cancelled before batch {}/{}", number, batches.size()));
            attempts.push_back(cancelled(number, std::move(batches[i])));
            continue;
        }
        attempts.push_back(solve_batch(number, std::move(batches[i])));
    }
    return attempts;
}

std::vector<BatchOrchestrator::BatchAttempt>
BatchOrchestrator::solve_parallel(std::vector<Batch> batches, std::stop_token stop) {
    const size_t workers = std::min<size_t>(config_.solver.parallel_batches, batches.size());
    logger_.debug(std::format("Solving {} batches on {} workers", batches.size(), workers));

    std::vector<std::future<BatchAttempt>> pending;
    pending.reserve(batches.size());
    {
        ThreadPool pool(workers, stop);
        for (size_t i = 0; i < batches.size(); ++i) {
            pending.push_back(pool.submit(
                [this, number = i + 1, jobs = std::move(batches[i])](std::stop_token cancel) mutable {
                    if (cancel.stop_requested()) {
                        return cancelled(number, std::move(jobs));
                    }
                    return solve_batch(number, std::move(jobs));
                }));
        }
    }

    std::vector<BatchAttempt> attempts;
    attempts.reserve(pending.size());
    for (auto& future : pending) {
        attempts.push_back(future.get());
    }
    return attempts;
}

BatchOrchestrator::BatchAttempt BatchOrchestrator::solve_batch(size_t number, Batch jobs) {
    BatchAttempt attempt;
    attempt.jobs = std::move(jobs);
    auto& report = attempt.report;
    report.number = number;
    report.job_count = attempt.jobs.size();
    report.total_work = total_duration(attempt.jobs);
    report.status = BatchStatus::Solving;

    Logger batch_log = logger_.for_component(std::format("batch[{}]", number));

    const HorizonEstimator estimator(roster_, HorizonSettings::from_config(config_), batch_log);
    const auto estimate = estimator.estimate(attempt.jobs);
    report.horizon = estimate.horizon;
    report.planning_days = estimate.planning_days;

    logger_.info(std::format("Batch {}: {} jobs, {} min of work, horizon {} min ({} days)",
                             number, report.job_count, report.total_work,
                             report.horizon, report.planning_days));

    const ConstraintModelBuilder builder(roster_, ModelSettings::from_config(config_), batch_log);
    auto model = builder.build(attempt.jobs, estimate.horizon);
    if (!model) {
        report.status = BatchStatus::Failed;
        report.failure = model.error().message;
        logger_.warn(std::format("Batch {} failed: {}", number, report.failure));
        return attempt;
    }

    const ObjectiveComposer composer(ObjectiveWeights::from_config(config_),
                                     ProximitySettings::from_config(config_));
    const auto terms = composer.compose(*model);
    report.proximity_pairs = terms.proximity_pairs.size();
    recorder_.record_batch_started(report);

    const SolveDriver driver(*solver_, SolveLimits::from_config(config_), roster_, batch_log);
    auto solution = driver.solve(*model, terms);
    if (!solution) {
        report.status = BatchStatus::Failed;
        report.failure = solution.error().message;
        logger_.warn(std::format("Batch {} failed: {}", number, report.failure));
        return attempt;
    }

    report.status = BatchStatus::Solved;
    report.solve_status = solution->status;
    report.objective_value = solution->objective_value;
    report.makespan = solution->makespan;
    report.proximity_penalty = solution->proximity_penalty;
    report.max_load = solution->max_load;
    report.printers_used = solution->printers_used;
    report.wall_time_seconds = solution->wall_time_seconds;
    logger_.info(std::format("Batch {} solved ({}): makespan {} min, proximity penalty {}, "
                             "max load {}, printers used {}, {:.2f}s",
                             number, to_string(report.solve_status), report.makespan,
                             report.proximity_penalty, report.max_load,
                             report.printers_used, report.wall_time_seconds));
    attempt.solution = std::move(*solution);
    return attempt;
}

BatchOrchestrator::BatchAttempt BatchOrchestrator::cancelled(size_t number, Batch jobs) {
    BatchAttempt attempt;
    attempt.report.number = number;
    attempt.report.job_count = jobs.size();
    attempt.report.total_work = total_duration(jobs);
    attempt.report.status = BatchStatus::Cancelled;
    attempt.report.failure = "run cancelled";
    attempt.jobs = std::move(jobs);
    return attempt;
}

void BatchOrchestrator::merge(BatchAttempt& attempt, Minutes& offset, ScheduleResult& result) {
    auto& report = attempt.report;

    if (!attempt.solution) {
        const auto reason = report.status == BatchStatus::Cancelled
                                ? UnscheduledReason::Cancelled
                                : UnscheduledReason::BatchInfeasible;
        for (auto& job : attempt.jobs) {
            result.unscheduled.push_back(UnscheduledJob{
                .job = std::move(job),
                .reason = reason,
                .batch_number = report.number
            });
        }
        recorder_.record_batch_failed(report);
        result.batches.push_back(std::move(report));
        return;
    }

    report.offset = offset;
    for (const auto& placement : attempt.solution->placements) {
        const Job& job = attempt.jobs[placement.job_index];
        const Printer* printer = roster_.find(placement.printer);
        result.scheduled.push_back(ScheduledJob{
            .job_id = job.id,
            .title = job.title,
            .printer_id = placement.printer,
            .printer_name = printer != nullptr ? printer->name : std::string{},
            .rack = printer != nullptr ? printer->rack : std::string{},
            .start = placement.start + offset,
            .end = placement.end + offset,
            .true_end = placement.true_end + offset,
            .batch_number = report.number,
            .material = job.material,
            .technology = job.technology,
            .machine_model = job.machine_model,
            .plate_quantity = job.plate_quantity
        });
    }
    recorder_.record_batch_solved(report);
    result.batches.push_back(std::move(report));
    offset += 2 * config_.shift.length_minutes();
}

}  // namespace print_scheduler
