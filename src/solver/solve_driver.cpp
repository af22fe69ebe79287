/**
 * @file solve_driver.cpp
 * @brief SolveDriver: bounded solve, extraction and post-solve checks.
 */

#include "solver/solve_driver.hpp"

#include <algorithm>
#include <format>
#include <map>

namespace print_scheduler {

SolveDriver::SolveDriver(const IConstraintSolver& solver,
                         SolveLimits limits,
                         const PrinterRoster& roster,
                         Logger& logger)
    : solver_(solver), limits_(limits), roster_(roster), logger_(logger) {}

Result<BatchSolution> SolveDriver::solve(const BatchModel& model,
                                         const ObjectiveTerms& terms) const {
    logger_.debug(std::format("Solving {} jobs with {} (budget {:.1f}s, {} workers)",
                              model.job_count(), solver_.name(),
                              limits_.time_budget_seconds, limits_.num_workers));

    const SolveOutcome outcome = solver_.solve(model.builder().Build(), limits_);
    if (!has_solution(outcome.status)) {
        return Error{ErrorKind::BatchInfeasible,
                     std::format("No solution found: solver status {} after {:.2f}s",
                                 to_string(outcome.status), outcome.wall_time_seconds)};
    }

    const auto& response = outcome.response;
    BatchSolution solution;
    solution.status = outcome.status;
    solution.wall_time_seconds = outcome.wall_time_seconds;
    solution.objective_value = response.objective_value();
    solution.makespan = sat::SolutionIntegerValue(response, terms.makespan);
    solution.proximity_penalty = sat::SolutionIntegerValue(response, terms.proximity_penalty);
    solution.max_load = sat::SolutionIntegerValue(response, terms.max_load);
    solution.printers_used = sat::SolutionIntegerValue(response, terms.printers_used);
    solution.total_start = sat::SolutionIntegerValue(response, terms.total_start);

    solution.placements.reserve(model.job_count());
    for (size_t j = 0; j < model.job_count(); ++j) {
        const auto& vars = model.vars(j);
        const Minutes start = sat::SolutionIntegerValue(response, vars.start);
        solution.placements.push_back(JobPlacement{
            .job_index = j,
            .printer = sat::SolutionIntegerValue(response, vars.printer),
            .start = start,
            .end = sat::SolutionIntegerValue(response, vars.end),
            .true_end = start + model.jobs()[j].duration
        });
    }

    if (auto check = check_solution(model, solution); !check) {
        logger_.error("Solver returned an inconsistent assignment: " + check.error().message);
        return check.error();
    }

    logger_.debug(std::format("Solved: status {}, objective {:.0f}, makespan {}, proximity {}, "
                              "max load {}, printers {}, {:.2f}s",
                              to_string(solution.status), solution.objective_value,
                              solution.makespan, solution.proximity_penalty,
                              solution.max_load, solution.printers_used,
                              solution.wall_time_seconds));
    return solution;
}

Result<void> SolveDriver::check_solution(const BatchModel& model,
                                         const BatchSolution& solution) const {
    std::map<PrinterId, std::vector<const JobPlacement*>> by_printer;

    for (const auto& placement : solution.placements) {
        const Job& job = model.jobs()[placement.job_index];
        const Printer* printer = roster_.find(placement.printer);
        if (printer == nullptr || !is_compatible(job, *printer)) {
            return Error{ErrorKind::BatchInfeasible,
                         std::format("job {} placed on incompatible printer {}",
                                     job.id, placement.printer)};
        }
        if (placement.start < model.shift_start() || placement.end > model.horizon() ||
            placement.end - placement.start != model.vars(placement.job_index).effective_duration) {
            return Error{ErrorKind::BatchInfeasible,
                         std::format("job {} window [{}, {}) violates its bounds",
                                     job.id, placement.start, placement.end)};
        }
        by_printer[placement.printer].push_back(&placement);
    }

    for (auto& [pid, placements] : by_printer) {
        std::sort(placements.begin(), placements.end(),
                  [](const JobPlacement* a, const JobPlacement* b) { return a->start < b->start; });
        for (size_t k = 1; k < placements.size(); ++k) {
            if (placements[k]->start < placements[k - 1]->end) {
                return Error{ErrorKind::BatchInfeasible,
                             std::format("overlapping jobs on printer {}", pid)};
            }
        }
    }
    return {};
}

}  // namespace print_scheduler
