/**
 * @file solve_driver.hpp
 * @brief Runs a batch model through a solver and extracts the assignment.
 *
 * A batch is accepted or rejected as a whole: either every job gets one
 * printer, one start and one end, or the driver returns BatchInfeasible.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "roster/printer_roster.hpp"
#include "scheduler/batch_model.hpp"
#include "scheduler/objective.hpp"
#include "solver/constraint_solver.hpp"

#include <vector>

namespace print_scheduler {

/**
 * @brief Where and when one job of the batch runs, in batch-local minutes.
 */
struct JobPlacement {
    size_t job_index{0};        ///< Index into BatchModel::jobs()
    PrinterId printer{0};
    Minutes start{0};
    Minutes end{0};             ///< start + duration + buffer
    Minutes true_end{0};        ///< start + duration
};

/**
 * @brief A solved batch with the realized value of each objective term.
 */
struct BatchSolution {
    std::vector<JobPlacement> placements;
    SolveStatus status = SolveStatus::Unknown;
    double objective_value{0.0};
    Minutes makespan{0};
    int64_t proximity_penalty{0};
    int64_t max_load{0};
    int64_t printers_used{0};
    int64_t total_start{0};
    double wall_time_seconds{0.0};
};

class SolveDriver {
public:
    SolveDriver(const IConstraintSolver& solver,
                SolveLimits limits,
                const PrinterRoster& roster,
                Logger& logger);

    /**
     * @brief Solve the model under the wall-clock budget.
     *
     * Returns BatchInfeasible when no solution was found in time, the model
     * was proved infeasible, or the returned assignment violates a hard
     * constraint.
     */
    [[nodiscard]] Result<BatchSolution> solve(const BatchModel& model,
                                              const ObjectiveTerms& terms) const;

    [[nodiscard]] const SolveLimits& limits() const noexcept { return limits_; }

private:
    [[nodiscard]] Result<void> check_solution(const BatchModel& model,
                                              const BatchSolution& solution) const;

    const IConstraintSolver& solver_;
    SolveLimits limits_;
    const PrinterRoster& roster_;
    Logger& logger_;
};

}  // namespace print_scheduler
