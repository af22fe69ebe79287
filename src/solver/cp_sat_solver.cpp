/**
 * @file cp_sat_solver.cpp
 * @brief CpSatSolver: bounded-time solve through OR-Tools CP-SAT.
 */

#include "solver/constraint_solver.hpp"

#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/sat_parameters.pb.h"

#include <algorithm>

namespace print_scheduler {

namespace sat = operations_research::sat;

namespace {

SolveStatus map_status(sat::CpSolverStatus status) {
    switch (status) {
        case sat::CpSolverStatus::OPTIMAL:       return SolveStatus::Optimal;
        case sat::CpSolverStatus::FEASIBLE:      return SolveStatus::Feasible;
        case sat::CpSolverStatus::INFEASIBLE:    return SolveStatus::Infeasible;
        case sat::CpSolverStatus::MODEL_INVALID: return SolveStatus::ModelInvalid;
        default:                                 return SolveStatus::Unknown;
    }
}

}  // anonymous namespace

SolveLimits SolveLimits::from_config(const Config& config) {
    return SolveLimits{
        .time_budget_seconds = config.solver.time_limit_seconds,
        .num_workers = static_cast<int32_t>(config.solver.num_workers),
        .random_seed = config.solver.random_seed,
        .log_search = config.solver.log_search
    };
}

SolveOutcome CpSatSolver::solve(const sat::CpModelProto& model,
                                const SolveLimits& limits) const {
    sat::SatParameters parameters;
    parameters.set_max_time_in_seconds(limits.time_budget_seconds);
    parameters.set_num_workers(std::max(1, limits.num_workers));
    parameters.set_random_seed(limits.random_seed);
    parameters.set_log_search_progress(limits.log_search);

    SolveOutcome outcome;
    outcome.response = sat::SolveWithParameters(model, parameters);
    outcome.status = map_status(outcome.response.status());
    outcome.wall_time_seconds = outcome.response.wall_time();
    return outcome;
}

}  // namespace print_scheduler
