/**
 * @file constraint_solver.hpp
 * @brief Pluggable solver interface and the CP-SAT backend.
 *
 * The engine builds a CpModelProto (variables with domains, constraints, a
 * linear objective) and hands it to an IConstraintSolver with a wall-clock
 * budget. Any engine that can read the proto and fill a CpSolverResponse can
 * stand in for CP-SAT.
 */

#pragma once

#include "core/config.hpp"

#include "ortools/sat/cp_model.pb.h"

#include <cstdint>
#include <string_view>

namespace print_scheduler {

enum class SolveStatus : uint8_t {
    Optimal,       ///< Proven optimal within the budget
    Feasible,      ///< A solution was found, optimality not proven
    Infeasible,    ///< Proven to have no solution
    Unknown,       ///< Budget exhausted with no solution
    ModelInvalid   ///< The solver rejected the model
};

[[nodiscard]] constexpr std::string_view to_string(SolveStatus status) noexcept {
    switch (status) {
        case SolveStatus::Optimal:      return "optimal";
        case SolveStatus::Feasible:     return "feasible";
        case SolveStatus::Infeasible:   return "infeasible";
        case SolveStatus::Unknown:      return "unknown";
        case SolveStatus::ModelInvalid: return "model_invalid";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool has_solution(SolveStatus status) noexcept {
    return status == SolveStatus::Optimal || status == SolveStatus::Feasible;
}

struct SolveLimits {
    double time_budget_seconds = 100.0;
    int32_t num_workers = 8;
    int32_t random_seed = 0;
    bool log_search = false;

    static SolveLimits from_config(const Config& config);
};

struct SolveOutcome {
    SolveStatus status = SolveStatus::Unknown;
    operations_research::sat::CpSolverResponse response;
    double wall_time_seconds = 0.0;
};

/**
 * @brief Abstract constraint solver.
 *
 * `solve` must be safe to call concurrently on distinct models.
 */
class IConstraintSolver {
public:
    virtual ~IConstraintSolver() = default;
    [[nodiscard]] virtual SolveOutcome solve(const operations_research::sat::CpModelProto& model,
                                             const SolveLimits& limits) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief OR-Tools CP-SAT backend.
 */
class CpSatSolver : public IConstraintSolver {
public:
    [[nodiscard]] SolveOutcome solve(const operations_research::sat::CpModelProto& model,
                                     const SolveLimits& limits) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "cp-sat"; }
};

}  // namespace print_scheduler
