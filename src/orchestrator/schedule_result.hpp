/**
 * @file schedule_result.hpp
 * @brief Output of a scheduling run: merged timeline, unscheduled jobs,
 *        and one report per batch.
 */

#pragma once

#include "core/types.hpp"
#include "solver/constraint_solver.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace print_scheduler {

enum class BatchStatus : uint8_t {
    Pending,
    Solving,
    Solved,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(BatchStatus status) noexcept {
    switch (status) {
        case BatchStatus::Pending:   return "pending";
        case BatchStatus::Solving:   return "solving";
        case BatchStatus::Solved:    return "solved";
        case BatchStatus::Failed:    return "failed";
        case BatchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct BatchReport {
    size_t number{0};                    ///< 1-based, in partition order
    size_t job_count{0};
    Minutes total_work{0};
    Minutes horizon{0};
    int64_t planning_days{0};
    size_t proximity_pairs{0};
    BatchStatus status = BatchStatus::Pending;
    SolveStatus solve_status = SolveStatus::Unknown;
    std::string failure;                 ///< Empty unless status is Failed
    double objective_value{0.0};
    Minutes makespan{0};                 ///< Batch-local, before offsetting
    int64_t proximity_penalty{0};
    int64_t max_load{0};
    int64_t printers_used{0};
    double wall_time_seconds{0.0};
    Minutes offset{0};                   ///< Added to every time in this batch
};

struct ScheduleResult {
    std::vector<ScheduledJob> scheduled;
    std::vector<UnscheduledJob> unscheduled;
    std::vector<BatchReport> batches;

    /// Latest true end across the merged timeline, 0 when nothing was scheduled.
    [[nodiscard]] Minutes makespan() const noexcept;
    /// Distinct printers with at least one scheduled job.
    [[nodiscard]] size_t printers_used() const;
    [[nodiscard]] size_t solved_batches() const noexcept;
    [[nodiscard]] size_t failed_batches() const noexcept;
};

}  // namespace print_scheduler
