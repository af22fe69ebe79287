/**
 * @file batch_model.hpp
 * @brief CP-SAT model of one batch: variables, domains and hard constraints.
 *
 * Per job j (effective = duration + buffer):
 *   start_j   in [shift_start, horizon - effective]
 *   end_j     == start_j + effective
 *   printer_j in {compatible printer ids}            (structural compatibility)
 *   x_jp      <=> printer_j == p, one per compatible p
 *   interval  [start_j, start_j + effective) present iff x_jp
 *   rack_j    == rack(p) whenever x_jp
 * and per printer, NoOverlap over the intervals that may land on it.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "roster/printer_roster.hpp"

#include "ortools/sat/cp_model.h"

#include <map>
#include <memory>
#include <span>
#include <vector>

namespace print_scheduler {

namespace sat = operations_research::sat;

struct ModelSettings {
    Minutes shift_start = 8 * kMinutesPerHour;
    Minutes buffer = 0;                   ///< Added to every job's busy window

    static ModelSettings from_config(const Config& config);
};

/**
 * @brief Handles to the decision variables of one job.
 */
struct JobVars {
    sat::IntVar start;
    sat::IntVar end;
    sat::IntVar printer;
    sat::IntVar rack;
    Minutes effective_duration{0};
    std::vector<std::pair<PrinterId, sat::BoolVar>> presence;   ///< x_jp per compatible p
};

/**
 * @brief A built batch model. Owns its CpModelBuilder at a stable address,
 *        so variable handles stay valid when the BatchModel is moved.
 */
class BatchModel {
public:
    BatchModel(std::vector<Job> jobs, Minutes horizon, Minutes shift_start);

    BatchModel(BatchModel&&) noexcept = default;
    BatchModel& operator=(BatchModel&&) noexcept = default;
    BatchModel(const BatchModel&) = delete;
    BatchModel& operator=(const BatchModel&) = delete;

    [[nodiscard]] sat::CpModelBuilder& builder() { return *builder_; }
    [[nodiscard]] const sat::CpModelBuilder& builder() const { return *builder_; }

    [[nodiscard]] const std::vector<Job>& jobs() const noexcept { return jobs_; }
    [[nodiscard]] size_t job_count() const noexcept { return jobs_.size(); }
    [[nodiscard]] Minutes horizon() const noexcept { return horizon_; }
    [[nodiscard]] Minutes shift_start() const noexcept { return shift_start_; }

    [[nodiscard]] const JobVars& vars(size_t job_index) const { return vars_.at(job_index); }
    [[nodiscard]] const std::vector<JobVars>& all_vars() const noexcept { return vars_; }

    /// Optional busy intervals per printer, in job order.
    [[nodiscard]] const std::map<PrinterId, std::vector<sat::IntervalVar>>& printer_intervals()
        const noexcept { return printer_intervals_; }

    /// Presence literals of every job that may run on `printer`.
    [[nodiscard]] std::vector<sat::BoolVar> presences_on(PrinterId printer) const;

private:
    friend class ConstraintModelBuilder;

    std::unique_ptr<sat::CpModelBuilder> builder_;
    std::vector<Job> jobs_;
    Minutes horizon_;
    Minutes shift_start_;
    std::vector<JobVars> vars_;
    std::map<PrinterId, std::vector<sat::IntervalVar>> printer_intervals_;
};

/**
 * @brief Declares variables and hard constraints for one batch.
 *
 * Fails with UnroutableJob when a job has no compatible printer (the model
 * would be unbuildable) and with BatchInfeasible when a job cannot fit
 * between shift start and the horizon.
 */
class ConstraintModelBuilder {
public:
    ConstraintModelBuilder(const PrinterRoster& roster, ModelSettings settings, Logger& logger);

    [[nodiscard]] Result<BatchModel> build(std::span<const Job> jobs, Minutes horizon) const;

    [[nodiscard]] const ModelSettings& settings() const noexcept { return settings_; }

private:
    const PrinterRoster& roster_;
    ModelSettings settings_;
    Logger& logger_;
};

}  // namespace print_scheduler
