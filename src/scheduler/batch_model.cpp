/**
 * @file batch_model.cpp
 * @brief ConstraintModelBuilder: variable declaration and hard constraints.
 */

#include "scheduler/batch_model.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace print_scheduler {

using operations_research::Domain;

ModelSettings ModelSettings::from_config(const Config& config) {
    return ModelSettings{
        .shift_start = config.shift.start_minutes(),
        .buffer = config.jobs.buffer_minutes
    };
}

// ─────────────────────────────────────────────
// BatchModel
// ─────────────────────────────────────────────

BatchModel::BatchModel(std::vector<Job> jobs, Minutes horizon, Minutes shift_start)
    : builder_(std::make_unique<sat::CpModelBuilder>())
    , jobs_(std::move(jobs))
    , horizon_(horizon)
    , shift_start_(shift_start) {}

std::vector<sat::BoolVar> BatchModel::presences_on(PrinterId printer) const {
    std::vector<sat::BoolVar> literals;
    for (const auto& job_vars : vars_) {
        for (const auto& [pid, literal] : job_vars.presence) {
            if (pid == printer) literals.push_back(literal);
        }
    }
    return literals;
}

// ─────────────────────────────────────────────
// ConstraintModelBuilder
// ─────────────────────────────────────────────

ConstraintModelBuilder::ConstraintModelBuilder(const PrinterRoster& roster,
                                               ModelSettings settings,
                                               Logger& logger)
    : roster_(roster), settings_(settings), logger_(logger) {}

Result<BatchModel> ConstraintModelBuilder::build(std::span<const Job> jobs,
                                                 Minutes horizon) const {
    BatchModel model(std::vector<Job>(jobs.begin(), jobs.end()), horizon, settings_.shift_start);
    auto& cp = model.builder();
    model.vars_.reserve(jobs.size());

    for (size_t j = 0; j < jobs.size(); ++j) {
        const Job& job = jobs[j];
        const Minutes effective = job.duration + settings_.buffer;

        const auto valid = roster_.compatible_printers(job);
        if (valid.empty()) {
            return Error{ErrorKind::UnroutableJob,
                         std::format("No compatible printer for job {} ({}: {}/{}/{})",
                                     job.id, job.title, job.material, job.technology,
                                     job.machine_model)};
        }

        const Minutes latest_start = horizon - effective;
        if (latest_start < settings_.shift_start) {
            return Error{ErrorKind::BatchInfeasible,
                         std::format("Job {} ({} min) cannot fit between shift start {} "
                                     "and horizon {}", job.id, effective,
                                     settings_.shift_start, horizon)};
        }

        JobVars vars;
        vars.effective_duration = effective;
        vars.start = cp.NewIntVar(Domain(settings_.shift_start, latest_start))
                         .WithName(std::format("start_{}", job.id));
        vars.end = cp.NewIntVar(Domain(0, horizon))
                       .WithName(std::format("end_{}", job.id));
        cp.AddEquality(vars.end, vars.start + effective);

        std::vector<int64_t> printer_ids(valid.begin(), valid.end());
        vars.printer = cp.NewIntVar(Domain::FromValues(printer_ids))
                           .WithName(std::format("printer_{}", job.id));

        std::set<int64_t> rack_values;
        for (PrinterId pid : valid) {
            rack_values.insert(roster_.rack_index(pid));
        }
        vars.rack = cp.NewIntVar(Domain::FromValues(
                                     std::vector<int64_t>(rack_values.begin(), rack_values.end())))
                        .WithName(std::format("rack_{}", job.id));

        std::vector<sat::BoolVar> literals;
        literals.reserve(valid.size());
        for (PrinterId pid : valid) {
            const sat::BoolVar on_printer =
                cp.NewBoolVar().WithName(std::format("is_j{}_on_p{}", job.id, pid));
            cp.AddEquality(vars.printer, pid).OnlyEnforceIf(on_printer);
            cp.AddNotEqual(vars.printer, pid).OnlyEnforceIf(on_printer.Not());
            cp.AddEquality(vars.rack, roster_.rack_index(pid)).OnlyEnforceIf(on_printer);

            const sat::IntervalVar busy =
                cp.NewOptionalFixedSizeIntervalVar(vars.start, effective, on_printer)
                    .WithName(std::format("busy_j{}_p{}", job.id, pid));
            model.printer_intervals_[pid].push_back(busy);

            vars.presence.emplace_back(pid, on_printer);
            literals.push_back(on_printer);
        }
        cp.AddExactlyOne(literals);

        model.vars_.push_back(std::move(vars));
    }

    for (const auto& [pid, intervals] : model.printer_intervals_) {
        if (intervals.size() > 1) {
            cp.AddNoOverlap(intervals);
        }
    }

    logger_.debug(std::format("Built model for {} jobs on {} printers, horizon {} min, buffer {} min",
                              jobs.size(), model.printer_intervals_.size(), horizon,
                              settings_.buffer));
    return model;
}

}  // namespace print_scheduler
