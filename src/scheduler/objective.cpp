/**
 * @file objective.cpp
 * @brief ObjectiveComposer: auxiliary variables and the weighted objective.
 *
 * Proximity penalty for a candidate pair (i, j):
 *   close_ij      <=> |true_end_i - true_end_j| <= threshold
 *   diff_rack_ij  <=> rack_i != rack_j
 *   penalized_ij  <=> close_ij AND diff_rack_ij
 * The indicator is reified both ways, so the realized penalty equals the
 * number of clustered different-rack pairs and cannot be minimized away.
 */

#include "scheduler/objective.hpp"

#include "roster/printer_roster.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <numeric>

namespace print_scheduler {

using operations_research::Domain;

ObjectiveWeights ObjectiveWeights::from_config(const Config& config) {
    return ObjectiveWeights{
        .makespan = config.objective.makespan_weight,
        .proximity = config.objective.proximity_weight,
        .load = config.objective.load_weight,
        .tiebreak = config.objective.tiebreak_weight,
        .mode = config.objective.mode == "makespan_and_printers"
                    ? ObjectiveMode::MakespanAndPrinters
                    : ObjectiveMode::Composite
    };
}

ProximitySettings ProximitySettings::from_config(const Config& config) {
    return ProximitySettings{
        .threshold = config.proximity.threshold_minutes,
        .lookahead = config.proximity.lookahead,
        .max_duration_gap = config.proximity.max_duration_gap_minutes
    };
}

std::vector<JobPair> proximity_candidates(std::span<const Job> jobs,
                                          const ProximitySettings& settings) {
    std::vector<size_t> order(jobs.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&jobs](size_t a, size_t b) {
        return jobs[a].duration < jobs[b].duration;
    });

    std::vector<std::string> technology(jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        technology[i] = normalize_capability(jobs[i].technology);
    }

    std::vector<JobPair> pairs;
    for (size_t a = 0; a < order.size(); ++a) {
        const size_t i = order[a];
        const size_t window_end = std::min(a + settings.lookahead, order.size());
        for (size_t b = a + 1; b < window_end; ++b) {
            const size_t j = order[b];
            if (std::abs(jobs[i].duration - jobs[j].duration) > settings.max_duration_gap) {
                break;
            }
            if (technology[i] != technology[j]) continue;
            pairs.emplace_back(std::min(i, j), std::max(i, j));
        }
    }
    return pairs;
}

// ─────────────────────────────────────────────
// ObjectiveComposer
// ─────────────────────────────────────────────

ObjectiveComposer::ObjectiveComposer(ObjectiveWeights weights, ProximitySettings proximity)
    : weights_(weights), proximity_(proximity) {}

ObjectiveTerms ObjectiveComposer::compose(BatchModel& model) const {
    auto& cp = model.builder();
    const auto& jobs = model.jobs();
    const Minutes horizon = model.horizon();
    const auto n = static_cast<int64_t>(jobs.size());

    ObjectiveTerms terms;

    // ── True makespan (buffer excluded) ──────
    std::vector<sat::IntVar> starts;
    starts.reserve(jobs.size());
    for (size_t j = 0; j < jobs.size(); ++j) {
        const auto& vars = model.vars(j);
        sat::IntVar true_end = cp.NewIntVar(Domain(0, horizon))
                                   .WithName(std::format("true_end_{}", jobs[j].id));
        cp.AddEquality(true_end, vars.start + jobs[j].duration);
        terms.true_ends.push_back(true_end);
        starts.push_back(vars.start);
    }

    terms.makespan = cp.NewIntVar(Domain(0, horizon)).WithName("makespan");
    if (terms.true_ends.empty()) {
        cp.AddEquality(terms.makespan, 0);
    } else {
        cp.AddMaxEquality(terms.makespan, terms.true_ends);
    }

    // ── Proximity penalty ────────────────────
    terms.proximity_pairs = proximity_candidates(jobs, proximity_);
    for (const auto& [i, j] : terms.proximity_pairs) {
        const auto& vi = model.vars(i);
        const auto& vj = model.vars(j);
        const JobId id_i = jobs[i].id;
        const JobId id_j = jobs[j].id;

        sat::IntVar gap = cp.NewIntVar(Domain(0, horizon))
                              .WithName(std::format("abs_diff_{}_{}", id_i, id_j));
        cp.AddAbsEquality(gap, terms.true_ends[i] - terms.true_ends[j]);

        sat::BoolVar close_end = cp.NewBoolVar().WithName(std::format("close_end_{}_{}", id_i, id_j));
        cp.AddLessOrEqual(gap, proximity_.threshold).OnlyEnforceIf(close_end);
        cp.AddGreaterThan(gap, proximity_.threshold).OnlyEnforceIf(close_end.Not());

        sat::BoolVar diff_rack = cp.NewBoolVar().WithName(std::format("diff_rack_{}_{}", id_i, id_j));
        cp.AddNotEqual(vi.rack, vj.rack).OnlyEnforceIf(diff_rack);
        cp.AddEquality(vi.rack, vj.rack).OnlyEnforceIf(diff_rack.Not());

        sat::BoolVar penalized = cp.NewBoolVar().WithName(std::format("penalized_{}_{}", id_i, id_j));
        cp.AddBoolAnd({close_end, diff_rack}).OnlyEnforceIf(penalized);
        cp.AddBoolOr({close_end.Not(), diff_rack.Not()}).OnlyEnforceIf(penalized.Not());
        terms.penalized.push_back(penalized);
    }

    terms.proximity_penalty =
        cp.NewIntVar(Domain(0, static_cast<int64_t>(terms.penalized.size())))
            .WithName("proximity_penalty");
    cp.AddEquality(terms.proximity_penalty, sat::LinearExpr::Sum(terms.penalized));

    // ── Load balance and printer usage ───────
    std::vector<sat::IntVar> counts;
    for (const auto& [pid, intervals] : model.printer_intervals()) {
        const std::vector<sat::BoolVar> presences = model.presences_on(pid);
        sat::IntVar count = cp.NewIntVar(Domain(0, n)).WithName(std::format("job_count_p{}", pid));
        cp.AddEquality(count, sat::LinearExpr::Sum(presences));
        counts.push_back(count);

        sat::BoolVar used = cp.NewBoolVar().WithName(std::format("printer_used_{}", pid));
        if (presences.empty()) {
            cp.FixVariable(used, false);
        } else {
            cp.AddBoolOr(presences).OnlyEnforceIf(used);
            for (const auto& present : presences) {
                cp.AddImplication(present, used);
            }
        }
        terms.printer_used.push_back(used);
    }
    terms.max_load = cp.NewIntVar(Domain(0, n)).WithName("max_job_count");
    if (counts.empty()) {
        cp.AddEquality(terms.max_load, 0);
    } else {
        cp.AddMaxEquality(terms.max_load, counts);
    }

    // ── Tie-break: front-load starts ─────────
    terms.total_start = cp.NewIntVar(Domain(0, horizon * std::max<int64_t>(1, n)))
                            .WithName("total_start_time");
    cp.AddEquality(terms.total_start, sat::LinearExpr::Sum(starts));

    const auto printer_count = static_cast<int64_t>(terms.printer_used.size());
    terms.printers_used = cp.NewIntVar(Domain(0, printer_count)).WithName("printers_used");
    cp.AddEquality(terms.printers_used, sat::LinearExpr::Sum(terms.printer_used));

    sat::LinearExpr objective;
    if (weights_.mode == ObjectiveMode::MakespanAndPrinters) {
        objective += sat::LinearExpr::Term(terms.makespan, printer_count + 1);
        objective += terms.printers_used;
        objective += terms.total_start;
    } else {
        objective += sat::LinearExpr::Term(terms.makespan, weights_.makespan);
        objective += sat::LinearExpr::Term(terms.proximity_penalty, weights_.proximity);
        objective += sat::LinearExpr::Term(terms.max_load, weights_.load);
        objective += sat::LinearExpr::Term(terms.total_start, weights_.tiebreak);
    }
    cp.Minimize(objective);

    return terms;
}

}  // namespace print_scheduler
