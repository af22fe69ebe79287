/**
 * @file objective.hpp
 * @brief Weighted multi-term objective for a batch model.
 *
 *   minimize  w_makespan  × makespan
 *           + w_proximity × clustered different-rack finishes
 *           + w_load      × max jobs on one printer
 *           + w_tiebreak  × Σ start
 *
 * or, in makespan-and-printers mode,
 *
 *   minimize  makespan × (P + 1) + Σ used_p + Σ start
 *
 * where P is the number of printers in the model, so one minute of makespan
 * always outweighs switching on every printer.
 *
 * Makespan is measured on true ends (start + nominal duration): the
 * scheduling buffer never inflates the reported finish time.
 */

#pragma once

#include "core/config.hpp"
#include "scheduler/batch_model.hpp"

#include <span>
#include <utility>
#include <vector>

namespace print_scheduler {

enum class ObjectiveMode {
    Composite,
    MakespanAndPrinters
};

struct ObjectiveWeights {
    int64_t makespan = 1;
    int64_t proximity = 5;
    int64_t load = 30;
    int64_t tiebreak = 1;
    ObjectiveMode mode = ObjectiveMode::Composite;   ///< Weights are ignored outside Composite

    static ObjectiveWeights from_config(const Config& config);
};

/**
 * @brief Bounds of the proximity scan.
 *
 * Jobs are sorted by duration and each job is compared only with the next
 * `lookahead - 1` jobs, stopping early once durations differ by more than
 * `max_duration_gap`. Raising either bound finds more clustered pairs at the
 * cost of a larger model; neither bound changes feasibility.
 */
struct ProximitySettings {
    Minutes threshold = 30;
    size_t lookahead = 20;
    Minutes max_duration_gap = 60;

    static ProximitySettings from_config(const Config& config);
};

/// Index pair (i, j) into the batch's job list.
using JobPair = std::pair<size_t, size_t>;

/**
 * @brief Same-technology pairs inside the sliding window over duration-sorted jobs.
 */
[[nodiscard]] std::vector<JobPair> proximity_candidates(std::span<const Job> jobs,
                                                        const ProximitySettings& settings);

/**
 * @brief Handles to each objective term, for reporting realized values.
 */
struct ObjectiveTerms {
    sat::IntVar makespan;
    sat::IntVar proximity_penalty;
    sat::IntVar max_load;
    sat::IntVar total_start;
    sat::IntVar printers_used;
    std::vector<sat::BoolVar> printer_used;     ///< used_p <=> some job runs on printer p
    std::vector<sat::IntVar> true_ends;         ///< start + nominal duration, per job
    std::vector<JobPair> proximity_pairs;
    std::vector<sat::BoolVar> penalized;        ///< One indicator per proximity pair
};

class ObjectiveComposer {
public:
    ObjectiveComposer(ObjectiveWeights weights, ProximitySettings proximity);

    /// Adds the auxiliary variables and sets the model's objective.
    ObjectiveTerms compose(BatchModel& model) const;

    [[nodiscard]] const ObjectiveWeights& weights() const noexcept { return weights_; }
    [[nodiscard]] const ProximitySettings& proximity() const noexcept { return proximity_; }

private:
    ObjectiveWeights weights_;
    ProximitySettings proximity_;
};

}  // namespace print_scheduler
