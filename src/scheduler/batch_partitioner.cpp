/**
 * @file batch_partitioner.cpp
 * @brief GreedyTitlePartitioner: title-ordered greedy bin fill.
 *
 * Algorithm:
 *   sort jobs by title (stable)
 *   for each job:
 *     if current_total + duration <= capacity: append to current batch
 *     else: close current batch (if non-empty), open a new one with the job
 *
 * Complexity: O(J log J) for the sort, O(J) for the fill.
 */

#include "scheduler/batch_partitioner.hpp"

#include <algorithm>
#include <numeric>

namespace print_scheduler {

Minutes batch_capacity(Minutes shift_length_minutes, size_t printer_count) noexcept {
    return shift_length_minutes * static_cast<Minutes>(std::max<size_t>(1, printer_count));
}

Minutes total_duration(std::span<const Job> jobs) noexcept {
    return std::accumulate(jobs.begin(), jobs.end(), Minutes{0},
                           [](Minutes acc, const Job& job) { return acc + job.duration; });
}

std::vector<Batch> GreedyTitlePartitioner::partition(std::span<const Job> jobs,
                                                     Minutes capacity) const {
    std::vector<const Job*> ordered;
    ordered.reserve(jobs.size());
    for (const auto& job : jobs) {
        ordered.push_back(&job);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Job* a, const Job* b) { return a->title < b->title; });

    std::vector<Batch> batches;
    Batch current;
    Minutes current_total = 0;

    for (const Job* job : ordered) {
        if (current_total + job->duration <= capacity) {
            current.push_back(*job);
            current_total += job->duration;
            continue;
        }
        // Overflow: an oversized job on an empty batch still gets its own batch
        if (!current.empty()) {
            batches.push_back(std::move(current));
            current = Batch{};
        }
        current.push_back(*job);
        current_total = job->duration;
    }

    if (!current.empty()) {
        batches.push_back(std::move(current));
    }
    return batches;
}

}  // namespace print_scheduler
