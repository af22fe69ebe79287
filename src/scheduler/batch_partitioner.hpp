/**
 * @file batch_partitioner.hpp
 * @brief Splits a job list into solver-sized batches.
 *
 * A batch is solved as one constraint model, so its total work is capped at
 * the capacity of one shift across the whole roster. The partitioner is a
 * replaceable strategy; GreedyTitlePartitioner is the default.
 */

#pragma once

#include "core/types.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace print_scheduler {

using Batch = std::vector<Job>;

/// Capacity of one batch: shift length × max(1, printer count).
[[nodiscard]] Minutes batch_capacity(Minutes shift_length_minutes, size_t printer_count) noexcept;

[[nodiscard]] Minutes total_duration(std::span<const Job> jobs) noexcept;

/**
 * @brief Strategy interface for batch partitioning.
 *
 * Implementations must place every input job in exactly one batch and keep
 * each batch's total duration within `capacity`, except that a job longer
 * than `capacity` occupies a batch of its own.
 */
class IBatchPartitioner {
public:
    virtual ~IBatchPartitioner() = default;
    [[nodiscard]] virtual std::vector<Batch> partition(std::span<const Job> jobs,
                                                       Minutes capacity) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Stable sort by title, then greedy bin fill in that order.
 *
 * Not bin-packing: the same input always yields the same
 * batch boundaries, and jobs of one part stay together.
 */
class GreedyTitlePartitioner : public IBatchPartitioner {
public:
    [[nodiscard]] std::vector<Batch> partition(std::span<const Job> jobs,
                                               Minutes capacity) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "greedy_title"; }
};

}  // namespace print_scheduler
