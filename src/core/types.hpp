/**
 * @file types.hpp
 * @brief Fundamental value types shared by every PrintScheduler module.
 *
 * Jobs and printers are created by ingestion and treated as read-only by the
 * engine. All times are integer minutes measured from the schedule epoch
 * (midnight of the schedule start date).
 */

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace print_scheduler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = int64_t;
using PrinterId = int64_t;
using Minutes = int64_t;

inline constexpr Minutes kMinutesPerHour = 60;

// ─────────────────────────────────────────────
// Job
// ─────────────────────────────────────────────

/**
 * @brief One unit of print work (a single build plate run).
 *
 * `duration` is the nominal print time in minutes and must be strictly
 * positive. Any global inter-job buffer is configuration, not job state.
 */
struct Job {
    JobId id{0};
    std::string title;
    std::string material;
    std::string technology;
    std::string machine_model;
    Minutes duration{0};
    int64_t plate_quantity{1};            ///< Parts per plate, carried through to exports

    auto operator<=>(const Job&) const = default;
};

// ─────────────────────────────────────────────
// Printer
// ─────────────────────────────────────────────

/**
 * @brief A physical machine with fixed capabilities and a rack location.
 */
struct Printer {
    PrinterId id{0};
    std::string name;
    std::string material;
    std::string technology;
    std::string machine_model;
    std::string rack;                     ///< Group key for proximity penalties

    auto operator<=>(const Printer&) const = default;
};

// ─────────────────────────────────────────────
// Schedule output
// ─────────────────────────────────────────────

/**
 * @brief A job placed on a printer, with batch offset already applied.
 *
 * `end` closes the busy window (start + duration + buffer); `true_end` is
 * when the print actually finishes (start + duration).
 */
struct ScheduledJob {
    JobId job_id{0};
    std::string title;
    PrinterId printer_id{0};
    std::string printer_name;
    std::string rack;
    Minutes start{0};
    Minutes end{0};
    Minutes true_end{0};
    size_t batch_number{0};
    std::string material;
    std::string technology;
    std::string machine_model;
    int64_t plate_quantity{1};
};

enum class UnscheduledReason : uint8_t {
    UnroutableJob,     ///< No printer matches material/technology/model
    BatchInfeasible,   ///< The job's batch failed to solve
    Cancelled          ///< Run was stopped before the batch was attempted
};

[[nodiscard]] constexpr std::string_view to_string(UnscheduledReason reason) noexcept {
    switch (reason) {
        case UnscheduledReason::UnroutableJob:   return "unroutable";
        case UnscheduledReason::BatchInfeasible: return "batch_infeasible";
        case UnscheduledReason::Cancelled:       return "cancelled";
    }
    return "unknown";
}

/**
 * @brief A job that received no assignment, with the reason why.
 */
struct UnscheduledJob {
    Job job;
    UnscheduledReason reason = UnscheduledReason::BatchInfeasible;
    std::optional<size_t> batch_number;   ///< Unset for unroutable jobs
};

}  // namespace print_scheduler
