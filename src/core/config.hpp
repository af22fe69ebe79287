/**
 * @file config.hpp
 * @brief Scheduler configuration with TOML deserialization and validation.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace print_scheduler {

struct ShiftConfig {
    uint32_t start_hour = 8;            ///< Earliest start, hours after the epoch
    uint32_t length_hours = 12;

    [[nodiscard]] constexpr Minutes start_minutes() const noexcept {
        return static_cast<Minutes>(start_hour) * kMinutesPerHour;
    }
    [[nodiscard]] constexpr Minutes length_minutes() const noexcept {
        return static_cast<Minutes>(length_hours) * kMinutesPerHour;
    }
};

struct BatchingConfig {
    Minutes capacity_override_minutes = 0;   ///< 0 = shift length × printer count
};

struct HorizonConfig {
    double safety_factor = 3.0;
    int64_t pad_days = 2;
    double min_days = 0.1;               ///< Used when a batch carries no work
};

struct ObjectiveConfig {
    /// "composite": weighted makespan, proximity, load and tie-break terms.
    /// "makespan_and_printers": makespan first, then fewest printers used,
    /// then earliest starts; the weights are ignored.
    std::string mode = "composite";
    int64_t makespan_weight = 1;
    int64_t proximity_weight = 5;
    int64_t load_weight = 30;
    int64_t tiebreak_weight = 1;
};

struct ProximityConfig {
    Minutes threshold_minutes = 30;      ///< Finishes this close count as clustered
    uint32_t lookahead = 20;             ///< Window size over duration-sorted jobs
    Minutes max_duration_gap_minutes = 60;
};

struct JobsConfig {
    Minutes buffer_minutes = 0;
    std::string unroutable_policy = "reject";   ///< "reject" or "fail"
};

struct SolverConfig {
    double time_limit_seconds = 100.0;
    uint32_t num_workers = 8;
    int32_t random_seed = 0;
    bool log_search = false;
    uint32_t parallel_batches = 1;       ///< >1 solves batches on a worker pool
};

struct TelemetryConfig {
    std::filesystem::path log_dir;       ///< Empty = log to stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::filesystem::path events_file;   ///< Empty = no event stream
};

/**
 * @brief Top-level run configuration.
 */
struct Config {
    ShiftConfig shift;
    BatchingConfig batching;
    HorizonConfig horizon;
    ObjectiveConfig objective;
    ProximityConfig proximity;
    JobsConfig jobs;
    SolverConfig solver;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. Missing keys keep defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject weights, thresholds and budgets the engine cannot honor.
 *
 * Returns an ErrorKind::Configuration error naming the first offending key.
 */
Result<void> validate_config(const Config& config);

}  // namespace print_scheduler
