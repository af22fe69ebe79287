/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <format>
#include <limits>
#include <optional>

#include <toml++/toml.hpp>

namespace print_scheduler {

namespace {

Error config_error(std::string message) {
    return Error{ErrorKind::Configuration, std::move(message)};
}

/// Narrow a TOML integer into [lo, hi]; out-of-range values are an error, never wrapped.
template <typename T>
Result<T> read_integer(toml::node_view<toml::node> section, std::string_view section_name,
                       std::string_view key, T fallback,
                       int64_t lo = 0,
                       int64_t hi = static_cast<int64_t>(std::numeric_limits<T>::max())) {
    const int64_t value = section[key].value_or(static_cast<int64_t>(fallback));
    if (value < lo || value > hi) {
        return config_error(std::format("{}.{} must be within {}..{}, got {}",
                                        section_name, key, lo, hi, value));
    }
    return static_cast<T>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        std::optional<Error> failure;
        auto narrow = [&failure](auto&& read, auto& out) {
            if (failure) return;
            if (auto value = read; value) {
                out = *value;
            } else {
                failure = value.error();
            }
        };

        // [shift]
        if (auto shift = tbl["shift"]; shift.is_table()) {
            narrow(read_integer<uint32_t>(shift, "shift", "start_hour", 8u), config.shift.start_hour);
            narrow(read_integer<uint32_t>(shift, "shift", "length_hours", 12u),
                   config.shift.length_hours);
        }

        // [batching]
        if (auto batching = tbl["batching"]; batching.is_table()) {
            config.batching.capacity_override_minutes =
                batching["capacity_override_minutes"].value_or(int64_t{0});
        }

        // [horizon]
        if (auto horizon = tbl["horizon"]; horizon.is_table()) {
            config.horizon.safety_factor = horizon["safety_factor"].value_or(3.0);
            config.horizon.pad_days = horizon["pad_days"].value_or(int64_t{2});
            config.horizon.min_days = horizon["min_days"].value_or(0.1);
        }

        // [objective]
        if (auto objective = tbl["objective"]; objective.is_table()) {
            config.objective.makespan_weight = objective["makespan_weight"].value_or(int64_t{1});
            config.objective.proximity_weight = objective["proximity_weight"].value_or(int64_t{5});
            config.objective.load_weight = objective["load_weight"].value_or(int64_t{30});
            config.objective.tiebreak_weight = objective["tiebreak_weight"].value_or(int64_t{1});
            config.objective.mode = objective["mode"].value_or(std::string{"composite"});
        }

        // [proximity]
        if (auto proximity = tbl["proximity"]; proximity.is_table()) {
            config.proximity.threshold_minutes =
                proximity["threshold_minutes"].value_or(int64_t{30});
            narrow(read_integer<uint32_t>(proximity, "proximity", "lookahead", 20u),
                   config.proximity.lookahead);
            config.proximity.max_duration_gap_minutes =
                proximity["max_duration_gap_minutes"].value_or(int64_t{60});
        }

        // [jobs]
        if (auto jobs = tbl["jobs"]; jobs.is_table()) {
            config.jobs.buffer_minutes = jobs["buffer_minutes"].value_or(int64_t{0});
            config.jobs.unroutable_policy =
                jobs["unroutable_policy"].value_or(std::string{"reject"});
        }

        // [solver]
        if (auto solver = tbl["solver"]; solver.is_table()) {
            config.solver.time_limit_seconds = solver["time_limit_seconds"].value_or(100.0);
            narrow(read_integer<uint32_t>(solver, "solver", "num_workers", 8u),
                   config.solver.num_workers);
            narrow(read_integer<int32_t>(solver, "solver", "random_seed", 0,
                                         std::numeric_limits<int32_t>::min()),
                   config.solver.random_seed);
            config.solver.log_search = solver["log_search"].value_or(false);
            narrow(read_integer<uint32_t>(solver, "solver", "parallel_batches", 1u),
                   config.solver.parallel_batches);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            narrow(read_integer<uint32_t>(telemetry, "telemetry", "max_file_size_mb", 50u),
                   config.telemetry.max_file_size_mb);
            narrow(read_integer<uint32_t>(telemetry, "telemetry", "rotate_count", 5u),
                   config.telemetry.rotate_count);
            config.telemetry.events_file = telemetry["events_file"].value_or(std::string{});
        }

        if (failure) return *failure;
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& shift = config.shift;
    if (shift.start_hour > 23) {
        return config_error("shift.start_hour must be within 0..23");
    }
    if (shift.length_hours == 0 || shift.length_hours > 24) {
        return config_error("shift.length_hours must be within 1..24");
    }

    if (config.batching.capacity_override_minutes < 0) {
        return config_error("batching.capacity_override_minutes must not be negative");
    }

    const auto& horizon = config.horizon;
    if (!(horizon.safety_factor >= 1.0)) {
        return config_error("horizon.safety_factor must be at least 1.0");
    }
    if (horizon.pad_days < 0) {
        return config_error("horizon.pad_days must not be negative");
    }
    if (!(horizon.min_days > 0.0)) {
        return config_error("horizon.min_days must be positive");
    }

    const auto& objective = config.objective;
    if (objective.makespan_weight < 0 || objective.proximity_weight < 0 ||
        objective.load_weight < 0 || objective.tiebreak_weight < 0) {
        return config_error("objective weights must not be negative");
    }
    if (objective.makespan_weight + objective.proximity_weight +
        objective.load_weight + objective.tiebreak_weight == 0) {
        return config_error("at least one objective weight must be positive");
    }

    if (objective.mode != "composite" && objective.mode != "makespan_and_printers") {
        return config_error("objective.mode must be \"composite\" or \"makespan_and_printers\", "
                            "got \"" + objective.mode + "\"");
    }

    const auto& proximity = config.proximity;
    if (proximity.threshold_minutes < 0) {
        return config_error("proximity.threshold_minutes must not be negative");
    }
    if (proximity.lookahead == 0) {
        return config_error("proximity.lookahead must be at least 1");
    }
    if (proximity.max_duration_gap_minutes < 0) {
        return config_error("proximity.max_duration_gap_minutes must not be negative");
    }

    if (config.jobs.buffer_minutes < 0) {
        return config_error("jobs.buffer_minutes must not be negative");
    }
    if (config.jobs.unroutable_policy != "reject" && config.jobs.unroutable_policy != "fail") {
        return config_error("jobs.unroutable_policy must be \"reject\" or \"fail\", got \""
                            + config.jobs.unroutable_policy + "\"");
    }

    const auto& solver = config.solver;
    if (!(solver.time_limit_seconds > 0.0)) {
        return config_error("solver.time_limit_seconds must be positive");
    }
    if (solver.num_workers == 0) {
        return config_error("solver.num_workers must be at least 1");
    }
    if (solver.parallel_batches == 0) {
        return config_error("solver.parallel_batches must be at least 1");
    }

    if (!parse_log_level(config.telemetry.log_level)) {
        return config_error("telemetry.log_level must be debug, info, warn or error, got \""
                            + config.telemetry.log_level + "\"");
    }

    return {};
}

}  // namespace print_scheduler
