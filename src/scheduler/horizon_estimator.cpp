/**
 * @file horizon_estimator.cpp
 * @brief HorizonEstimator implementation.
 */

#include "scheduler/horizon_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <utility>

namespace print_scheduler {

HorizonSettings HorizonSettings::from_config(const Config& config) {
    return HorizonSettings{
        .minutes_per_day = config.shift.length_minutes(),
        .safety_factor = config.horizon.safety_factor,
        .pad_days = config.horizon.pad_days,
        .min_days = config.horizon.min_days
    };
}

HorizonEstimator::HorizonEstimator(const PrinterRoster& roster,
                                   HorizonSettings settings,
                                   Logger& logger)
    : roster_(roster), settings_(settings), logger_(logger) {}

HorizonEstimate HorizonEstimator::estimate(std::span<const Job> jobs) const {
    HorizonEstimate result;

    // Group work by normalized pairing; keep the first spelling for reporting
    std::map<std::pair<std::string, std::string>, PairingLoad> loads;
    for (const auto& job : jobs) {
        auto key = std::make_pair(normalize_capability(job.material),
                                  normalize_capability(job.technology));
        auto [it, inserted] = loads.try_emplace(key);
        if (inserted) {
            it->second.material = job.material;
            it->second.technology = job.technology;
        }
        it->second.work += job.duration;
    }

    double busiest = 0.0;
    for (auto& [key, load] : loads) {
        load.printer_count = roster_.count_supporting(load.material, load.technology);
        if (load.printer_count == 0) {
            logger_.warn(std::format(
                "Batch contains {} min of {}/{} work but no printer supports that pairing",
                load.work, load.material, load.technology));
            result.unsupported.push_back(load);
            continue;
        }
        load.days_needed = static_cast<double>(load.work)
            / (static_cast<double>(settings_.minutes_per_day)
               * static_cast<double>(load.printer_count));
        busiest = std::max(busiest, load.days_needed);
        result.pairings.push_back(load);
    }

    if (busiest == 0.0 && !jobs.empty()) {
        busiest = settings_.min_days;
        result.degenerate = true;
        logger_.debug(std::format("No estimable work in batch of {} jobs; using {} days",
                                  jobs.size(), settings_.min_days));
    }

    result.days_needed = busiest;
    result.planning_days = static_cast<int64_t>(std::floor(busiest * settings_.safety_factor))
                           + settings_.pad_days;
    result.horizon = settings_.minutes_per_day * result.planning_days;

    logger_.debug(std::format("Horizon: busiest pairing needs {:.2f} days, window {} days = {} min",
                              result.days_needed, result.planning_days, result.horizon));
    return result;
}

}  // namespace print_scheduler
