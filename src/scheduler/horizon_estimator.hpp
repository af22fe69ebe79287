/**
 * @file horizon_estimator.hpp
 * @brief Per-batch scheduling window from workload vs. printer capacity.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "roster/printer_roster.hpp"

#include <span>
#include <string>
#include <vector>

namespace print_scheduler {

struct HorizonSettings {
    Minutes minutes_per_day = 12 * kMinutesPerHour;   ///< One shift counts as one planning day
    double safety_factor = 3.0;
    int64_t pad_days = 2;
    double min_days = 0.1;

    static HorizonSettings from_config(const Config& config);
};

/**
 * @brief Work and capacity of one (material, technology) pairing in a batch.
 */
struct PairingLoad {
    std::string material;
    std::string technology;
    Minutes work{0};
    size_t printer_count{0};
    double days_needed{0.0};     ///< 0 when no printer supports the pairing
};

struct HorizonEstimate {
    double days_needed{0.0};     ///< Busiest pairing, after the degenerate substitution
    int64_t planning_days{0};    ///< floor(days_needed × safety) + pad
    Minutes horizon{0};
    bool degenerate{false};      ///< Zero work: min_days was substituted
    std::vector<PairingLoad> pairings;
    std::vector<PairingLoad> unsupported;
};

/**
 * @brief Sizes the horizon of a batch from its busiest pairing.
 *
 * days(pairing) = work / (minutes_per_day × supporting printers)
 * horizon       = minutes_per_day × (floor(max days × safety_factor) + pad_days)
 *
 * Pairings no printer supports are logged and reported but do not stop the
 * estimate; those jobs fail later, at routing or solve time.
 */
class HorizonEstimator {
public:
    HorizonEstimator(const PrinterRoster& roster, HorizonSettings settings, Logger& logger);

    [[nodiscard]] HorizonEstimate estimate(std::span<const Job> jobs) const;

    [[nodiscard]] const HorizonSettings& settings() const noexcept { return settings_; }

private:
    const PrinterRoster& roster_;
    HorizonSettings settings_;
    Logger& logger_;
};

}  // namespace print_scheduler
