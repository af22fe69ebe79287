/**
 * @file job_generator.hpp
 * @brief Synthetic job lists and a reference print-farm roster.
 *
 * Used by the demo mode, the benchmark and the test suites. Real runs read
 * jobs from CSV and the roster from TOML.
 */

#pragma once

#include "core/types.hpp"
#include "roster/printer_roster.hpp"

#include <random>
#include <string_view>
#include <vector>

namespace print_scheduler {

class JobGenerator {
public:
    /// `count` identical jobs titled `<prefix>_<i>` with ids starting at `first_id`.
    static std::vector<Job> uniform(size_t count,
                                    const Job& base,
                                    std::string_view prefix = "job",
                                    JobId first_id = 0);

    /// Runs of one part: `runs` plates titled `<part>_R<n>`, as plate slicing emits them.
    static std::vector<Job> part_runs(std::string_view part,
                                      size_t runs,
                                      const Job& base,
                                      JobId first_id = 0);

    /// Random routable jobs drawn from the roster's capability combinations.
    static std::vector<Job> random_for_roster(const PrinterRoster& roster,
                                              size_t count,
                                              Minutes min_duration,
                                              Minutes max_duration,
                                              std::mt19937& rng);

    /// Eleven-printer farm: one large-format PETG printer on rack 1, six
    /// desktop FDM printers on rack 2, four XL FDM printers on rack 3.
    static PrinterRoster reference_roster();
};

}  // namespace print_scheduler
