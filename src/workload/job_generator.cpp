/**
 * @file job_generator.cpp
 * @brief Synthetic job generators and the reference roster.
 */

#include "workload/job_generator.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <stdexcept>
#include <tuple>

namespace print_scheduler {

std::vector<Job> JobGenerator::uniform(size_t count,
                                       const Job& base,
                                       std::string_view prefix,
                                       JobId first_id) {
    std::vector<Job> jobs;
    jobs.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Job job = base;
        job.id = first_id + static_cast<JobId>(i);
        job.title = std::format("{}_{:03}", prefix, i);
        jobs.push_back(std::move(job));
    }
    return jobs;
}

std::vector<Job> JobGenerator::part_runs(std::string_view part,
                                         size_t runs,
                                         const Job& base,
                                         JobId first_id) {
    std::vector<Job> jobs;
    jobs.reserve(runs);
    for (size_t run = 1; run <= runs; ++run) {
        Job job = base;
        job.id = first_id + static_cast<JobId>(run - 1);
        job.title = std::format("{}_R{}", part, run);
        jobs.push_back(std::move(job));
    }
    return jobs;
}

std::vector<Job> JobGenerator::random_for_roster(const PrinterRoster& roster,
                                                 size_t count,
                                                 Minutes min_duration,
                                                 Minutes max_duration,
                                                 std::mt19937& rng) {
    if (roster.empty()) return {};

    // Distinct capability combinations, so every generated job is routable
    std::set<std::tuple<std::string, std::string, std::string>> combos;
    for (const auto& printer : roster.printers()) {
        combos.emplace(printer.material, printer.technology, printer.machine_model);
    }
    std::vector<std::tuple<std::string, std::string, std::string>> choices(combos.begin(),
                                                                          combos.end());

    std::uniform_int_distribution<size_t> pick(0, choices.size() - 1);
    std::uniform_int_distribution<Minutes> duration(std::max<Minutes>(1, min_duration),
                                                    std::max(min_duration, max_duration));

    std::vector<Job> jobs;
    jobs.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const auto& [material, technology, model] = choices[pick(rng)];
        jobs.push_back(Job{
            .id = static_cast<JobId>(i),
            .title = std::format("part_{:04}_R1", i),
            .material = material,
            .technology = technology,
            .machine_model = model,
            .duration = duration(rng),
            .plate_quantity = 1
        });
    }
    return jobs;
}

PrinterRoster JobGenerator::reference_roster() {
    std::vector<Printer> printers{
        {1,  "Lucy Caracol 01", "PETG",    "LFAM", "Caracol HF", "1"},
        {5,  "Core 001",        "Fiberon", "FDM",  "Core One",   "2"},
        {6,  "Core 002",        "Fiberon", "FDM",  "Core One",   "2"},
        {7,  "Core 003",        "Fiberon", "FDM",  "Core One",   "2"},
        {8,  "Core 004",        "PETG",    "FDM",  "Core One",   "2"},
        {9,  "Core 005",        "PETG",    "FDM",  "Core One",   "2"},
        {10, "Core 006",        "PETG",    "FDM",  "Core One",   "2"},
        {11, "XL 001",          "PETG",    "FDM",  "XL",         "3"},
        {12, "XL 002",          "PETG",    "FDM",  "XL",         "3"},
        {13, "XL 003",          "PETG",    "FDM",  "XL",         "3"},
        {14, "XL 004",          "PETG",    "FDM",  "XL",         "3"},
    };
    auto roster = PrinterRoster::create(std::move(printers));
    if (!roster) {
        throw std::logic_error("reference roster is inconsistent: " + roster.error().message);
    }
    return std::move(roster).value();
}

}  // namespace print_scheduler
