/**
 * @file job_csv.hpp
 * @brief Job list ingestion from CSV.
 *
 * Expected header (column order is free, `plate_quantity` is optional):
 *   job_id,job_title,material,technology,machine_model,duration,plate_quantity
 * Fields may be double-quoted; a doubled quote inside a quoted field is a
 * literal quote.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace print_scheduler {

/// Split one CSV record into fields. Fails on an unterminated quote.
[[nodiscard]] Result<std::vector<std::string>> split_csv_line(std::string_view line);

/// Parse jobs from a stream. Errors carry the 1-based line number.
[[nodiscard]] Result<std::vector<Job>> parse_jobs_csv(std::istream& input);

[[nodiscard]] Result<std::vector<Job>> read_jobs_csv(const std::filesystem::path& path);

}  // namespace print_scheduler
