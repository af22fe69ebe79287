/**
 * @file schedule_csv.hpp
 * @brief Schedule and unscheduled-job export.
 *
 * Minute offsets are written as-is and also rendered as wall-clock times
 * relative to the schedule epoch (midnight of the start date, UTC).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "orchestrator/schedule_result.hpp"

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace print_scheduler {

/// Parse `YYYY-MM-DD`.
[[nodiscard]] Result<std::chrono::sys_days> parse_date(std::string_view text);

/// `YYYY-MM-DD HH:MM` for `epoch + minutes`.
[[nodiscard]] std::string format_datetime(std::chrono::sys_days epoch, Minutes minutes);

void write_schedule_csv(std::ostream& out, const ScheduleResult& result,
                        std::chrono::sys_days epoch);
void write_unscheduled_csv(std::ostream& out, const ScheduleResult& result);

[[nodiscard]] Result<void> write_schedule_csv(const std::filesystem::path& path,
                                              const ScheduleResult& result,
                                              std::chrono::sys_days epoch);
[[nodiscard]] Result<void> write_unscheduled_csv(const std::filesystem::path& path,
                                                 const ScheduleResult& result);

}  // namespace print_scheduler
