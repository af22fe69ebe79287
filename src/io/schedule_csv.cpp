/**
 * @file schedule_csv.cpp
 * @brief CSV writers for ScheduleResult.
 */

#include "io/schedule_csv.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <tuple>
#include <vector>

namespace print_scheduler {

namespace {

/// Quote a field when it contains a separator, quote or line break.
std::string csv_field(std::string_view value) {
    if (value.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(value);
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

bool parse_component(std::string_view text, int& out) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

Result<std::ofstream> open_for_write(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorKind::Io, std::format("Cannot create {}: {}",
                                                    path.parent_path().string(), ec.message())};
        }
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Error{ErrorKind::Io, "Cannot open for writing: " + path.string()};
    }
    return file;
}

}  // namespace

Result<std::chrono::sys_days> parse_date(std::string_view text) {
    using namespace std::chrono;

    int y = 0, m = 0, d = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-'
        || !parse_component(text.substr(0, 4), y)
        || !parse_component(text.substr(5, 2), m)
        || !parse_component(text.substr(8, 2), d)) {
        return Error{ErrorKind::Parse,
                     std::format("Invalid date '{}': expected YYYY-MM-DD", text)};
    }
    const year_month_day date{year{y}, month{static_cast<unsigned>(m)},
                              day{static_cast<unsigned>(d)}};
    if (!date.ok()) {
        return Error{ErrorKind::Parse, std::format("Invalid calendar date '{}'", text)};
    }
    return sys_days{date};
}

std::string format_datetime(std::chrono::sys_days epoch, Minutes minutes) {
    const auto at = epoch + std::chrono::minutes{minutes};
    return std::format("{:%Y-%m-%d %H:%M}", at);
}

void write_schedule_csv(std::ostream& out, const ScheduleResult& result,
                        std::chrono::sys_days epoch) {
    out << "job_id,job_title,batch_number,technology,material,machine_model,plate_quantity,"
           "printer,printer_name,rack,start,end,true_end,start_datetime,end_datetime\n";

    std::vector<const ScheduledJob*> rows;
    rows.reserve(result.scheduled.size());
    for (const auto& job : result.scheduled) {
        rows.push_back(&job);
    }
    std::stable_sort(rows.begin(), rows.end(), [](const ScheduledJob* a, const ScheduledJob* b) {
        return std::tie(a->start, a->printer_id) < std::tie(b->start, b->printer_id);
    });

    for (const ScheduledJob* job : rows) {
        out << job->job_id << ','
            << csv_field(job->title) << ','
            << job->batch_number << ','
            << csv_field(job->technology) << ','
            << csv_field(job->material) << ','
            << csv_field(job->machine_model) << ','
            << job->plate_quantity << ','
            << job->printer_id << ','
            << csv_field(job->printer_name) << ','
            << csv_field(job->rack) << ','
            << job->start << ','
            << job->end << ','
            << job->true_end << ','
            << format_datetime(epoch, job->start) << ','
            << format_datetime(epoch, job->true_end) << '\n';
    }
}

void write_unscheduled_csv(std::ostream& out, const ScheduleResult& result) {
    out << "job_id,job_title,material,technology,machine_model,duration,reason,batch_number\n";
    for (const auto& entry : result.unscheduled) {
        out << entry.job.id << ','
            << csv_field(entry.job.title) << ','
            << csv_field(entry.job.material) << ','
            << csv_field(entry.job.technology) << ','
            << csv_field(entry.job.machine_model) << ','
            << entry.job.duration << ','
            << to_string(entry.reason) << ',';
        if (entry.batch_number) out << *entry.batch_number;
        out << '\n';
    }
}

Result<void> write_schedule_csv(const std::filesystem::path& path,
                                const ScheduleResult& result,
                                std::chrono::sys_days epoch) {
    auto file = open_for_write(path);
    if (!file) return file.error();
    write_schedule_csv(*file, result, epoch);
    file->flush();
    if (!*file) {
        return Error{ErrorKind::Io, "Write failed: " + path.string()};
    }
    return {};
}

Result<void> write_unscheduled_csv(const std::filesystem::path& path,
                                   const ScheduleResult& result) {
    auto file = open_for_write(path);
    if (!file) return file.error();
    write_unscheduled_csv(*file, result);
    file->flush();
    if (!*file) {
        return Error{ErrorKind::Io, "Write failed: " + path.string()};
    }
    return {};
}

}  // namespace print_scheduler
