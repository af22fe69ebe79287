/**
 * @file job_csv.cpp
 * @brief CSV tokenizer and job row decoding.
 */

#include "io/job_csv.hpp"

#include <array>
#include <charconv>
#include <format>
#include <fstream>
#include <optional>
#include <unordered_map>

namespace print_scheduler {

namespace {

constexpr std::array<std::string_view, 6> kRequiredColumns = {
    "job_id", "job_title", "material", "technology", "machine_model", "duration"
};

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::optional<int64_t> parse_int(std::string_view text) {
    text = trim(text);
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

Error parse_error(size_t line_number, std::string_view message) {
    return Error{ErrorKind::Parse, std::format("line {}: {}", line_number, message)};
}

}  // namespace

Result<std::vector<std::string>> split_csv_line(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool quoted = false;

    // Quoted content is kept verbatim; unquoted fields are trimmed
    auto finish_field = [&] {
        fields.push_back(quoted ? field : std::string(trim(field)));
        field.clear();
        quoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"' && !quoted && trim(field).empty()) {
            field.clear();
            in_quotes = true;
            quoted = true;
        } else if (c == ',') {
            finish_field();
        } else if (c != '\r' && !(quoted && (c == ' ' || c == '\t'))) {
            field.push_back(c);
        }
    }
    if (in_quotes) {
        return Error{ErrorKind::Parse, "unterminated quoted field"};
    }
    finish_field();
    return fields;
}

Result<std::vector<Job>> parse_jobs_csv(std::istream& input) {
    std::string line;
    size_t line_number = 0;

    // ── Header ───────────────────────────────
    std::unordered_map<std::string, size_t> column;
    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) continue;

        auto header = split_csv_line(line);
        if (!header) return parse_error(line_number, header.error().message);
        for (size_t i = 0; i < header->size(); ++i) {
            column.emplace((*header)[i], i);
        }
        break;
    }
    if (column.empty()) {
        return Error{ErrorKind::Parse, "job CSV is empty"};
    }
    for (auto name : kRequiredColumns) {
        if (!column.contains(std::string(name))) {
            return parse_error(line_number, std::format("missing column '{}'", name));
        }
    }
    const auto quantity_column = column.find("plate_quantity");

    // ── Rows ─────────────────────────────────
    std::vector<Job> jobs;
    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) continue;

        auto fields = split_csv_line(line);
        if (!fields) return parse_error(line_number, fields.error().message);

        auto field = [&](std::string_view name) -> const std::string* {
            const size_t index = column.at(std::string(name));
            return index < fields->size() ? &(*fields)[index] : nullptr;
        };
        for (auto name : kRequiredColumns) {
            if (field(name) == nullptr) {
                return parse_error(line_number, std::format("missing value for '{}'", name));
            }
        }

        Job job;
        const auto id = parse_int(*field("job_id"));
        if (!id) {
            return parse_error(line_number, std::format("invalid job_id '{}'", *field("job_id")));
        }
        const auto duration = parse_int(*field("duration"));
        if (!duration || *duration <= 0) {
            return parse_error(line_number,
                               std::format("duration must be a positive integer, got '{}'",
                                           *field("duration")));
        }
        job.id = *id;
        job.duration = *duration;
        job.title = *field("job_title");
        job.material = *field("material");
        job.technology = *field("technology");
        job.machine_model = *field("machine_model");

        if (quantity_column != column.end() && quantity_column->second < fields->size()
            && !(*fields)[quantity_column->second].empty()) {
            const auto quantity = parse_int((*fields)[quantity_column->second]);
            if (!quantity || *quantity < 1) {
                return parse_error(line_number,
                                   std::format("invalid plate_quantity '{}'",
                                               (*fields)[quantity_column->second]));
            }
            job.plate_quantity = *quantity;
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

Result<std::vector<Job>> read_jobs_csv(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorKind::Io, "Cannot open job file: " + path.string()};
    }
    auto jobs = parse_jobs_csv(file);
    if (!jobs) {
        return Error{jobs.error().kind, path.string() + ": " + jobs.error().message};
    }
    return jobs;
}

}  // namespace print_scheduler
