/**
 * @file printer_roster.cpp
 * @brief PrinterRoster indexing and TOML loading.
 */

#include "roster/printer_roster.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <toml++/toml.hpp>

namespace print_scheduler {

std::string normalize_capability(std::string_view value) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!value.empty() && is_space(value.front())) value.remove_prefix(1);
    while (!value.empty() && is_space(value.back())) value.remove_suffix(1);

    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_compatible(const Job& job, const Printer& printer) {
    return normalize_capability(job.material) == normalize_capability(printer.material)
        && normalize_capability(job.technology) == normalize_capability(printer.technology)
        && normalize_capability(job.machine_model) == normalize_capability(printer.machine_model);
}

// ─────────────────────────────────────────────
// PrinterRoster
// ─────────────────────────────────────────────

PrinterRoster::PrinterRoster(std::vector<Printer> printers)
    : printers_(std::move(printers)) {
    std::set<std::string> rack_names;
    for (size_t i = 0; i < printers_.size(); ++i) {
        position_[printers_[i].id] = i;
        rack_names.insert(printers_[i].rack);
    }
    racks_.assign(rack_names.begin(), rack_names.end());

    for (const auto& printer : printers_) {
        auto it = std::lower_bound(racks_.begin(), racks_.end(), printer.rack);
        rack_of_[printer.id] = static_cast<int64_t>(it - racks_.begin());
    }
}

Result<PrinterRoster> PrinterRoster::create(std::vector<Printer> printers) {
    std::set<PrinterId> seen;
    for (const auto& printer : printers) {
        if (!seen.insert(printer.id).second) {
            return Error{ErrorKind::Configuration,
                         "Duplicate printer id " + std::to_string(printer.id)};
        }
        if (normalize_capability(printer.material).empty() ||
            normalize_capability(printer.technology).empty() ||
            normalize_capability(printer.machine_model).empty()) {
            return Error{ErrorKind::Configuration,
                         "Printer " + std::to_string(printer.id)
                         + " is missing material, technology or model"};
        }
    }
    return PrinterRoster{std::move(printers)};
}

const Printer* PrinterRoster::find(PrinterId id) const {
    auto it = position_.find(id);
    if (it == position_.end()) return nullptr;
    return &printers_[it->second];
}

std::vector<PrinterId> PrinterRoster::compatible_printers(const Job& job) const {
    std::vector<PrinterId> ids;
    for (const auto& printer : printers_) {
        if (is_compatible(job, printer)) {
            ids.push_back(printer.id);
        }
    }
    return ids;
}

bool PrinterRoster::is_routable(const Job& job) const {
    return std::any_of(printers_.begin(), printers_.end(),
                       [&job](const Printer& p) { return is_compatible(job, p); });
}

size_t PrinterRoster::count_supporting(std::string_view material,
                                       std::string_view technology) const {
    const auto mat = normalize_capability(material);
    const auto tech = normalize_capability(technology);
    return static_cast<size_t>(std::count_if(printers_.begin(), printers_.end(),
        [&](const Printer& p) {
            return normalize_capability(p.material) == mat
                && normalize_capability(p.technology) == tech;
        }));
}

int64_t PrinterRoster::rack_index(PrinterId id) const {
    auto it = rack_of_.find(id);
    return it == rack_of_.end() ? -1 : it->second;
}

// ─────────────────────────────────────────────
// TOML loading
// ─────────────────────────────────────────────

Result<PrinterRoster> load_roster(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Io, "Roster file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        auto* entries = tbl["printer"].as_array();
        if (entries == nullptr) {
            return Error{ErrorKind::EmptyRoster,
                         "Roster file has no [[printer]] entries: " + path.string()};
        }

        std::vector<Printer> printers;
        printers.reserve(entries->size());
        for (const auto& entry : *entries) {
            const auto* row = entry.as_table();
            if (row == nullptr) {
                return Error{ErrorKind::Parse, "Each [[printer]] entry must be a table"};
            }
            auto id = (*row)["id"].value<int64_t>();
            if (!id) {
                return Error{ErrorKind::Parse, "Printer entry is missing an integer id"};
            }
            printers.push_back(Printer{
                .id = *id,
                .name = (*row)["name"].value_or(std::string{"Printer " + std::to_string(*id)}),
                .material = (*row)["material"].value_or(std::string{}),
                .technology = (*row)["technology"].value_or(std::string{}),
                .machine_model = (*row)["model"].value_or(std::string{}),
                .rack = (*row)["rack"].value_or(std::string{"default"})
            });
        }

        if (printers.empty()) {
            return Error{ErrorKind::EmptyRoster, "Roster file lists no printers: " + path.string()};
        }
        return PrinterRoster::create(std::move(printers));

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace print_scheduler
