/**
 * @file printer_roster.hpp
 * @brief Static printer roster with capability and rack indexing.
 *
 * The roster is loaded once per run and is read-only afterwards. It answers
 * the two questions the engine keeps asking: which printers can run a job,
 * and which rack a printer sits in.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace print_scheduler {

/**
 * @brief Canonical form of a capability string: trimmed and lower-cased.
 */
[[nodiscard]] std::string normalize_capability(std::string_view value);

/**
 * @brief A job runs on a printer iff material, technology and machine model
 *        all match after normalization.
 */
[[nodiscard]] bool is_compatible(const Job& job, const Printer& printer);

class PrinterRoster {
public:
    PrinterRoster() = default;

    /**
     * @brief Build a roster, rejecting duplicate ids and blank capabilities.
     */
    static Result<PrinterRoster> create(std::vector<Printer> printers);

    [[nodiscard]] const std::vector<Printer>& printers() const noexcept { return printers_; }
    [[nodiscard]] size_t size() const noexcept { return printers_.size(); }
    [[nodiscard]] bool empty() const noexcept { return printers_.empty(); }

    [[nodiscard]] const Printer* find(PrinterId id) const;

    /// Ids of printers able to run the job, in roster order.
    [[nodiscard]] std::vector<PrinterId> compatible_printers(const Job& job) const;
    [[nodiscard]] bool is_routable(const Job& job) const;

    /// Number of printers supporting a (material, technology) pairing.
    [[nodiscard]] size_t count_supporting(std::string_view material,
                                          std::string_view technology) const;

    /// Dense rack index (racks sorted by name), used as a CP variable value.
    [[nodiscard]] int64_t rack_index(PrinterId id) const;
    [[nodiscard]] const std::vector<std::string>& racks() const noexcept { return racks_; }

private:
    explicit PrinterRoster(std::vector<Printer> printers);

    std::vector<Printer> printers_;
    std::vector<std::string> racks_;
    std::unordered_map<PrinterId, size_t> position_;
    std::unordered_map<PrinterId, int64_t> rack_of_;
};

/**
 * @brief Load a roster from a TOML file of `[[printer]]` tables.
 *
 * Keys per printer: id, name, material, technology, model, rack.
 */
Result<PrinterRoster> load_roster(const std::filesystem::path& path);

}  // namespace print_scheduler
