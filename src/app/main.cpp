/**
 * @file main.cpp
 * @brief print_scheduler command-line entry point.
 *
 * Pipeline:
 *   Config → Logger → Roster → Jobs (CSV or demo) → BatchOrchestrator → CSV export
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "io/job_csv.hpp"
#include "io/schedule_csv.hpp"
#include "orchestrator/batch_orchestrator.hpp"
#include "roster/printer_roster.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/job_generator.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

using namespace print_scheduler;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_usage() {
    std::cout << "Usage: print_scheduler [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --roster <path>          Printer roster TOML (default: config/roster.toml)\n"
              << "  --jobs <path>            Job list CSV\n"
              << "  --output-dir <path>      Directory for schedule CSVs (default: schedules)\n"
              << "  --start-date YYYY-MM-DD  Schedule epoch (default: today, UTC)\n"
              << "  --shift-start-hour <h>   Earliest start hour of day\n"
              << "  --shift-length <h>       Shift length in hours\n"
              << "  --stagger <min>          Finishes closer than this are clustered\n"
              << "  --penalty <n>            Weight of a clustered different-rack pair\n"
              << "  --buffer <min>           Gap kept after every job\n"
              << "  --time-limit <s>         Solver budget per batch, seconds\n"
              << "  --demo <n>               Schedule n random jobs on the reference farm\n"
              << "  --debug                  Debug logging and solver search log\n"
              << "  --help, -h               Show this help message\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path roster_path = "config/roster.toml";
    std::filesystem::path jobs_path;
    std::filesystem::path output_dir = "schedules";
    std::string start_date;
    std::optional<int64_t> shift_start_hour;
    std::optional<int64_t> shift_length;
    std::optional<int64_t> stagger;
    std::optional<int64_t> penalty;
    std::optional<int64_t> buffer;
    std::optional<double> time_limit;
    size_t demo_jobs = 0;
    bool debug = false;
};

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        }
        if (arg == "--debug") {
            args.debug = true;
            continue;
        }
        if (i + 1 >= argc) {
            return Error{ErrorKind::Configuration, "Missing value for " + arg};
        }
        const std::string value = argv[++i];

        auto integer = [&](std::optional<int64_t>& out) -> Result<void> {
            out = parse_number<int64_t>(value);
            if (!out) return Error{ErrorKind::Configuration, arg + " expects an integer, got " + value};
            return {};
        };

        Result<void> parsed;
        if (arg == "--config") {
            args.config_path = value;
        } else if (arg == "--roster") {
            args.roster_path = value;
        } else if (arg == "--jobs") {
            args.jobs_path = value;
        } else if (arg == "--output-dir") {
            args.output_dir = value;
        } else if (arg == "--start-date") {
            args.start_date = value;
        } else if (arg == "--shift-start-hour") {
            parsed = integer(args.shift_start_hour);
        } else if (arg == "--shift-length") {
            parsed = integer(args.shift_length);
        } else if (arg == "--stagger") {
            parsed = integer(args.stagger);
        } else if (arg == "--penalty") {
            parsed = integer(args.penalty);
        } else if (arg == "--buffer") {
            parsed = integer(args.buffer);
        } else if (arg == "--time-limit") {
            args.time_limit = parse_number<double>(value);
            if (!args.time_limit) {
                return Error{ErrorKind::Configuration, "--time-limit expects seconds, got " + value};
            }
        } else if (arg == "--demo") {
            const auto count = parse_number<size_t>(value);
            if (!count || *count == 0) {
                return Error{ErrorKind::Configuration, "--demo expects a positive job count"};
            }
            args.demo_jobs = *count;
        } else {
            return Error{ErrorKind::Configuration, "Unknown option " + arg};
        }
        if (!parsed) return parsed.error();
    }
    return args;
}

Result<void> apply_overrides(const CLIArgs& args, Config& config) {
    // Range-check before narrowing
    auto within = [](int64_t v, int64_t lo, int64_t hi, std::string_view name) -> Result<void> {
        if (v < lo || v > hi) {
            return Error{ErrorKind::Configuration,
                         std::format("{} must be within {}..{}, got {}", name, lo, hi, v)};
        }
        return {};
    };

    if (args.shift_start_hour) {
        if (auto ok = within(*args.shift_start_hour, 0, 23, "--shift-start-hour"); !ok) return ok;
        config.shift.start_hour = static_cast<uint32_t>(*args.shift_start_hour);
    }
    if (args.shift_length) {
        if (auto ok = within(*args.shift_length, 1, 24, "--shift-length"); !ok) return ok;
        config.shift.length_hours = static_cast<uint32_t>(*args.shift_length);
    }
    if (args.stagger) config.proximity.threshold_minutes = *args.stagger;
    if (args.penalty) config.objective.proximity_weight = *args.penalty;
    if (args.buffer) config.jobs.buffer_minutes = *args.buffer;
    if (args.time_limit) config.solver.time_limit_seconds = *args.time_limit;
    if (args.debug) {
        config.telemetry.log_level = "debug";
        config.solver.log_search = true;
    }
    return {};
}

std::chrono::sys_days today_utc() {
    return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().what() << "\n";
        print_usage();
        return 2;
    }
    const CLIArgs& args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        if (config_result.error().kind != ErrorKind::Io) return 1;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (auto applied = apply_overrides(args, config); !applied) {
        std::cerr << applied.error().what() << std::endl;
        return 2;
    }
    if (auto valid = validate_config(config); !valid) {
        std::cerr << valid.error().what() << std::endl;
        return 2;
    }

    auto epoch = args.start_date.empty() ? Result<std::chrono::sys_days>(today_utc())
                                         : parse_date(args.start_date);
    if (!epoch) {
        std::cerr << epoch.error().what() << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    const LogLevel level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    auto make_sink = [&](const std::string& prefix) -> std::unique_ptr<ILogSink> {
        if (!config.telemetry.log_dir.empty()) {
            auto file = std::make_unique<JsonFileSink>(config.telemetry.log_dir, prefix,
                                                       config.telemetry.max_file_size_mb,
                                                       config.telemetry.rotate_count);
            if (file->is_open()) return file;
            std::cerr << "Cannot write logs to " << config.telemetry.log_dir.string()
                      << "; logging to stdout" << std::endl;
        }
        return std::make_unique<StdoutSink>();
    };
    Logger logger(make_sink("print_scheduler"), level, "main");

    // ── Roster ───────────────────────────────
    PrinterRoster roster;
    if (args.demo_jobs > 0) {
        roster = JobGenerator::reference_roster();
        logger.info(std::format("Demo mode: reference farm of {} printers", roster.size()));
    } else {
        auto loaded = load_roster(args.roster_path);
        if (!loaded) {
            logger.error("Failed to load roster: " + loaded.error().message);
            return 1;
        }
        roster = std::move(*loaded);
        logger.info(std::format("Loaded {} printers from {}", roster.size(),
                                args.roster_path.string()));
    }

    // ── Jobs ─────────────────────────────────
    std::vector<Job> jobs;
    if (args.demo_jobs > 0) {
        std::mt19937 rng(static_cast<std::mt19937::result_type>(config.solver.random_seed));
        jobs = JobGenerator::random_for_roster(roster, args.demo_jobs, 60, 600, rng);
    } else if (!args.jobs_path.empty()) {
        auto loaded = read_jobs_csv(args.jobs_path);
        if (!loaded) {
            logger.error("Failed to read jobs: " + loaded.error().message);
            return 1;
        }
        jobs = std::move(*loaded);
    } else {
        logger.error("No job source: pass --jobs <csv> or --demo <n>");
        return 2;
    }
    logger.info(std::format("{} jobs to schedule from {}", jobs.size(),
                            format_datetime(*epoch, config.shift.start_minutes())));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source cancel;
    std::jthread signal_watcher([&cancel](std::stop_token watcher_stop) {
        while (!watcher_stop.stop_requested()) {
            if (g_shutdown_requested) {
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    // ── Schedule ─────────────────────────────
    std::unique_ptr<ILogSink> event_sink;
    if (!config.telemetry.events_file.empty()) {
        auto events = std::make_unique<JsonFileSink>(
            config.telemetry.events_file.parent_path().empty()
                ? std::filesystem::path(".") : config.telemetry.events_file.parent_path(),
            config.telemetry.events_file.stem().string(),
            config.telemetry.max_file_size_mb,
            config.telemetry.rotate_count);
        if (events->is_open()) {
            event_sink = std::move(events);
        } else {
            logger.warn("Cannot open event stream " + config.telemetry.events_file.string()
                        + "; run events disabled");
        }
    }

    BatchOrchestrator orchestrator({
        .config = config,
        .roster = roster,
        .solver = nullptr,
        .partitioner = nullptr,
        .log_sink = make_sink("engine"),
        .event_sink = std::move(event_sink),
        .log_level = level
    });

    auto result = orchestrator.run(jobs, cancel.get_token());
    signal_watcher.request_stop();
    if (!result) {
        logger.error("Scheduling failed: " + result.error().message);
        return 1;
    }

    // ── Export ───────────────────────────────
    const auto schedule_path = args.output_dir / "combined_results.csv";
    const auto unscheduled_path = args.output_dir / "unscheduled_jobs.csv";

    if (auto written = write_schedule_csv(schedule_path, *result, *epoch); !written) {
        logger.error(written.error().message);
        return 1;
    }
    logger.info(std::format("{} scheduled jobs written to {}", result->scheduled.size(),
                            schedule_path.string()));

    if (!result->unscheduled.empty()) {
        if (auto written = write_unscheduled_csv(unscheduled_path, *result); !written) {
            logger.error(written.error().message);
            return 1;
        }
        logger.warn(std::format("{} jobs unscheduled; saved to {}", result->unscheduled.size(),
                                unscheduled_path.string()));
    }

    logger.info(std::format("Makespan: {} ({} of {} batches solved)",
                            format_datetime(*epoch, result->makespan()),
                            result->solved_batches(), result->batches.size()));
    logger.info(std::format("Total printers used: {}", result->printers_used()));
    logger.flush();
    return result->solved_batches() > 0 || result->batches.empty() ? 0 : 1;
}
