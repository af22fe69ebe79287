/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * ILogSink is the runtime-selected destination; Logger renders each record
 * as one NDJSON line: {"level","ts","component","msg"}.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace print_scheduler {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Each record carries a component tag. Loggers derived with for_component()
 * write to the same sink under the same lock, so the orchestrator can hand a
 * batch's horizon estimator, model builder and solve driver their own tags
 * (`solver[3]`) while every line still lands in one stream.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    std::string component = "scheduler");

    /// Same sink and level, different tag.
    [[nodiscard]] Logger for_component(std::string component) const;

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept { min_level_.store(level); }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_.load(); }
    [[nodiscard]] bool enabled(LogLevel at) const noexcept { return at >= level(); }
    [[nodiscard]] const std::string& component() const noexcept { return component_; }

    Logger(const Logger& other);
    Logger& operator=(const Logger&) = delete;

private:
    struct SharedSink {
        std::unique_ptr<ILogSink> sink;
        std::mutex mutex;
    };

    Logger(std::shared_ptr<SharedSink> shared, LogLevel min_level, std::string component);

    std::shared_ptr<SharedSink> shared_;
    std::atomic<LogLevel> min_level_;
    std::string component_;
};

}  // namespace print_scheduler
