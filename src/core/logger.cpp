/**
 * @file logger.cpp
 * @brief Logger implementation: NDJSON records with UTC millisecond timestamps.
 */

#include "core/logger.hpp"

#include <chrono>
#include <format>

namespace print_scheduler {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level, std::string component)
    : Logger(std::make_shared<SharedSink>(), min_level, std::move(component)) {
    shared_->sink = std::move(sink);
}

Logger::Logger(std::shared_ptr<SharedSink> shared, LogLevel min_level, std::string component)
    : shared_(std::move(shared)), min_level_(min_level), component_(std::move(component)) {}

Logger::Logger(const Logger& other)
    : Logger(other.shared_, other.level(), other.component_) {}

Logger Logger::for_component(std::string component) const {
    return Logger(shared_, level(), std::move(component));
}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    if (!enabled(level)) return;

    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());

    const std::string line = std::format(
        R"({{"level":"{}","ts":"{:%FT%T}Z","component":"{}","msg":"{}"}})",
        to_string(level), now, json_escape(component_), json_escape(message));

    std::lock_guard lock(shared_->mutex);
    if (shared_->sink) shared_->sink->write(line);
}

void Logger::flush() {
    std::lock_guard lock(shared_->mutex);
    if (shared_->sink) shared_->sink->flush();
}

}  // namespace print_scheduler
