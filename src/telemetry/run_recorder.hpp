/**
 * @file run_recorder.hpp
 * @brief Structured NDJSON events describing a scheduling run.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/schedule_result.hpp"

#include <memory>
#include <mutex>

namespace print_scheduler {

/**
 * @brief Emits one NDJSON event per run milestone.
 *
 * Events: run_started, job_unroutable, batch_started, batch_solved,
 * batch_failed, run_finished.
 */
class RunRecorder {
public:
    explicit RunRecorder(std::unique_ptr<ILogSink> sink);

    void record_run_started(size_t job_count, size_t printer_count, Minutes batch_capacity);
    void record_unroutable(const Job& job);
    void record_batch_started(const BatchReport& report);
    void record_batch_solved(const BatchReport& report);
    void record_batch_failed(const BatchReport& report);
    void record_run_finished(const ScheduleResult& result);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace print_scheduler
