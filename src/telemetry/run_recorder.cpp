/**
 * @file run_recorder.cpp
 * @brief RunRecorder implementation.
 */

#include "telemetry/run_recorder.hpp"

#include <sstream>

namespace print_scheduler {

RunRecorder::RunRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void RunRecorder::record_run_started(size_t job_count, size_t printer_count,
                                     Minutes batch_capacity) {
    std::ostringstream oss;
    oss << R"({"event":"run_started")"
        << R"(,"jobs":)" << job_count
        << R"(,"printers":)" << printer_count
        << R"(,"batch_capacity_min":)" << batch_capacity
        << "}";
    emit(oss.str());
}

void RunRecorder::record_unroutable(const Job& job) {
    std::ostringstream oss;
    oss << R"({"event":"job_unroutable")"
        << R"(,"job":)" << job.id
        << R"(,"title":")" << json_escape(job.title) << "\""
        << R"(,"material":")" << json_escape(job.material) << "\""
        << R"(,"technology":")" << json_escape(job.technology) << "\""
        << R"(,"model":")" << json_escape(job.machine_model) << "\""
        << "}";
    emit(oss.str());
}

void RunRecorder::record_batch_started(const BatchReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"batch_started")"
        << R"(,"batch":)" << report.number
        << R"(,"jobs":)" << report.job_count
        << R"(,"work_min":)" << report.total_work
        << R"(,"horizon_min":)" << report.horizon
        << R"(,"proximity_pairs":)" << report.proximity_pairs
        << "}";
    emit(oss.str());
}

void RunRecorder::record_batch_solved(const BatchReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"batch_solved")"
        << R"(,"batch":)" << report.number
        << R"(,"status":")" << to_string(report.solve_status) << "\""
        << R"(,"objective":)" << report.objective_value
        << R"(,"makespan_min":)" << report.makespan
        << R"(,"proximity_penalty":)" << report.proximity_penalty
        << R"(,"max_load":)" << report.max_load
        << R"(,"printers_used":)" << report.printers_used
        << R"(,"offset_min":)" << report.offset
        << R"(,"wall_s":)" << report.wall_time_seconds
        << "}";
    emit(oss.str());
}

void RunRecorder::record_batch_failed(const BatchReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"batch_failed")"
        << R"(,"batch":)" << report.number
        << R"(,"state":")" << to_string(report.status) << "\""
        << R"(,"jobs":)" << report.job_count
        << R"(,"reason":")" << json_escape(report.failure) << "\""
        << "}";
    emit(oss.str());
}

void RunRecorder::record_run_finished(const ScheduleResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"run_finished")"
        << R"(,"scheduled":)" << result.scheduled.size()
        << R"(,"unscheduled":)" << result.unscheduled.size()
        << R"(,"batches_solved":)" << result.solved_batches()
        << R"(,"batches_failed":)" << result.failed_batches()
        << R"(,"makespan_min":)" << result.makespan()
        << "}";
    emit(oss.str());
}

void RunRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void RunRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace print_scheduler
