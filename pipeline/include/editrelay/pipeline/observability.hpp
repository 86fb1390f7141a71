#pragma once

#include "editrelay/pipeline/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace editrelay {
namespace pipeline {

using LogContext = std::unordered_map<std::string, std::string>;

class Observability {
public:
    explicit Observability(const std::string& instance_id,
                           std::ostream& out = std::cout,
                           std::ostream& err = std::cerr);

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    // Metrics (gated behind EDITRELAY_METRICS_ENABLED)
    void record_upload(const std::string& outcome);
    void record_poll(const std::string& outcome);
    void record_job(const std::string& outcome);
    void record_pipeline_run(const std::string& outcome, double duration_seconds);
    std::string get_metrics_response(); // Prometheus text format

    // Tracing
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> start_stage_span(
        const std::string& stage,
        const RunContext& ctx,
        const std::string& job_id = "");

    // Logging
    void log_info(const std::string& message,
                  const std::string& run_id = "",
                  const std::string& job_id = "",
                  const std::string& stage = "",
                  const std::string& trace_id = "",
                  const LogContext& context = {});

    void log_warn(const std::string& message,
                  const std::string& run_id = "",
                  const std::string& job_id = "",
                  const std::string& stage = "",
                  const std::string& trace_id = "",
                  const LogContext& context = {});

    void log_error(const std::string& message,
                   const std::string& run_id = "",
                   const std::string& job_id = "",
                   const std::string& stage = "",
                   const std::string& trace_id = "",
                   const LogContext& context = {});

    void log_debug(const std::string& message,
                   const std::string& run_id = "",
                   const std::string& job_id = "",
                   const std::string& stage = "",
                   const std::string& trace_id = "",
                   const LogContext& context = {});

    // Helper functions to take correlation fields from a RunContext
    void log_info_with_context(const std::string& message,
                               const RunContext& ctx,
                               const std::string& stage,
                               const LogContext& context = {});

    void log_warn_with_context(const std::string& message,
                               const RunContext& ctx,
                               const std::string& stage,
                               const LogContext& context = {});

    void log_error_with_context(const std::string& message,
                                const RunContext& ctx,
                                const std::string& stage,
                                const LogContext& context = {});

    void log_debug_with_context(const std::string& message,
                                const RunContext& ctx,
                                const std::string& stage,
                                const LogContext& context = {});

    // Prometheus registry access
    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Installs an ostream span exporter as the global tracer provider
    // (no-op unless EDITRELAY_TRACING_ENABLED is set)
    static void initialize_tracing();

private:
    std::string instance_id_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex write_mutex_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* uploads_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* job_polls_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* jobs_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* pipeline_runs_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* pipeline_duration_seconds_family_ = nullptr;

    void initialize_metrics();
    void write_line(std::ostream& stream, const std::string& line);
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& run_id,
                                const std::string& job_id,
                                const std::string& stage,
                                const std::string& trace_id,
                                const LogContext& context);
};

} // namespace pipeline
} // namespace editrelay
