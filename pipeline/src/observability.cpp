#include "editrelay/pipeline/observability.hpp"
#include "editrelay/pipeline/feature_flags.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/exporters/ostream/span_exporter_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>

namespace editrelay {
namespace pipeline {

using json = nlohmann::json;

// Credential fields to filter
static const std::vector<std::string> SECRET_FIELDS = {
    "key", "api_key", "token", "authorization", "secret", "password"
};

// Helper function to check if a field name should be filtered (case-insensitive)
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Recursively filter credentials from JSON object
static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets_recursive(item);
            }
        }
    }
}

// Generate ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

Observability::Observability(const std::string& instance_id, std::ostream& out, std::ostream& err)
    : instance_id_(instance_id), out_(out), err_(err) {
    initialize_metrics();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    uploads_total_family_ = &prometheus::BuildCounter()
        .Name("editrelay_uploads_total")
        .Help("Image uploads to the hosting service by outcome")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    job_polls_total_family_ = &prometheus::BuildCounter()
        .Name("editrelay_job_polls_total")
        .Help("Job status requests by outcome")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    jobs_total_family_ = &prometheus::BuildCounter()
        .Name("editrelay_jobs_total")
        .Help("Edit jobs by terminal outcome")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    pipeline_runs_total_family_ = &prometheus::BuildCounter()
        .Name("editrelay_pipeline_runs_total")
        .Help("Pipeline runs by outcome")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    pipeline_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("editrelay_pipeline_duration_seconds")
        .Help("Pipeline run duration in seconds")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);
}

void Observability::record_upload(const std::string& outcome) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    uploads_total_family_->Add({{"outcome", outcome}}).Increment();
}

void Observability::record_poll(const std::string& outcome) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    job_polls_total_family_->Add({{"outcome", outcome}}).Increment();
}

void Observability::record_job(const std::string& outcome) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    jobs_total_family_->Add({{"outcome", outcome}}).Increment();
}

void Observability::record_pipeline_run(const std::string& outcome, double duration_seconds) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    pipeline_runs_total_family_->Add({{"outcome", outcome}}).Increment();

    auto& histogram = pipeline_duration_seconds_family_->Add(
        {{"outcome", outcome}},
        prometheus::Histogram::BucketBoundaries{1.0, 5.0, 10.0, 30.0, 60.0, 120.0, 300.0, 600.0});
    histogram.Observe(duration_seconds);
}

std::string Observability::get_metrics_response() {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void Observability::initialize_tracing() {
    if (!FeatureFlags::is_tracing_enabled()) {
        return;
    }

    auto exporter = opentelemetry::exporter::trace::OStreamSpanExporterFactory::Create();
    auto processor = opentelemetry::sdk::trace::SimpleSpanProcessorFactory::Create(std::move(exporter));
    std::shared_ptr<opentelemetry::trace::TracerProvider> provider =
        opentelemetry::sdk::trace::TracerProviderFactory::Create(std::move(processor));

    opentelemetry::trace::Provider::SetTracerProvider(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(provider));
}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> Observability::start_stage_span(
    const std::string& stage,
    const RunContext& ctx,
    const std::string& job_id) {

    auto tracer = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer("editrelay", "1.0.0");
    auto span = tracer->StartSpan("editrelay." + stage);

    span->SetAttribute("instance", opentelemetry::nostd::string_view(instance_id_));
    if (!ctx.run_id.empty()) {
        span->SetAttribute("run_id", opentelemetry::nostd::string_view(ctx.run_id));
    }
    if (!ctx.trace_id.empty()) {
        span->SetAttribute("trace_id", opentelemetry::nostd::string_view(ctx.trace_id));
    }
    if (!job_id.empty()) {
        span->SetAttribute("job_id", opentelemetry::nostd::string_view(job_id));
    }

    return span;
}

void Observability::log_info(const std::string& message,
                             const std::string& run_id,
                             const std::string& job_id,
                             const std::string& stage,
                             const std::string& trace_id,
                             const LogContext& context) {
    write_line(out_, format_json_log("INFO", message, run_id, job_id, stage, trace_id, context));
}

void Observability::log_warn(const std::string& message,
                             const std::string& run_id,
                             const std::string& job_id,
                             const std::string& stage,
                             const std::string& trace_id,
                             const LogContext& context) {
    write_line(out_, format_json_log("WARN", message, run_id, job_id, stage, trace_id, context));
}

void Observability::log_error(const std::string& message,
                              const std::string& run_id,
                              const std::string& job_id,
                              const std::string& stage,
                              const std::string& trace_id,
                              const LogContext& context) {
    write_line(err_, format_json_log("ERROR", message, run_id, job_id, stage, trace_id, context));
}

void Observability::log_debug(const std::string& message,
                              const std::string& run_id,
                              const std::string& job_id,
                              const std::string& stage,
                              const std::string& trace_id,
                              const LogContext& context) {
    if (!FeatureFlags::is_debug_logging_enabled()) {
        return;
    }
    write_line(out_, format_json_log("DEBUG", message, run_id, job_id, stage, trace_id, context));
}

void Observability::log_info_with_context(const std::string& message,
                                          const RunContext& ctx,
                                          const std::string& stage,
                                          const LogContext& context) {
    auto job = context.find("job_id");
    log_info(message, ctx.run_id, job != context.end() ? job->second : "", stage, ctx.trace_id, context);
}

void Observability::log_warn_with_context(const std::string& message,
                                          const RunContext& ctx,
                                          const std::string& stage,
                                          const LogContext& context) {
    auto job = context.find("job_id");
    log_warn(message, ctx.run_id, job != context.end() ? job->second : "", stage, ctx.trace_id, context);
}

void Observability::log_error_with_context(const std::string& message,
                                           const RunContext& ctx,
                                           const std::string& stage,
                                           const LogContext& context) {
    auto job = context.find("job_id");
    log_error(message, ctx.run_id, job != context.end() ? job->second : "", stage, ctx.trace_id, context);
}

void Observability::log_debug_with_context(const std::string& message,
                                           const RunContext& ctx,
                                           const std::string& stage,
                                           const LogContext& context) {
    auto job = context.find("job_id");
    log_debug(message, ctx.run_id, job != context.end() ? job->second : "", stage, ctx.trace_id, context);
}

void Observability::write_line(std::ostream& stream, const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    stream << line << std::endl;
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& run_id,
                                           const std::string& job_id,
                                           const std::string& stage,
                                           const std::string& trace_id,
                                           const LogContext& context) {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "editrelay";
    log_entry["message"] = message;

    // Correlation fields (at top level, when provided)
    if (!run_id.empty()) {
        log_entry["run_id"] = run_id;
    }
    if (!job_id.empty()) {
        log_entry["job_id"] = job_id;
    }
    if (!stage.empty()) {
        log_entry["stage"] = stage;
    }
    if (!trace_id.empty()) {
        log_entry["trace_id"] = trace_id;
    }

    // Context object (technical details)
    json context_obj;
    context_obj["instance"] = instance_id_;

    for (const auto& [key, value] : context) {
        if (key == "job_id") {
            continue;
        }
        context_obj[key] = value;
    }

    filter_secrets_recursive(context_obj);

    log_entry["context"] = context_obj;

    // Service bodies and filenames are not guaranteed to be valid UTF-8
    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace pipeline
} // namespace editrelay
