#include "editrelay/pipeline/pipeline.hpp"
#include "editrelay/pipeline/result_converter.hpp"
#include <atomic>
#include <chrono>

namespace editrelay {
namespace pipeline {

std::string generate_run_id() {
    static std::atomic<uint64_t> counter{0};
    return "run_" + std::to_string(++counter) + "_" +
           std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
}

EditPipeline::EditPipeline(const PipelineConfig& config,
                           std::shared_ptr<HttpTransport> transport,
                           std::shared_ptr<Observability> observability,
                           SleepFunction sleep)
    : config_(config),
      observability_(observability),
      hoster_(config, transport, observability),
      job_client_(config, transport, observability, std::move(sleep)) {}

PipelineResult EditPipeline::run(const ImagePayload& payload,
                                 const EditParameters& params,
                                 const std::string& job_credential,
                                 const RunContext& ctx) {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start_time]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
    };

    auto span = observability_->start_stage_span("pipeline", ctx);
    observability_->log_info_with_context("Pipeline run started", ctx, "validate", {
        {"filename", payload.filename()},
        {"bytes", std::to_string(payload.size())}
    });

    // Validation happens before any network activity
    if (payload.empty()) {
        span->End();
        return finish(PipelineResult::error_result(ErrorCode::invalid_input,
                                                   "Please upload an image.", ctx, elapsed_ms()),
                      "validate");
    }
    if (params.prompt.empty()) {
        span->End();
        return finish(PipelineResult::error_result(ErrorCode::invalid_input,
                                                   "Please provide an edit instruction (prompt).", ctx,
                                                   elapsed_ms()),
                      "validate");
    }
    if (job_credential.empty()) {
        span->End();
        return finish(PipelineResult::error_result(ErrorCode::invalid_input,
                                                   "Please provide your job service API key.", ctx,
                                                   elapsed_ms()),
                      "validate");
    }
    auto seed = parse_seed(params.seed);
    if (!seed) {
        span->End();
        return finish(PipelineResult::error_result(ErrorCode::invalid_input,
                                                   "Seed must be an integer (or empty for random).", ctx,
                                                   elapsed_ms()),
                      "validate");
    }

    HostedArtifact original = hoster_.upload(payload, config_.hosting_api_key, ctx);
    if (!original.is_success()) {
        auto result = PipelineResult::error_result(original.error_code, original.error_message, ctx, elapsed_ms());
        result.original = original;
        span->End();
        return finish(result, "upload");
    }

    JobRequest job;
    job.prompt = params.prompt;
    job.negative_prompt = params.negative_prompt;
    job.seed = *seed;
    job.image_url = original.url;
    job.output_format = config_.output_format;
    job.enable_safety_checker = config_.enable_safety_checker;

    JobOutcome outcome = job_client_.run(job, job_credential, ctx);
    span->End();

    if (!outcome.is_success()) {
        auto result = PipelineResult::error_result(outcome.error_code, outcome.error_message, ctx, elapsed_ms());
        result.original = original;
        result.job_id = outcome.job_id;
        result.job_status = outcome.final_status;
        result.polls_used = outcome.polls_used;
        return finish(result, outcome.job_id.empty() ? "submit" : "poll");
    }

    return finish(PipelineResult::success(ctx, original, outcome, elapsed_ms()), "done");
}

PipelineResult EditPipeline::finish(PipelineResult result, const std::string& stage) {
    const std::string outcome = result.is_success()
        ? "success"
        : ResultConverter::error_code_to_string(result.error_code);
    observability_->record_pipeline_run(outcome, static_cast<double>(result.latency_ms) / 1000.0);

    LogContext context = {
        {"outcome", outcome},
        {"latency_ms", std::to_string(result.latency_ms)}
    };
    if (!result.job_id.empty()) {
        context["job_id"] = result.job_id;
        context["polls_used"] = std::to_string(result.polls_used);
    }

    if (result.is_success()) {
        context["edited_url"] = result.edited_url;
        observability_->log_info_with_context("Pipeline run completed", result.context, stage, context);
    } else {
        context["error"] = result.error_message;
        observability_->log_error_with_context("Pipeline run failed", result.context, stage, context);
    }
    return result;
}

} // namespace pipeline
} // namespace editrelay
