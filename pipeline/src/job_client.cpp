#include "editrelay/pipeline/job_client.hpp"
#include "editrelay/pipeline/result_converter.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <cctype>
#include <charconv>
#include <thread>

namespace editrelay {
namespace pipeline {

using json = nlohmann::json;

namespace {

int64_t elapsed_ms(std::chrono::steady_clock::time_point start_time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
}

std::string transport_error_text(const caf::error& err) {
    std::string text = caf::to_string(err);
    if (err == caf::sec::request_timeout) {
        return "timed out: " + text;
    }
    return text;
}

} // namespace

std::optional<int64_t> parse_seed(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return -1;
    }
    auto last = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(first, last - first + 1);

    const char* begin = trimmed.data();
    const char* end = trimmed.data() + trimmed.size();
    if (*begin == '+') {
        ++begin;
        if (begin == end || !std::isdigit(static_cast<unsigned char>(*begin))) {
            return std::nullopt;
        }
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

JobClient::JobClient(const PipelineConfig& config,
                     std::shared_ptr<HttpTransport> transport,
                     std::shared_ptr<Observability> observability,
                     SleepFunction sleep)
    : run_url_(config.job_endpoint + "/run"),
      status_url_(config.job_endpoint + "/status"),
      submit_timeout_ms_(config.submit_timeout_ms),
      poll_timeout_ms_(config.poll_timeout_ms),
      connect_timeout_ms_(config.connect_timeout_ms),
      policy_(PollPolicy::Config{config.poll_interval_ms, config.max_polls}),
      transport_(std::move(transport)),
      observability_(std::move(observability)),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

json JobClient::build_submit_payload(const JobRequest& job) {
    return json{
        {"input", {
            {"prompt", job.prompt},
            {"negative_prompt", job.negative_prompt},
            {"seed", job.seed},
            {"image", job.image_url},
            {"output_format", job.output_format},
            {"enable_safety_checker", job.enable_safety_checker}
        }}
    };
}

HttpRequest JobClient::authorized_request(const std::string& method, const std::string& url,
                                          const std::string& credential, int64_t timeout_ms) const {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.timeout_ms = timeout_ms;
    request.connect_timeout_ms = connect_timeout_ms_;
    request.headers.push_back({"Authorization", "Bearer " + credential});
    return request;
}

SubmitResult JobClient::submit(const JobRequest& job, const std::string& credential, const RunContext& ctx) {
    SubmitResult result;

    auto span = observability_->start_stage_span("submit", ctx);
    observability_->log_info_with_context("Sending job submission", ctx, "submit", {
        {"image_url", job.image_url},
        {"seed", std::to_string(job.seed)}
    });

    HttpRequest request = authorized_request("POST", run_url_, credential, submit_timeout_ms_);
    request.headers.push_back({"Content-Type", "application/json"});
    // The prompt is user text and may not be valid UTF-8
    request.body = build_submit_payload(job).dump(-1, ' ', false, json::error_handler_t::replace);

    auto response = transport_->perform(request);
    span->End();

    if (!response) {
        result.error_code = ErrorCode::network_error;
        result.message = "Job service error (submission): " + transport_error_text(response.error());
        return result;
    }

    if (!response->is_success()) {
        result.error_code = ErrorCode::submission_error;
        result.message = "Job submission rejected (HTTP " + std::to_string(response->status_code) +
                         "): " + response->body;
        return result;
    }

    json body;
    try {
        body = json::parse(response->body);
    } catch (const json::parse_error&) {
        result.error_code = ErrorCode::protocol_error;
        result.message = "Job service returned an undecodable submission response: " + response->body;
        return result;
    }

    // A missing id and an empty id are treated alike
    if (!body.is_object() || !body.contains("id") || !body.at("id").is_string() ||
        body.at("id").get<std::string>().empty()) {
        result.error_code = ErrorCode::submission_error;
        result.message = "Job service did not return a job ID. Response: " + response->body;
        return result;
    }

    result.ok = true;
    result.job_id = body.at("id").get<std::string>();

    // Only a non-terminal submission status is recorded; the first poll is authoritative otherwise
    if (body.contains("status") && body.at("status").is_string()) {
        auto reported = ResultConverter::job_status_from_string(body.at("status").get<std::string>());
        if (reported == JobStatus::queued || reported == JobStatus::running) {
            result.status = reported;
        }
    }

    return result;
}

PollAttempt JobClient::poll_once(const JobHandle& job_id, const std::string& credential) {
    PollAttempt attempt;

    auto response = transport_->perform(
        authorized_request("GET", status_url_ + "/" + job_id, credential, poll_timeout_ms_));

    if (!response) {
        attempt.error_code = ErrorCode::network_error;
        attempt.message = "Network error while polling job: " + transport_error_text(response.error());
        return attempt;
    }

    attempt.http_status = response->status_code;
    if (!response->is_success()) {
        attempt.error_code = ErrorCode::transient_poll_error;
        attempt.message = "Job status request failed (HTTP " + std::to_string(response->status_code) +
                          "): " + response->body;
        return attempt;
    }

    json body;
    try {
        body = json::parse(response->body);
    } catch (const json::parse_error&) {
        attempt.error_code = ErrorCode::protocol_error;
        attempt.message = "Job service returned an undecodable status response: " + response->body;
        return attempt;
    }
    if (!body.is_object()) {
        attempt.error_code = ErrorCode::protocol_error;
        attempt.message = "Job service returned an unexpected status response: " + response->body;
        return attempt;
    }

    attempt.ok = true;

    if (body.contains("status") && body.at("status").is_string()) {
        attempt.status = ResultConverter::job_status_from_string(body.at("status").get<std::string>());
    }

    if (body.contains("output")) {
        const auto& output = body.at("output");
        attempt.output = output.dump();
        if (output.is_object() && output.contains("result") && output.at("result").is_string()) {
            attempt.result_url = output.at("result").get<std::string>();
        }
    }

    if (body.contains("error") && !body.at("error").is_null()) {
        const auto& error = body.at("error");
        attempt.service_error = error.is_string() ? error.get<std::string>() : error.dump();
    }

    return attempt;
}

JobOutcome JobClient::run(const JobRequest& job, const std::string& credential, const RunContext& ctx) {
    auto start_time = std::chrono::steady_clock::now();

    if (credential.empty()) {
        return finish(JobOutcome::error_result(ErrorCode::invalid_input, "Job service credential is required"), ctx);
    }

    SubmitResult submitted = submit(job, credential, ctx);
    if (!submitted) {
        return finish(JobOutcome::error_result(submitted.error_code, submitted.message, "",
                                               JobStatus::unknown, 0, elapsed_ms(start_time)),
                      ctx);
    }

    const JobHandle& job_id = submitted.job_id;
    JobStatus status = submitted.status;
    int32_t polls = 0;
    int32_t transient_failures = 0;

    observability_->log_info("Job started, polling for status", ctx.run_id, job_id, "poll", ctx.trace_id, {
        {"status", ResultConverter::job_status_to_string(status)},
        {"max_polls", std::to_string(policy_.max_polls())},
        {"interval_ms", std::to_string(policy_.interval().count())}
    });

    while (!policy_.is_budget_exhausted(polls)) {
        ++polls;
        sleep_(policy_.interval());

        auto span = observability_->start_stage_span("poll", ctx, job_id);
        PollAttempt attempt = poll_once(job_id, credential);
        span->End();

        if (!attempt) {
            if (policy_.is_retryable(attempt.error_code)) {
                ++transient_failures;
                observability_->record_poll("transient_error");
                observability_->log_warn("Transient error while polling job", ctx.run_id, job_id, "poll", ctx.trace_id, {
                    {"error_code", ResultConverter::error_code_to_string(ErrorCode::transient_poll_error)},
                    {"cause", ResultConverter::error_code_to_string(attempt.error_code)},
                    {"http_status", std::to_string(attempt.http_status)},
                    {"error", attempt.message},
                    {"attempt", std::to_string(polls)}
                });
                continue;
            }

            observability_->record_poll("error");
            auto outcome = JobOutcome::error_result(attempt.error_code, attempt.message, job_id, status,
                                                    polls, elapsed_ms(start_time));
            outcome.transient_failures = transient_failures;
            return finish(outcome, ctx);
        }

        observability_->record_poll("ok");
        status = attempt.status;
        observability_->log_info("Job status", ctx.run_id, job_id, "poll", ctx.trace_id, {
            {"status", ResultConverter::job_status_to_string(status)},
            {"attempt", std::to_string(polls)}
        });

        if (status == JobStatus::completed) {
            if (attempt.result_url.empty()) {
                auto outcome = JobOutcome::error_result(
                    ErrorCode::malformed_result,
                    "Job COMPLETED but missing 'result' (final image URL) in output. Full output: " +
                        (attempt.output.empty() ? std::string("null") : attempt.output),
                    job_id, status, polls, elapsed_ms(start_time));
                outcome.transient_failures = transient_failures;
                return finish(outcome, ctx);
            }
            auto outcome = JobOutcome::success(job_id, attempt.result_url, polls, elapsed_ms(start_time));
            outcome.transient_failures = transient_failures;
            return finish(outcome, ctx);
        }

        if (status == JobStatus::failed || status == JobStatus::canceled) {
            std::string message = attempt.service_error.empty()
                ? "job failed with status " + ResultConverter::job_status_to_string(status)
                : attempt.service_error;
            auto outcome = JobOutcome::error_result(ErrorCode::job_failed, "Job failed: " + message,
                                                    job_id, status, polls, elapsed_ms(start_time));
            outcome.transient_failures = transient_failures;
            return finish(outcome, ctx);
        }
    }

    auto outcome = JobOutcome::error_result(
        ErrorCode::poll_budget_exhausted,
        "Job timed out (maximum polling attempts reached: " + std::to_string(polls) + ")",
        job_id, status, polls, elapsed_ms(start_time));
    outcome.transient_failures = transient_failures;
    return finish(outcome, ctx);
}

JobOutcome JobClient::finish(JobOutcome outcome, const RunContext& ctx) {
    if (outcome.is_success()) {
        observability_->record_job("completed");
        observability_->log_info("Job completed", ctx.run_id, outcome.job_id, "poll", ctx.trace_id, {
            {"result_url", outcome.result_url},
            {"polls_used", std::to_string(outcome.polls_used)},
            {"transient_failures", std::to_string(outcome.transient_failures)}
        });
    } else {
        observability_->record_job(ResultConverter::error_code_to_string(outcome.error_code));
        observability_->log_error("Job did not complete", ctx.run_id, outcome.job_id,
                                  outcome.job_id.empty() ? "submit" : "poll", ctx.trace_id, {
            {"error_code", ResultConverter::error_code_to_string(outcome.error_code)},
            {"error", outcome.error_message},
            {"status", ResultConverter::job_status_to_string(outcome.final_status)},
            {"polls_used", std::to_string(outcome.polls_used)}
        });
    }
    return outcome;
}

} // namespace pipeline
} // namespace editrelay
