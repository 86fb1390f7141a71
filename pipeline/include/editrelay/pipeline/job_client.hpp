#pragma once

#include "editrelay/pipeline/config.hpp"
#include "editrelay/pipeline/core.hpp"
#include "editrelay/pipeline/http_transport.hpp"
#include "editrelay/pipeline/observability.hpp"
#include "editrelay/pipeline/poll_policy.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace editrelay {
namespace pipeline {

// Blocks the calling thread between status requests
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

struct SubmitResult {
    bool ok = false;
    JobHandle job_id;
    JobStatus status = JobStatus::queued;
    ErrorCode error_code = ErrorCode::none;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Outcome of one status request; the poll loop decides continue vs. abort
struct PollAttempt {
    bool ok = false;
    JobStatus status = JobStatus::unknown;
    std::string result_url;     // output.result, when present
    std::string output;         // output field as received, for diagnostics
    std::string service_error;  // error field, when present
    ErrorCode error_code = ErrorCode::none;
    int http_status = 0;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

/**
 * Submits an edit job and polls it to a terminal state.
 *
 * run() is a strictly sequential state machine: one submission, then up to
 * max_polls iterations of sleep + status request. It returns as soon as a
 * terminal status is read and never issues another status request after
 * that. Status requests that PollPolicy classifies as retryable are
 * absorbed and cost one iteration; every other failure ends the run.
 */
class JobClient {
public:
    JobClient(const PipelineConfig& config,
              std::shared_ptr<HttpTransport> transport,
              std::shared_ptr<Observability> observability,
              SleepFunction sleep = SleepFunction());

    JobOutcome run(const JobRequest& job, const std::string& credential, const RunContext& ctx = {});

    SubmitResult submit(const JobRequest& job, const std::string& credential, const RunContext& ctx = {});
    PollAttempt poll_once(const JobHandle& job_id, const std::string& credential);

    static nlohmann::json build_submit_payload(const JobRequest& job);

private:
    std::string run_url_;
    std::string status_url_;
    int64_t submit_timeout_ms_;
    int64_t poll_timeout_ms_;
    int64_t connect_timeout_ms_;
    PollPolicy policy_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<Observability> observability_;
    SleepFunction sleep_;

    HttpRequest authorized_request(const std::string& method, const std::string& url,
                                   const std::string& credential, int64_t timeout_ms) const;
    JobOutcome finish(JobOutcome outcome, const RunContext& ctx);
};

// Parses the optional seed field: empty maps to -1, anything but a signed integer is rejected
std::optional<int64_t> parse_seed(const std::string& text);

} // namespace pipeline
} // namespace editrelay
