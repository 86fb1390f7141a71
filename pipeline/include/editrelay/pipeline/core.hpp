#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <caf/expected.hpp>

namespace editrelay {
namespace pipeline {

// Forward declarations
class HttpTransport;
class Observability;

// Correlation fields carried through one pipeline run
struct RunContext {
    std::string run_id;
    std::string trace_id;
};

// Opaque job identifier returned by the job service on submission
using JobHandle = std::string;

// Remote job lifecycle as reported by the job service
enum class JobStatus {
    queued,
    running,
    completed,
    failed,
    canceled,
    unknown
};

inline bool is_terminal(JobStatus status) {
    return status == JobStatus::completed || status == JobStatus::failed ||
           status == JobStatus::canceled;
}

// Machine-readable error codes for programmatic error handling
enum class ErrorCode {
    none = 0,
    // Validation and configuration errors (1xxx)
    invalid_input = 1001,
    configuration_error = 1002,
    // Remote job errors (2xxx)
    submission_error = 2001,
    job_failed = 2002,
    malformed_result = 2003,
    // Network and protocol errors (3xxx)
    network_error = 3001,
    protocol_error = 3003,
    upload_rejected = 3004,
    transient_poll_error = 3005,
    // Timeouts (5xxx)
    poll_budget_exhausted = 5001
};

/**
 * Raw image bytes plus the display filename supplied with them.
 *
 * The bytes are held in an immutable buffer and only ever read through a
 * const reference, so every consumer sees the full content.
 */
class ImagePayload {
public:
    ImagePayload(std::string bytes, std::string filename)
        : bytes_(std::move(bytes)), filename_(std::move(filename)) {}

    const std::string& bytes() const { return bytes_; }
    const std::string& filename() const { return filename_; }
    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    // Reads a whole file; fails when it is missing, unreadable or larger than max_bytes
    static caf::expected<ImagePayload> from_file(const std::filesystem::path& path,
                                                 std::size_t max_bytes);

private:
    std::string bytes_;
    std::string filename_;
};

// Outcome of hosting an image
struct HostedArtifact {
    bool ok = false;
    std::string url;
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
    int http_status = 0;
    int64_t latency_ms = 0;

    bool is_success() const { return ok; }

    static HostedArtifact success(std::string url, int http_status, int64_t latency_ms = 0) {
        HostedArtifact artifact;
        artifact.ok = true;
        artifact.url = std::move(url);
        artifact.http_status = http_status;
        artifact.latency_ms = latency_ms;
        return artifact;
    }

    static HostedArtifact error_result(ErrorCode code, const std::string& message,
                                       int http_status = 0, int64_t latency_ms = 0) {
        HostedArtifact artifact;
        artifact.ok = false;
        artifact.error_code = code;
        artifact.error_message = message;
        artifact.http_status = http_status;
        artifact.latency_ms = latency_ms;
        return artifact;
    }
};

// Edit job as submitted to the job service
struct JobRequest {
    std::string prompt;
    std::string negative_prompt;
    int64_t seed = -1; // -1 lets the service pick a seed
    std::string image_url;
    std::string output_format = "png";
    bool enable_safety_checker = true;
};

// Outcome of submitting and polling one job
struct JobOutcome {
    bool ok = false;
    std::string result_url;
    JobHandle job_id;
    JobStatus final_status = JobStatus::unknown;
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
    int32_t polls_used = 0;
    int32_t transient_failures = 0;
    int64_t latency_ms = 0;

    bool is_success() const { return ok; }

    static JobOutcome success(const JobHandle& job_id, std::string result_url,
                              int32_t polls_used, int64_t latency_ms = 0) {
        JobOutcome outcome;
        outcome.ok = true;
        outcome.job_id = job_id;
        outcome.result_url = std::move(result_url);
        outcome.final_status = JobStatus::completed;
        outcome.polls_used = polls_used;
        outcome.latency_ms = latency_ms;
        return outcome;
    }

    static JobOutcome error_result(ErrorCode code, const std::string& message,
                                   const JobHandle& job_id = "",
                                   JobStatus final_status = JobStatus::unknown,
                                   int32_t polls_used = 0, int64_t latency_ms = 0) {
        JobOutcome outcome;
        outcome.ok = false;
        outcome.error_code = code;
        outcome.error_message = message;
        outcome.job_id = job_id;
        outcome.final_status = final_status;
        outcome.polls_used = polls_used;
        outcome.latency_ms = latency_ms;
        return outcome;
    }
};

// Pipeline run status (ok|error|timeout)
enum class PipelineStatus {
    ok,
    error,
    timeout // poll budget exhausted, remote outcome unknown
};

// Unified result handed back to the caller of a pipeline run
struct PipelineResult {
    PipelineStatus status = PipelineStatus::ok;
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
    HostedArtifact original;  // kept on failure for diagnostic display
    std::string edited_url;
    JobHandle job_id;
    JobStatus job_status = JobStatus::unknown;
    int32_t polls_used = 0;
    int64_t latency_ms = 0;
    RunContext context;

    bool is_success() const { return status == PipelineStatus::ok; }
    bool is_error() const { return status == PipelineStatus::error; }
    bool is_timeout() const { return status == PipelineStatus::timeout; }

    static PipelineResult success(const RunContext& ctx, const HostedArtifact& original,
                                  const JobOutcome& job, int64_t latency_ms = 0) {
        PipelineResult result;
        result.status = PipelineStatus::ok;
        result.context = ctx;
        result.original = original;
        result.edited_url = job.result_url;
        result.job_id = job.job_id;
        result.job_status = job.final_status;
        result.polls_used = job.polls_used;
        result.latency_ms = latency_ms;
        return result;
    }

    static PipelineResult error_result(ErrorCode code, const std::string& message,
                                       const RunContext& ctx,
                                       int64_t latency_ms = 0) {
        PipelineResult result;
        result.status = code == ErrorCode::poll_budget_exhausted ? PipelineStatus::timeout
                                                                 : PipelineStatus::error;
        result.error_code = code;
        result.error_message = message;
        result.context = ctx;
        result.latency_ms = latency_ms;
        return result;
    }
};

} // namespace pipeline
} // namespace editrelay
