#pragma once

#include "editrelay/pipeline/core.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace editrelay {
namespace pipeline {

// Converter utilities between pipeline types and their wire/display forms

class ResultConverter {
public:
    // Convert the job service's status string to JobStatus
    // Contract: "IN_QUEUE" | "IN_PROGRESS" | "COMPLETED" | "FAILED" | "CANCELED"
    static JobStatus job_status_from_string(const std::string& status_str) {
        if (status_str == "IN_QUEUE") {
            return JobStatus::queued;
        } else if (status_str == "IN_PROGRESS") {
            return JobStatus::running;
        } else if (status_str == "COMPLETED") {
            return JobStatus::completed;
        } else if (status_str == "FAILED") {
            return JobStatus::failed;
        } else if (status_str == "CANCELED" || status_str == "CANCELLED") {
            return JobStatus::canceled;
        }
        return JobStatus::unknown;  // The client never guesses a status
    }

    // Convert JobStatus back to the job service's spelling
    static std::string job_status_to_string(JobStatus status) {
        switch (status) {
            case JobStatus::queued:
                return "IN_QUEUE";
            case JobStatus::running:
                return "IN_PROGRESS";
            case JobStatus::completed:
                return "COMPLETED";
            case JobStatus::failed:
                return "FAILED";
            case JobStatus::canceled:
                return "CANCELED";
            case JobStatus::unknown:
            default:
                return "UNKNOWN";
        }
    }

    static std::string pipeline_status_to_string(PipelineStatus status) {
        switch (status) {
            case PipelineStatus::ok:
                return "success";
            case PipelineStatus::error:
                return "error";
            case PipelineStatus::timeout:
                return "timeout";
            default:
                return "error";
        }
    }

    // Convert ErrorCode to machine-readable string code
    static std::string error_code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::none:
                return "NONE";
            case ErrorCode::invalid_input:
                return "INVALID_INPUT";
            case ErrorCode::configuration_error:
                return "CONFIGURATION_ERROR";
            case ErrorCode::submission_error:
                return "SUBMISSION_ERROR";
            case ErrorCode::job_failed:
                return "JOB_FAILED";
            case ErrorCode::malformed_result:
                return "MALFORMED_RESULT";
            case ErrorCode::network_error:
                return "NETWORK_ERROR";
            case ErrorCode::protocol_error:
                return "PROTOCOL_ERROR";
            case ErrorCode::upload_rejected:
                return "UPLOAD_REJECTED";
            case ErrorCode::transient_poll_error:
                return "TRANSIENT_POLL_ERROR";
            case ErrorCode::poll_budget_exhausted:
                return "TIMEOUT";
            default:
                return "UNKNOWN_ERROR";
        }
    }

    // Convert PipelineResult to the JSON document printed by the CLI
    static nlohmann::json to_json(const PipelineResult& result) {
        nlohmann::json doc;
        doc["status"] = pipeline_status_to_string(result.status);
        doc["latency_ms"] = result.latency_ms;

        if (!result.context.run_id.empty()) {
            doc["run_id"] = result.context.run_id;
        }
        if (!result.context.trace_id.empty()) {
            doc["trace_id"] = result.context.trace_id;
        }

        // The hosted original is shown even when a later stage failed
        if (result.original.is_success()) {
            doc["original_url"] = result.original.url;
        }

        if (!result.job_id.empty()) {
            doc["job_id"] = result.job_id;
            doc["job_status"] = job_status_to_string(result.job_status);
            doc["polls_used"] = result.polls_used;
        }

        if (result.is_success()) {
            doc["edited_url"] = result.edited_url;
        } else {
            doc["error_code"] = error_code_to_string(result.error_code);
            if (!result.error_message.empty()) {
                doc["error_message"] = result.error_message;
            }
        }

        return doc;
    }

    // Validate PipelineResult before handing it to the caller
    static bool validate_result(const PipelineResult& result) {
        if (result.status == PipelineStatus::ok) {
            if (result.error_code != ErrorCode::none) {
                return false;  // Invalid: success status with error code
            }
            if (result.edited_url.empty()) {
                return false;  // Invalid: success without a result
            }
        } else if (result.error_code == ErrorCode::none) {
            return false;  // Invalid: error status without error code
        }

        if (result.latency_ms < 0) {
            return false;
        }

        return true;
    }
};

} // namespace pipeline
} // namespace editrelay
