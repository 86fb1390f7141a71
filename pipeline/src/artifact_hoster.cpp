#include "editrelay/pipeline/artifact_hoster.hpp"
#include "editrelay/pipeline/result_converter.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>

namespace editrelay {
namespace pipeline {

using json = nlohmann::json;

namespace {

std::string service_error_message(const json& body) {
    if (!body.is_object() || !body.contains("error")) {
        return "";
    }
    const auto& error = body.at("error");
    if (error.is_object()) {
        if (error.contains("message") && error.at("message").is_string()) {
            return error.at("message").get<std::string>();
        }
        return error.dump();
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return error.is_null() ? "" : error.dump();
}

} // namespace

std::string sanitize_filename(const std::string& filename) {
    // Drop directory components from either separator style
    std::string base = filename;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string result;
    bool pending_space = false;
    for (unsigned char c : base) {
        if (c >= 0x80) {
            continue;
        }
        if (std::isspace(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            if (pending_space) {
                result += '_';
                pending_space = false;
            }
            result += static_cast<char>(c);
        }
    }

    auto first = result.find_first_not_of("._");
    if (first == std::string::npos) {
        return "image";
    }
    auto last = result.find_last_not_of("._");
    return result.substr(first, last - first + 1);
}

ArtifactHoster::ArtifactHoster(const PipelineConfig& config,
                               std::shared_ptr<HttpTransport> transport,
                               std::shared_ptr<Observability> observability)
    : hosting_url_(config.hosting_url),
      timeout_ms_(config.upload_timeout_ms),
      connect_timeout_ms_(config.connect_timeout_ms),
      transport_(std::move(transport)),
      observability_(std::move(observability)) {}

HttpRequest ArtifactHoster::build_upload_request(const ImagePayload& payload,
                                                 const std::string& credential) const {
    const std::string name = sanitize_filename(payload.filename());

    HttpRequest request;
    request.method = "POST";
    request.url = hosting_url_;
    request.timeout_ms = timeout_ms_;
    request.connect_timeout_ms = connect_timeout_ms_;
    request.parts.push_back({"key", credential, "", ""});
    request.parts.push_back({"image", payload.bytes(), name, "application/octet-stream"});
    request.parts.push_back({"name", name, "", ""});
    return request;
}

HostedArtifact ArtifactHoster::upload(const ImagePayload& payload,
                                      const std::string& credential,
                                      const RunContext& ctx) {
    if (credential.empty()) {
        observability_->log_error_with_context("Hosting credential is not configured", ctx, "upload");
        observability_->record_upload("configuration_error");
        return HostedArtifact::error_result(ErrorCode::configuration_error,
                                            "IMGBB_API_KEY environment variable is not set.");
    }

    auto span = observability_->start_stage_span("upload", ctx);
    observability_->log_info_with_context("Uploading image to hosting service", ctx, "upload", {
        {"filename", payload.filename()},
        {"bytes", std::to_string(payload.size())}
    });

    auto start_time = std::chrono::steady_clock::now();
    auto response = transport_->perform(build_upload_request(payload, credential));
    auto end_time = std::chrono::steady_clock::now();
    auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    HostedArtifact artifact;
    if (!response) {
        std::string detail = caf::to_string(response.error());
        std::string message = response.error() == caf::sec::request_timeout
            ? "Network error with hosting service (timed out): " + detail
            : "Network error with hosting service: " + detail;
        artifact = HostedArtifact::error_result(ErrorCode::network_error, message, 0, latency_ms);
    } else {
        artifact = interpret_response(*response, latency_ms);
    }

    span->End();

    if (artifact.is_success()) {
        observability_->record_upload("success");
        observability_->log_info_with_context("Upload successful", ctx, "upload", {
            {"url", artifact.url},
            {"latency_ms", std::to_string(latency_ms)}
        });
    } else {
        observability_->record_upload(ResultConverter::error_code_to_string(artifact.error_code));
        observability_->log_error_with_context("Upload failed", ctx, "upload", {
            {"error_code", ResultConverter::error_code_to_string(artifact.error_code)},
            {"error", artifact.error_message},
            {"http_status", std::to_string(artifact.http_status)}
        });
    }

    return artifact;
}

HostedArtifact ArtifactHoster::interpret_response(const HttpResponse& response, int64_t latency_ms) const {
    json body;
    bool decoded = true;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error&) {
        decoded = false;
    }

    if (!response.is_success()) {
        std::string message = decoded ? service_error_message(body) : "";
        if (message.empty()) {
            message = "hosting service returned HTTP " + std::to_string(response.status_code);
        }
        return HostedArtifact::error_result(
            ErrorCode::upload_rejected,
            "Upload rejected (HTTP " + std::to_string(response.status_code) + "): " + message,
            response.status_code,
            latency_ms);
    }

    if (!decoded || !body.is_object()) {
        return HostedArtifact::error_result(
            ErrorCode::protocol_error,
            "Hosting service returned an undecodable response",
            response.status_code,
            latency_ms);
    }

    const bool success = body.contains("success") && body.at("success").is_boolean() &&
                         body.at("success").get<bool>();
    if (!success) {
        std::string message = service_error_message(body);
        if (message.empty()) {
            message = "Unknown Error";
        }
        return HostedArtifact::error_result(
            ErrorCode::upload_rejected,
            "Upload rejected: " + message,
            response.status_code,
            latency_ms);
    }

    const json* data = body.contains("data") ? &body.at("data") : nullptr;
    if (data == nullptr || !data->is_object() || !data->contains("url") ||
        !data->at("url").is_string() || data->at("url").get<std::string>().empty()) {
        return HostedArtifact::error_result(
            ErrorCode::protocol_error,
            "Hosting service reported success without an image URL",
            response.status_code,
            latency_ms);
    }

    return HostedArtifact::success(data->at("url").get<std::string>(), response.status_code, latency_ms);
}

} // namespace pipeline
} // namespace editrelay
