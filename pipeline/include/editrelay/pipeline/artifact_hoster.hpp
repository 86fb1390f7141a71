#pragma once

#include "editrelay/pipeline/config.hpp"
#include "editrelay/pipeline/core.hpp"
#include "editrelay/pipeline/http_transport.hpp"
#include "editrelay/pipeline/observability.hpp"
#include <memory>
#include <string>

namespace editrelay {
namespace pipeline {

/**
 * Uploads an image to the hosting service and returns its public URL.
 *
 * Exactly one request per upload() call, no retries. The payload goes out
 * as a multipart body whose `image` part carries the raw bytes.
 */
class ArtifactHoster {
public:
    ArtifactHoster(const PipelineConfig& config,
                   std::shared_ptr<HttpTransport> transport,
                   std::shared_ptr<Observability> observability);

    HostedArtifact upload(const ImagePayload& payload,
                          const std::string& credential,
                          const RunContext& ctx = {});

    HttpRequest build_upload_request(const ImagePayload& payload,
                                     const std::string& credential) const;

private:
    std::string hosting_url_;
    int64_t timeout_ms_;
    int64_t connect_timeout_ms_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<Observability> observability_;

    HostedArtifact interpret_response(const HttpResponse& response, int64_t latency_ms) const;
};

// Reduces a user-supplied filename to a safe ASCII name ("image" if nothing is left)
std::string sanitize_filename(const std::string& filename);

} // namespace pipeline
} // namespace editrelay
