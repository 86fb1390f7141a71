#include "editrelay/pipeline/config.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <caf/unit.hpp>
#include <cstdlib>

namespace editrelay {
namespace pipeline {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

} // namespace

PipelineConfig PipelineConfig::from_environment() {
    PipelineConfig config;
    config.hosting_api_key = env_or("IMGBB_API_KEY", "");
    config.hosting_url = env_or("EDITRELAY_HOSTING_URL", config.hosting_url);
    config.job_endpoint = env_or("EDITRELAY_JOB_ENDPOINT", config.job_endpoint);
    return config;
}

caf::expected<void> validate_config(const PipelineConfig& config) {
    if (config.hosting_api_key.empty()) {
        return caf::make_error(caf::sec::invalid_argument,
                               "IMGBB_API_KEY environment variable is not set");
    }
    if (config.hosting_url.empty()) {
        return caf::make_error(caf::sec::invalid_argument, "hosting URL is empty");
    }
    if (config.job_endpoint.empty()) {
        return caf::make_error(caf::sec::invalid_argument, "job endpoint is empty");
    }
    if (config.max_polls <= 0) {
        return caf::make_error(caf::sec::invalid_argument, "max polls must be positive");
    }
    if (config.poll_interval_ms < 0) {
        return caf::make_error(caf::sec::invalid_argument, "poll interval must not be negative");
    }
    if (config.upload_timeout_ms <= 0 || config.submit_timeout_ms <= 0 ||
        config.poll_timeout_ms <= 0 || config.connect_timeout_ms <= 0) {
        return caf::make_error(caf::sec::invalid_argument, "network timeouts must be positive");
    }
    return caf::unit;
}

} // namespace pipeline
} // namespace editrelay
