#pragma once

#include <cstdint>
#include <string>
#include <caf/expected.hpp>

namespace editrelay {
namespace pipeline {

// Upper bound for an image accepted by the command-line front end
constexpr std::size_t max_image_bytes = 16 * 1024 * 1024;

// Process-wide settings, built once at startup and read-only afterwards
struct PipelineConfig {
    // Hosting service
    std::string hosting_url = "https://api.imgbb.com/1/upload";
    std::string hosting_api_key;

    // Job service (POST {job_endpoint}/run, GET {job_endpoint}/status/{id})
    std::string job_endpoint = "https://api.runpod.ai/v2/qwen-image-edit";

    // Poll budget: total wait is max_polls x (poll_interval_ms + poll latency)
    int64_t poll_interval_ms = 3000;
    int32_t max_polls = 100;

    // Per-call network timeouts
    int64_t upload_timeout_ms = 30000;
    int64_t submit_timeout_ms = 60000;
    int64_t poll_timeout_ms = 5000;
    int64_t connect_timeout_ms = 5000;

    // Fixed job parameters
    std::string output_format = "png";
    bool enable_safety_checker = true;

    /**
     * Build a config from the process environment
     *
     * - IMGBB_API_KEY: hosting credential (required, checked by validate_config)
     * - EDITRELAY_HOSTING_URL: overrides hosting_url
     * - EDITRELAY_JOB_ENDPOINT: overrides job_endpoint
     */
    static PipelineConfig from_environment();
};

// Rejects configs that cannot drive a pipeline run
caf::expected<void> validate_config(const PipelineConfig& config);

} // namespace pipeline
} // namespace editrelay
