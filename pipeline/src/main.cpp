#include <iostream>
#include <caf/actor_system_config.hpp>
#include "editrelay/pipeline/config.hpp"
#include "editrelay/pipeline/feature_flags.hpp"
#include "editrelay/pipeline/http_transport.hpp"
#include "editrelay/pipeline/observability.hpp"
#include "editrelay/pipeline/pipeline.hpp"
#include "editrelay/pipeline/result_converter.hpp"
#include <unistd.h>

namespace {

constexpr int exit_ok = 0;
constexpr int exit_pipeline_failure = 1;
constexpr int exit_usage_error = 2;

} // namespace

class EditRelayConfig : public caf::actor_system_config {
public:
    EditRelayConfig() {
        opt_group{custom_options_, "global"}
            .add(image_path, "image", "Path of the image to edit")
            .add(params.prompt, "prompt", "Edit instruction")
            .add(params.negative_prompt, "negative-prompt", "What the edit should avoid")
            .add(params.seed, "seed", "Integer seed (empty for random)")
            .add(job_key, "job-key", "Job service API key")
            .add(pipeline_config.hosting_url, "hosting-url", "Hosting service upload URL")
            .add(pipeline_config.job_endpoint, "job-endpoint", "Job service endpoint base URL")
            .add(pipeline_config.max_polls, "max-polls", "Maximum number of status polls")
            .add(pipeline_config.poll_interval_ms, "poll-interval-ms", "Delay between status polls (ms)");
    }

    // Environment first; command-line options override it
    editrelay::pipeline::PipelineConfig pipeline_config = editrelay::pipeline::PipelineConfig::from_environment();
    editrelay::pipeline::EditParameters params;
    std::string image_path;
    std::string job_key;
};

int run_cli(const EditRelayConfig& config) {
    using namespace editrelay::pipeline;

    auto observability = std::make_shared<Observability>("editrelay_" + std::to_string(getpid()));

    try {
        Observability::initialize_tracing();

        if (auto valid = validate_config(config.pipeline_config); !valid) {
            observability->log_error("Invalid configuration", "", "", "startup", "", {
                {"error", caf::to_string(valid.error())}
            });
            return exit_usage_error;
        }

        if (config.image_path.empty()) {
            observability->log_error("Missing required option --image", "", "", "startup");
            return exit_usage_error;
        }

        auto payload = ImagePayload::from_file(config.image_path, max_image_bytes);
        if (!payload) {
            observability->log_error("Cannot load image", "", "", "startup", "", {
                {"path", config.image_path},
                {"error", caf::to_string(payload.error())}
            });
            return exit_usage_error;
        }

        RunContext ctx;
        ctx.run_id = generate_run_id();

        EditPipeline pipeline(config.pipeline_config, std::make_shared<CurlHttpTransport>(), observability);
        PipelineResult result = pipeline.run(*payload, config.params, config.job_key, ctx);

        std::cout << ResultConverter::to_json(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;

        if (FeatureFlags::is_metrics_enabled()) {
            observability->log_debug("Metrics snapshot", ctx.run_id, result.job_id, "done", "", {
                {"metrics", observability->get_metrics_response()}
            });
        }

        return result.is_success() ? exit_ok : exit_pipeline_failure;

    } catch (const std::exception& e) {
        observability->log_error("editrelay fatal error", "", "", "", "", {{"error", e.what()}});
        return exit_pipeline_failure;
    }
}

int main(int argc, char** argv) {
    EditRelayConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return exit_usage_error;
    }
    if (config.cli_helptext_printed) {
        return exit_ok;
    }

    return run_cli(config);
}
