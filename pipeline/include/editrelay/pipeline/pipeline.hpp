#pragma once

#include "editrelay/pipeline/artifact_hoster.hpp"
#include "editrelay/pipeline/config.hpp"
#include "editrelay/pipeline/core.hpp"
#include "editrelay/pipeline/job_client.hpp"
#include "editrelay/pipeline/observability.hpp"
#include <memory>
#include <string>

namespace editrelay {
namespace pipeline {

// Edit parameters as entered by the user; seed is free text until validated
struct EditParameters {
    std::string prompt;
    std::string negative_prompt;
    std::string seed;
};

/**
 * Orchestrates one edit: validate inputs, host the image, run the job.
 *
 * Stages run strictly in order and the first failure ends the run. A
 * failed upload never reaches the job service.
 */
class EditPipeline {
public:
    EditPipeline(const PipelineConfig& config,
                 std::shared_ptr<HttpTransport> transport,
                 std::shared_ptr<Observability> observability,
                 SleepFunction sleep = SleepFunction());

    PipelineResult run(const ImagePayload& payload,
                       const EditParameters& params,
                       const std::string& job_credential,
                       const RunContext& ctx = {});

private:
    PipelineConfig config_;
    std::shared_ptr<Observability> observability_;
    ArtifactHoster hoster_;
    JobClient job_client_;

    PipelineResult finish(PipelineResult result, const std::string& stage);
};

// Unique identifier for one pipeline run
std::string generate_run_id();

} // namespace pipeline
} // namespace editrelay
