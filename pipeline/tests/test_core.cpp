#include <iostream>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "editrelay/pipeline/artifact_hoster.hpp"
#include "editrelay/pipeline/config.hpp"
#include "editrelay/pipeline/core.hpp"
#include "editrelay/pipeline/feature_flags.hpp"
#include "editrelay/pipeline/job_client.hpp"
#include "editrelay/pipeline/poll_policy.hpp"
#include "editrelay/pipeline/result_converter.hpp"

using namespace editrelay::pipeline;

// CONTRACT: result factories

void test_contract_hosted_artifact_factories() {
    std::cout << "Testing HostedArtifact factories..." << std::endl;

    auto ok = HostedArtifact::success("https://host/x.png", 200, 12);
    assert(ok.is_success());
    assert(ok.url == "https://host/x.png");
    assert(ok.error_code == ErrorCode::none);
    assert(ok.latency_ms == 12);

    auto failed = HostedArtifact::error_result(ErrorCode::upload_rejected, "Upload rejected: bad key", 400);
    assert(!failed.is_success());
    assert(failed.url.empty());
    assert(failed.error_code == ErrorCode::upload_rejected);
    assert(failed.http_status == 400);

    std::cout << "✓ HostedArtifact factories test passed" << std::endl;
}

void test_contract_job_outcome_factories() {
    std::cout << "Testing JobOutcome factories..." << std::endl;

    auto ok = JobOutcome::success("job-1", "https://host/edited.png", 2, 6000);
    assert(ok.is_success());
    assert(ok.final_status == JobStatus::completed);
    assert(ok.polls_used == 2);

    auto failed = JobOutcome::error_result(ErrorCode::job_failed, "Job failed: bad input", "job-1",
                                           JobStatus::failed, 1);
    assert(!failed.is_success());
    assert(failed.result_url.empty());
    assert(failed.final_status == JobStatus::failed);
    assert(failed.job_id == "job-1");

    std::cout << "✓ JobOutcome factories test passed" << std::endl;
}

void test_contract_pipeline_result_status() {
    std::cout << "Testing PipelineResult status mapping..." << std::endl;

    RunContext ctx{"run_1", "trace_1"};
    auto timeout = PipelineResult::error_result(ErrorCode::poll_budget_exhausted, "timed out", ctx);
    assert(timeout.is_timeout());
    assert(!timeout.is_error());
    assert(timeout.context.run_id == "run_1");

    auto error = PipelineResult::error_result(ErrorCode::network_error, "down", ctx);
    assert(error.is_error());

    auto original = HostedArtifact::success("https://host/x.png", 200);
    auto job = JobOutcome::success("job-1", "https://host/edited.png", 2);
    auto ok = PipelineResult::success(ctx, original, job, 10);
    assert(ok.is_success());
    assert(ok.edited_url == "https://host/edited.png");
    assert(ok.original.url == "https://host/x.png");
    assert(ok.job_status == JobStatus::completed);

    std::cout << "✓ PipelineResult status mapping test passed" << std::endl;
}

void test_contract_error_codes() {
    std::cout << "Testing error code families..." << std::endl;

    assert(static_cast<int>(ErrorCode::invalid_input) / 1000 == 1);
    assert(static_cast<int>(ErrorCode::configuration_error) / 1000 == 1);
    assert(static_cast<int>(ErrorCode::submission_error) / 1000 == 2);
    assert(static_cast<int>(ErrorCode::malformed_result) / 1000 == 2);
    assert(static_cast<int>(ErrorCode::network_error) / 1000 == 3);
    assert(static_cast<int>(ErrorCode::upload_rejected) / 1000 == 3);
    assert(static_cast<int>(ErrorCode::poll_budget_exhausted) / 1000 == 5);

    assert(ResultConverter::error_code_to_string(ErrorCode::upload_rejected) == "UPLOAD_REJECTED");
    assert(ResultConverter::error_code_to_string(ErrorCode::poll_budget_exhausted) == "TIMEOUT");
    assert(ResultConverter::error_code_to_string(ErrorCode::transient_poll_error) == "TRANSIENT_POLL_ERROR");

    std::cout << "✓ Error code families test passed" << std::endl;
}

// Status conversion

void test_job_status_mapping() {
    std::cout << "Testing job status mapping..." << std::endl;

    assert(ResultConverter::job_status_from_string("IN_QUEUE") == JobStatus::queued);
    assert(ResultConverter::job_status_from_string("IN_PROGRESS") == JobStatus::running);
    assert(ResultConverter::job_status_from_string("COMPLETED") == JobStatus::completed);
    assert(ResultConverter::job_status_from_string("FAILED") == JobStatus::failed);
    assert(ResultConverter::job_status_from_string("CANCELED") == JobStatus::canceled);
    assert(ResultConverter::job_status_from_string("CANCELLED") == JobStatus::canceled);
    assert(ResultConverter::job_status_from_string("TIMED_OUT") == JobStatus::unknown);
    assert(ResultConverter::job_status_from_string("") == JobStatus::unknown);
    assert(ResultConverter::job_status_from_string("completed") == JobStatus::unknown);

    assert(is_terminal(JobStatus::completed));
    assert(is_terminal(JobStatus::failed));
    assert(is_terminal(JobStatus::canceled));
    assert(!is_terminal(JobStatus::queued));
    assert(!is_terminal(JobStatus::running));
    assert(!is_terminal(JobStatus::unknown));

    assert(ResultConverter::job_status_to_string(JobStatus::unknown) == "UNKNOWN");
    assert(ResultConverter::job_status_to_string(JobStatus::queued) == "IN_QUEUE");

    std::cout << "✓ Job status mapping test passed" << std::endl;
}

void test_result_to_json() {
    std::cout << "Testing PipelineResult JSON conversion..." << std::endl;

    RunContext ctx{"run_7", ""};
    auto original = HostedArtifact::success("https://host/x.png", 200);
    auto ok = PipelineResult::success(ctx, original, JobOutcome::success("job-9", "https://host/edited.png", 2), 5);
    auto doc = ResultConverter::to_json(ok);
    assert(doc["status"] == "success");
    assert(doc["original_url"] == "https://host/x.png");
    assert(doc["edited_url"] == "https://host/edited.png");
    assert(doc["job_id"] == "job-9");
    assert(doc["polls_used"] == 2);
    assert(doc["run_id"] == "run_7");
    assert(!doc.contains("trace_id"));
    assert(!doc.contains("error_code"));

    auto failed = PipelineResult::error_result(ErrorCode::upload_rejected, "Upload rejected: bad key", ctx);
    doc = ResultConverter::to_json(failed);
    assert(doc["status"] == "error");
    assert(doc["error_code"] == "UPLOAD_REJECTED");
    assert(doc["error_message"] == "Upload rejected: bad key");
    assert(!doc.contains("original_url"));
    assert(!doc.contains("edited_url"));
    assert(!doc.contains("job_id"));

    // A hosted original survives a later failure
    auto timed_out = PipelineResult::error_result(ErrorCode::poll_budget_exhausted, "Job timed out", ctx);
    timed_out.original = original;
    timed_out.job_id = "job-9";
    timed_out.job_status = JobStatus::running;
    doc = ResultConverter::to_json(timed_out);
    assert(doc["status"] == "timeout");
    assert(doc["original_url"] == "https://host/x.png");
    assert(doc["job_status"] == "IN_PROGRESS");
    assert(doc["error_code"] == "TIMEOUT");

    std::cout << "✓ PipelineResult JSON conversion test passed" << std::endl;
}

void test_validate_result() {
    std::cout << "Testing result validation..." << std::endl;

    RunContext ctx;
    auto ok = PipelineResult::success(ctx, HostedArtifact::success("u", 200),
                                      JobOutcome::success("j", "https://host/edited.png", 1));
    assert(ResultConverter::validate_result(ok));

    auto no_url = ok;
    no_url.edited_url.clear();
    assert(!ResultConverter::validate_result(no_url));

    auto no_code = PipelineResult::error_result(ErrorCode::network_error, "x", ctx);
    assert(ResultConverter::validate_result(no_code));
    no_code.error_code = ErrorCode::none;
    assert(!ResultConverter::validate_result(no_code));

    auto negative = ok;
    negative.latency_ms = -1;
    assert(!ResultConverter::validate_result(negative));

    std::cout << "✓ Result validation test passed" << std::endl;
}

// Poll policy

void test_poll_policy_classification() {
    std::cout << "Testing poll error classification..." << std::endl;

    PollPolicy policy;
    assert(policy.is_retryable(ErrorCode::network_error));
    assert(policy.is_retryable(ErrorCode::transient_poll_error));
    assert(!policy.is_retryable(ErrorCode::protocol_error));
    assert(!policy.is_retryable(ErrorCode::job_failed));
    assert(!policy.is_retryable(ErrorCode::malformed_result));
    assert(!policy.is_retryable(ErrorCode::submission_error));

    std::cout << "✓ Poll error classification test passed" << std::endl;
}

void test_poll_policy_budget() {
    std::cout << "Testing poll budget..." << std::endl;

    PollPolicy defaults;
    assert(defaults.max_polls() == 100);
    assert(defaults.interval() == std::chrono::milliseconds(3000));
    assert(!defaults.is_budget_exhausted(99));
    assert(defaults.is_budget_exhausted(100));

    PollPolicy small(PollPolicy::Config{10, 3});
    assert(!small.is_budget_exhausted(0));
    assert(!small.is_budget_exhausted(2));
    assert(small.is_budget_exhausted(3));
    assert(small.interval() == std::chrono::milliseconds(10));

    std::cout << "✓ Poll budget test passed" << std::endl;
}

// Input parsing

void test_parse_seed() {
    std::cout << "Testing seed parsing..." << std::endl;

    assert(parse_seed("") == -1);
    assert(parse_seed("   ") == -1);
    assert(parse_seed("42") == 42);
    assert(parse_seed(" 42 ") == 42);
    assert(parse_seed("+7") == 7);
    assert(parse_seed("-1") == -1);
    assert(parse_seed("-9000") == -9000);
    assert(!parse_seed("abc").has_value());
    assert(!parse_seed("4.2").has_value());
    assert(!parse_seed("42abc").has_value());
    assert(!parse_seed("+").has_value());
    assert(!parse_seed("+-3").has_value());
    assert(!parse_seed("99999999999999999999").has_value());

    std::cout << "✓ Seed parsing test passed" << std::endl;
}

void test_sanitize_filename() {
    std::cout << "Testing filename sanitization..." << std::endl;

    assert(sanitize_filename("photo.png") == "photo.png");
    assert(sanitize_filename("/tmp/uploads/photo.png") == "photo.png");
    assert(sanitize_filename("C:\\Users\\me\\photo.png") == "photo.png");
    assert(sanitize_filename("my holiday  photo.jpg") == "my_holiday_photo.jpg");
    assert(sanitize_filename("../../etc/passwd") == "passwd");
    assert(sanitize_filename("caf\xc3\xa9.png") == "caf.png");
    assert(sanitize_filename("..hidden.") == "hidden");
    assert(sanitize_filename("a$b%c.png") == "abc.png");
    assert(sanitize_filename("") == "image");
    assert(sanitize_filename("...") == "image");
    assert(sanitize_filename("\xe5\x9b\xbe") == "image");

    std::cout << "✓ Filename sanitization test passed" << std::endl;
}

// Configuration

void test_config_defaults_and_validation() {
    std::cout << "Testing configuration validation..." << std::endl;

    PipelineConfig config;
    assert(config.poll_interval_ms == 3000);
    assert(config.max_polls == 100);
    assert(config.output_format == "png");
    assert(config.enable_safety_checker);

    // Missing hosting credential is a configuration error
    auto missing = validate_config(config);
    assert(!missing);

    config.hosting_api_key = "imgbb-key";
    assert(validate_config(config));

    auto zero_budget = config;
    zero_budget.max_polls = 0;
    assert(!validate_config(zero_budget));

    auto bad_timeout = config;
    bad_timeout.poll_timeout_ms = 0;
    assert(!validate_config(bad_timeout));

    auto no_endpoint = config;
    no_endpoint.job_endpoint.clear();
    assert(!validate_config(no_endpoint));

    std::cout << "✓ Configuration validation test passed" << std::endl;
}

void test_config_from_environment() {
    std::cout << "Testing configuration from environment..." << std::endl;

    setenv("IMGBB_API_KEY", "env-key", 1);
    setenv("EDITRELAY_JOB_ENDPOINT", "https://jobs.local/v2/edit", 1);
    unsetenv("EDITRELAY_HOSTING_URL");

    auto config = PipelineConfig::from_environment();
    assert(config.hosting_api_key == "env-key");
    assert(config.job_endpoint == "https://jobs.local/v2/edit");
    assert(config.hosting_url == "https://api.imgbb.com/1/upload");

    unsetenv("IMGBB_API_KEY");
    unsetenv("EDITRELAY_JOB_ENDPOINT");
    assert(PipelineConfig::from_environment().hosting_api_key.empty());

    std::cout << "✓ Configuration from environment test passed" << std::endl;
}

void test_feature_flag_values() {
    std::cout << "Testing feature flag parsing..." << std::endl;

    setenv("EDITRELAY_TRACING_ENABLED", "TRUE", 1);
    assert(FeatureFlags::is_tracing_enabled());
    setenv("EDITRELAY_TRACING_ENABLED", "Yes", 1);
    assert(FeatureFlags::is_tracing_enabled());

    // Non-ASCII bytes are compared, never enabled
    setenv("EDITRELAY_TRACING_ENABLED", "\xc3\xa9t\xc3\xa9", 1);
    assert(!FeatureFlags::is_tracing_enabled());
    setenv("EDITRELAY_TRACING_ENABLED", "TR\xd5" "E", 1);
    assert(!FeatureFlags::is_tracing_enabled());

    unsetenv("EDITRELAY_TRACING_ENABLED");
    assert(!FeatureFlags::is_tracing_enabled());

    std::cout << "✓ Feature flag parsing test passed" << std::endl;
}

// Image loading

void test_image_payload_from_file() {
    std::cout << "Testing image loading..." << std::endl;

    auto path = std::filesystem::temp_directory_path() / "editrelay_test_image.bin";
    const std::string bytes("\x89PNG\r\n\x1a\n\0\0\xff", 11);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    auto payload = ImagePayload::from_file(path, max_image_bytes);
    assert(payload);
    assert(payload->bytes() == bytes);
    assert(payload->size() == 11);
    assert(payload->filename() == "editrelay_test_image.bin");

    auto too_large = ImagePayload::from_file(path, 10);
    assert(!too_large);

    std::filesystem::remove(path);
    auto missing = ImagePayload::from_file(path, max_image_bytes);
    assert(!missing);

    std::cout << "✓ Image loading test passed" << std::endl;
}

int main() {
    try {
        std::cout << "Running core tests..." << std::endl;
        std::cout << "===========================================" << std::endl;

        std::cout << "\n[CONTRACT Tests: Core Data Structures]" << std::endl;
        test_contract_hosted_artifact_factories();
        test_contract_job_outcome_factories();
        test_contract_pipeline_result_status();
        test_contract_error_codes();

        std::cout << "\n[Conversion Tests]" << std::endl;
        test_job_status_mapping();
        test_result_to_json();
        test_validate_result();

        std::cout << "\n[Poll Policy Tests]" << std::endl;
        test_poll_policy_classification();
        test_poll_policy_budget();

        std::cout << "\n[Input Tests]" << std::endl;
        test_parse_seed();
        test_sanitize_filename();
        test_image_payload_from_file();

        std::cout << "\n[Configuration Tests]" << std::endl;
        test_config_defaults_and_validation();
        test_config_from_environment();
        test_feature_flag_values();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All core tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
