#include <iostream>
#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include "editrelay/pipeline/artifact_hoster.hpp"
#include "mock_http_transport.hpp"

using namespace editrelay::pipeline;
using editrelay::pipeline::testing::MockHttpTransport;
using editrelay::pipeline::testing::find_part;

namespace {

struct HosterFixture {
    std::ostringstream log_out;
    std::ostringstream log_err;
    PipelineConfig config;
    std::shared_ptr<MockHttpTransport> transport = std::make_shared<MockHttpTransport>();
    std::shared_ptr<Observability> observability =
        std::make_shared<Observability>("test_hoster", log_out, log_err);

    HosterFixture() {
        config.hosting_url = "https://hosting.local/1/upload";
        config.hosting_api_key = "imgbb-key";
    }

    ArtifactHoster hoster() { return ArtifactHoster(config, transport, observability); }
};

const char* SUCCESS_BODY = R"({"success":true,"status":200,"data":{"url":"https://host/x.png","id":"abc"}})";

} // namespace

void test_upload_success_returns_url() {
    std::cout << "Testing successful upload..." << std::endl;

    HosterFixture fixture;
    fixture.transport->push_response(200, SUCCESS_BODY);

    auto artifact = fixture.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(artifact.is_success());
    assert(artifact.url == "https://host/x.png");
    assert(artifact.http_status == 200);
    assert(fixture.transport->request_count() == 1);

    const auto& request = fixture.transport->requests()[0];
    assert(request.method == "POST");
    assert(request.url == "https://hosting.local/1/upload");
    assert(request.timeout_ms == fixture.config.upload_timeout_ms);

    std::cout << "✓ Successful upload test passed" << std::endl;
}

void test_upload_preserves_bytes() {
    std::cout << "Testing byte-exact upload payload..." << std::endl;

    HosterFixture fixture;
    fixture.transport->push_response(200, SUCCESS_BODY);

    // Embedded NUL and high bytes must survive unchanged
    const std::string bytes("\x89PNG\0\0\xff\xfe\x00\x01", 10);
    fixture.hoster().upload(ImagePayload(bytes, "my photo.png"), "imgbb-key");

    const auto& request = fixture.transport->requests().at(0);
    const MultipartPart* image = find_part(request, "image");
    assert(image != nullptr);
    assert(image->data.size() == 10);
    assert(image->data == bytes);
    assert(image->filename == "my_photo.png");
    assert(image->content_type == "application/octet-stream");

    const MultipartPart* key = find_part(request, "key");
    assert(key != nullptr);
    assert(key->data == "imgbb-key");

    const MultipartPart* name = find_part(request, "name");
    assert(name != nullptr);
    assert(name->data == "my_photo.png");

    std::cout << "✓ Byte-exact upload payload test passed" << std::endl;
}

void test_missing_credential_skips_network() {
    std::cout << "Testing upload without credential..." << std::endl;

    HosterFixture fixture;
    fixture.transport->push_response(200, SUCCESS_BODY);

    auto artifact = fixture.hoster().upload(ImagePayload("0123456789", "photo.png"), "");
    assert(!artifact.is_success());
    assert(artifact.error_code == ErrorCode::configuration_error);
    assert(artifact.error_message.find("IMGBB_API_KEY") != std::string::npos);
    assert(fixture.transport->request_count() == 0);

    std::cout << "✓ Upload without credential test passed" << std::endl;
}

void test_service_rejection() {
    std::cout << "Testing service-reported rejection..." << std::endl;

    HosterFixture fixture;
    fixture.transport->push_response(200, R"({"success":false,"error":{"message":"Invalid API v1 key."}})");

    auto artifact = fixture.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(!artifact.is_success());
    assert(artifact.error_code == ErrorCode::upload_rejected);
    assert(artifact.error_message == "Upload rejected: Invalid API v1 key.");
    assert(artifact.url.empty());

    HosterFixture no_message;
    no_message.transport->push_response(200, R"({"success":false})");
    artifact = no_message.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(artifact.error_code == ErrorCode::upload_rejected);
    assert(artifact.error_message == "Upload rejected: Unknown Error");

    std::cout << "✓ Service-reported rejection test passed" << std::endl;
}

void test_http_rejection() {
    std::cout << "Testing HTTP-level rejection..." << std::endl;

    HosterFixture fixture;
    fixture.transport->push_response(400, R"({"status_code":400,"error":{"message":"Empty upload source."}})");

    auto artifact = fixture.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(!artifact.is_success());
    assert(artifact.error_code == ErrorCode::upload_rejected);
    assert(artifact.http_status == 400);
    assert(artifact.error_message.find("Empty upload source.") != std::string::npos);

    HosterFixture gateway;
    gateway.transport->push_response(502, "<html>Bad Gateway</html>");
    artifact = gateway.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(artifact.error_code == ErrorCode::upload_rejected);
    assert(artifact.error_message.find("HTTP 502") != std::string::npos);

    std::cout << "✓ HTTP-level rejection test passed" << std::endl;
}

void test_protocol_errors() {
    std::cout << "Testing malformed hosting responses..." << std::endl;

    HosterFixture garbage;
    garbage.transport->push_response(200, "not json at all");
    auto artifact = garbage.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(artifact.error_code == ErrorCode::protocol_error);

    HosterFixture no_url;
    no_url.transport->push_response(200, R"({"success":true,"data":{}})");
    artifact = no_url.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(artifact.error_code == ErrorCode::protocol_error);
    assert(artifact.url.empty());

    HosterFixture empty_url;
    empty_url.transport->push_response(200, R"({"success":true,"data":{"url":""}})");
    artifact = empty_url.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(artifact.error_code == ErrorCode::protocol_error);

    std::cout << "✓ Malformed hosting responses test passed" << std::endl;
}

void test_network_errors() {
    std::cout << "Testing transport failures..." << std::endl;

    HosterFixture refused;
    refused.transport->push_error(caf::sec::runtime_error, "Couldn't connect to server");
    auto artifact = refused.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(!artifact.is_success());
    assert(artifact.error_code == ErrorCode::network_error);
    assert(refused.transport->request_count() == 1);

    HosterFixture slow;
    slow.transport->push_error(caf::sec::request_timeout, "Operation timed out");
    artifact = slow.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-key");
    assert(artifact.error_code == ErrorCode::network_error);
    assert(artifact.error_message.find("timed out") != std::string::npos);
    // No retry on upload
    assert(slow.transport->request_count() == 1);

    std::cout << "✓ Transport failures test passed" << std::endl;
}

void test_credential_not_logged() {
    std::cout << "Testing credential stays out of logs..." << std::endl;

    HosterFixture fixture;
    fixture.transport->push_response(200, R"({"success":false,"error":{"message":"Invalid API v1 key."}})");
    fixture.hoster().upload(ImagePayload("0123456789", "photo.png"), "imgbb-very-secret");

    assert(fixture.log_out.str().find("imgbb-very-secret") == std::string::npos);
    assert(fixture.log_err.str().find("imgbb-very-secret") == std::string::npos);
    assert(!fixture.log_err.str().empty());

    std::cout << "✓ Credential stays out of logs test passed" << std::endl;
}

int main() {
    try {
        std::cout << "Running artifact hoster tests..." << std::endl;
        std::cout << "===========================================" << std::endl;

        std::cout << "\n[Happy Path Tests]" << std::endl;
        test_upload_success_returns_url();
        test_upload_preserves_bytes();

        std::cout << "\n[Error Handling Tests]" << std::endl;
        test_missing_credential_skips_network();
        test_service_rejection();
        test_http_rejection();
        test_protocol_errors();
        test_network_errors();
        test_credential_not_logged();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All artifact hoster tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
