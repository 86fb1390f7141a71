#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <caf/expected.hpp>

namespace editrelay {
namespace pipeline {

// One part of a multipart/form-data body
struct MultipartPart {
    std::string name;
    std::string data;          // raw bytes, may contain NUL
    std::string filename;      // empty for plain form fields
    std::string content_type;  // empty to let the transport decide
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;                  // used when parts is empty
    std::vector<MultipartPart> parts;  // non-empty selects multipart/form-data
    int64_t timeout_ms = 30000;
    int64_t connect_timeout_ms = 5000;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::string headers;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Blocking HTTP client seam shared by the hoster and the job client
 *
 * perform() returns a response for every completed exchange, whatever its
 * status code. Transport failures come back as errors:
 * - caf::sec::request_timeout when the call ran out of time
 * - caf::sec::runtime_error for every other failure
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual caf::expected<HttpResponse> perform(const HttpRequest& request) = 0;
};

// libcurl easy-handle implementation
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();

    caf::expected<HttpResponse> perform(const HttpRequest& request) override;

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, std::string* userdata);
};

} // namespace pipeline
} // namespace editrelay
