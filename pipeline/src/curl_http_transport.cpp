#include "editrelay/pipeline/http_transport.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace editrelay {
namespace pipeline {

namespace {

std::once_flag curl_init_flag;

} // namespace

CurlHttpTransport::CurlHttpTransport() {
    std::call_once(curl_init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

caf::expected<HttpResponse> CurlHttpTransport::perform(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return caf::make_error(caf::sec::runtime_error, "Failed to initialize CURL");
    }

    HttpResponse response;
    long response_code = 0;

    // Set basic options
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Connection establishment has its own bound inside the total timeout
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));

    // Set method and body
    curl_mime* mime = nullptr;
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        if (!request.parts.empty()) {
            mime = curl_mime_init(curl);
            for (const auto& part : request.parts) {
                curl_mimepart* mime_part = curl_mime_addpart(mime);
                curl_mime_name(mime_part, part.name.c_str());
                curl_mime_data(mime_part, part.data.data(), part.data.size());
                if (!part.filename.empty()) {
                    curl_mime_filename(mime_part, part.filename.c_str());
                }
                if (!part.content_type.empty()) {
                    curl_mime_type(mime_part, part.content_type.c_str());
                }
            }
            curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
        } else {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        }
    } else {
        curl_easy_cleanup(curl);
        return caf::make_error(caf::sec::invalid_argument,
                               "Unsupported HTTP method: " + request.method);
    }

    // Set headers
    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    // Perform request
    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    }

    // Cleanup
    curl_slist_free_all(header_list);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return caf::make_error(caf::sec::request_timeout,
                               "CURL request timed out: " + std::string(curl_easy_strerror(res)));
    }
    if (res != CURLE_OK) {
        return caf::make_error(caf::sec::runtime_error,
                               "CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    response.status_code = static_cast<int>(response_code);
    return response;
}

size_t CurlHttpTransport::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    if (userp == nullptr || contents == nullptr) {
        return 0;
    }
    const char* data = static_cast<const char*>(contents);
    userp->append(data, size * nmemb);
    return size * nmemb;
}

size_t CurlHttpTransport::header_callback(char* buffer, size_t size, size_t nitems, std::string* userdata) {
    userdata->append(buffer, size * nitems);
    return size * nitems;
}

} // namespace pipeline
} // namespace editrelay
