#include "http_utils.hpp"
#include <chrono>
#include <thread>
#include <curl/curl.h>
#include <string>
#include <stdexcept>

namespace {

size_t append_response_chunk(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Owns the curl handle and header list for one request.
class CurlRequestHandle {
public:
    CurlRequestHandle() : curl_handle(curl_easy_init()), header_list(nullptr) {}
    ~CurlRequestHandle() {
        if (header_list) {
            curl_slist_free_all(header_list);
        }
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
    }

    CurlRequestHandle(const CurlRequestHandle&) = delete;
    CurlRequestHandle& operator=(const CurlRequestHandle&) = delete;

    CURL* get() const { return curl_handle; }

    void append_header(const std::string& header_line) {
        header_list = curl_slist_append(header_list, header_line.c_str());
    }

    curl_slist* headers() const { return header_list; }

private:
    CURL* curl_handle;
    curl_slist* header_list;
};

std::string perform_with_retries(const HttpRequest& http_request, CurlRequestHandle& request_handle,
                                 std::string& response, const std::string& method_name) {
    CURL* curl_handle = request_handle.get();
    curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, request_handle.headers());
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, append_response_chunk);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode curl_result = CURLE_OK;
    long http_response_code = 0;
    int attempt_count = http_request.attempts > 0 ? http_request.attempts : 1;

    for (int retry_attempt = 0; retry_attempt < attempt_count; ++retry_attempt) {
        response.clear();
        curl_result = curl_easy_perform(curl_handle);
        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response_code);

        if (curl_result == CURLE_OK) {
            if (response.empty()) {
                throw std::runtime_error("HTTP " + method_name + " succeeded but returned empty response (HTTP " +
                                         std::to_string(http_response_code) + ") for URL: " + http_request.url);
            }
            return response;
        }

        if (retry_attempt < attempt_count - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(http_request.retry_delay_ms));
        }
    }

    throw std::runtime_error("HTTP " + method_name + " failed after " + std::to_string(attempt_count) + " attempts. " +
                             "Last error: " + std::string(curl_easy_strerror(curl_result)) +
                             " (HTTP " + std::to_string(http_response_code) + ") URL: " + http_request.url);
}

} // anonymous namespace

std::string http_get(const HttpRequest& http_request) {
    CurlRequestHandle request_handle;
    if (!request_handle.get()) {
        throw std::runtime_error("Failed to initialize CURL for HTTP GET request");
    }
    for (const std::string& header_line : http_request.headers) {
        request_handle.append_header(header_line);
    }

    std::string response;
    curl_easy_setopt(request_handle.get(), CURLOPT_HTTPGET, 1L);
    return perform_with_retries(http_request, request_handle, response, "GET");
}

std::string http_post(const HttpRequest& http_request) {
    CurlRequestHandle request_handle;
    if (!request_handle.get()) {
        throw std::runtime_error("Failed to initialize CURL for HTTP POST request");
    }
    for (const std::string& header_line : http_request.headers) {
        request_handle.append_header(header_line);
    }
    request_handle.append_header("Content-Type: application/json");

    std::string response;
    curl_easy_setopt(request_handle.get(), CURLOPT_POSTFIELDS, http_request.body.c_str());
    curl_easy_setopt(request_handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
    return perform_with_retries(http_request, request_handle, response, "POST");
}
