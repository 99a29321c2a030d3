#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <utility>
#include <vector>

// One REST call. Retries cover transport failures only; any HTTP response
// with a body is returned to the caller, which interprets the OKX "code".
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;
    std::string body;           // POST payload (JSON); empty for GET
    int attempts;
    int timeout_seconds;
    int retry_delay_ms;

    HttpRequest(std::string request_url, std::vector<std::string> header_lines, std::string request_body,
                int attempt_count, int timeout, int retry_delay = 250)
        : url(std::move(request_url)), headers(std::move(header_lines)), body(std::move(request_body)),
          attempts(attempt_count), timeout_seconds(timeout), retry_delay_ms(retry_delay) {}
};

// Both throw std::runtime_error once every attempt has failed.
std::string http_get(const HttpRequest& request);
std::string http_post(const HttpRequest& request);

#endif // HTTP_UTILS_HPP
