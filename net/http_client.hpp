#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "../common/errors.hpp"

namespace sorter {

struct http_request {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
};

struct http_response {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Transport failure: DNS, TLS, connection reset or timeout
 */
class http_error : public sorter_error {
public:
    explicit http_error(const std::string& what) : sorter_error(what) {}
};

class ihttp_client {
public:
    virtual ~ihttp_client() = default;

    /**
     * @brief Perform one request, any HTTP status is returned as a response
     *
     * @throws http_error when no response was received
     */
    virtual http_response send(const http_request& request) = 0;
};

/**
 * @brief libcurl client, one easy handle per request, bounded total timeout
 */
class curl_http_client : public ihttp_client {
public:
    explicit curl_http_client(std::chrono::seconds timeout);

    http_response send(const http_request& request) override;

private:
    std::chrono::seconds m_timeout;
};

} // namespace sorter
