#include "http_client.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace sorter {

namespace {

size_t collect_body(char* data, size_t size, size_t count, void* user)
{
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * count);
    return size * count;
}

void global_init_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw http_error("curl_global_init failed");
        }
    });
}

struct curl_deleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct slist_deleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

curl_http_client::curl_http_client(std::chrono::seconds timeout)
    : m_timeout(timeout)
{
    global_init_once();
}

http_response curl_http_client::send(const http_request& request)
{
    std::unique_ptr<CURL, curl_deleter> handle(curl_easy_init());
    if (!handle) {
        throw http_error("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, slist_deleter> headers;
    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
        if (!appended) {
            throw http_error("curl_slist_append failed");
        }
        headers.release();
        headers.reset(appended);
    }

    http_response response;
    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        throw http_error(request.method + " " + request.url + " failed: " + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::trace("{} {} -> {} ({} bytes)", request.method, request.url, response.status, response.body.size());
    return response;
}

} // namespace sorter
