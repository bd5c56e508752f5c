#include "http_client.hpp"

#include <memory>
#include <utility>

#include <curl/curl.h>

namespace harvester {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

} // namespace

CurlHttpClient::CurlHttpClient(HttpOptions options) : options(std::move(options)) {}

HttpResponse CurlHttpClient::get(const std::string& url) {
    HttpResponse response;

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        response.error = "failed to initialize curl handle";
        return response;
    }

    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    // Timeouts keep one slow host from stalling the whole crawl.
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_seconds);
    // Worker threads must not receive SIGALRM from the resolver.
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        return response;
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = status_code;

    char* content_type = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
        content_type) {
        response.content_type = content_type;
    }

    if (status_code >= 200 && status_code < 300) {
        response.body = std::move(body);
        response.success = true;
    } else {
        response.error = "HTTP status " + std::to_string(status_code);
    }
    return response;
}

CurlGlobal::CurlGlobal() : initialized(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) {}

CurlGlobal::~CurlGlobal() {
    if (initialized) {
        curl_global_cleanup();
    }
}

} // namespace harvester
