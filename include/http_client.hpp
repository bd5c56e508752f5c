#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>

namespace harvester {

struct HttpResponse {
    long status_code = 0;      // 0 when no response was received
    std::string body;
    std::string content_type;  // empty when the server sent none
    std::string error;         // transport or HTTP failure description
    bool success = false;      // transfer completed with a 2xx status
};

// Seam between the crawl pipeline and the network.
// Implementations must be safe to call from several threads at once and
// must report failures through HttpResponse instead of throwing.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

struct HttpOptions {
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
    long timeout_seconds = 20;
    long connect_timeout_seconds = 10;
    long max_redirects = 10;
};

// libcurl easy-interface client. Every request uses its own easy handle,
// so one instance can serve all worker threads.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpOptions options = HttpOptions());
    HttpResponse get(const std::string& url) override;

private:
    HttpOptions options;
};

// Calls curl_global_init / curl_global_cleanup. Create exactly one, in
// main(), before any worker thread starts.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return initialized; }

private:
    bool initialized;
};

} // namespace harvester

#endif // HTTP_CLIENT_HPP
