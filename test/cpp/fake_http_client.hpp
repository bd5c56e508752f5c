#ifndef FAKE_HTTP_CLIENT_HPP
#define FAKE_HTTP_CLIENT_HPP

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "http_client.hpp"

namespace harvester {

// Serves canned pages from memory. Unknown URLs fail the way an
// unreachable host would. Safe to share between worker threads.
class FakeHttpClient : public HttpClient {
public:
    void add_page(const std::string& url, const std::string& body,
                  const std::string& content_type = "text/html; charset=utf-8") {
        std::lock_guard<std::mutex> lock(mut);
        pages[url] = {body, content_type};
    }

    void add_status(const std::string& url, long status) {
        std::lock_guard<std::mutex> lock(mut);
        statuses[url] = status;
    }

    HttpResponse get(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mut);
        ++requests[url];

        HttpResponse response;
        auto status = statuses.find(url);
        if (status != statuses.end()) {
            response.status_code = status->second;
            response.error = "HTTP status " + std::to_string(status->second);
            return response;
        }
        auto page = pages.find(url);
        if (page == pages.end()) {
            response.error = "Couldn't connect to server";
            return response;
        }
        response.status_code = 200;
        response.body = page->second.first;
        response.content_type = page->second.second;
        response.success = true;
        return response;
    }

    int request_count(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mut);
        auto it = requests.find(url);
        return it == requests.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mut;
    std::map<std::string, std::pair<std::string, std::string>> pages;
    std::map<std::string, long> statuses;
    std::map<std::string, int> requests;
};

} // namespace harvester

#endif // FAKE_HTTP_CLIENT_HPP
