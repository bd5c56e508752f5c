#ifndef PAGE_FETCHER_HPP
#define PAGE_FETCHER_HPP

#include <optional>
#include <string>

#include "http_client.hpp"

namespace harvester {

struct FetchError {
    std::string url;
    std::string cause;
};

// Visible text of a page, or the reason it could not be fetched.
struct FetchResult {
    std::string text;
    std::optional<FetchError> error;

    bool ok() const { return !error.has_value(); }
};

// Downloads a page and reduces it to the text a reader would see.
// Never throws: every failure is reported as a FetchError.
class PageFetcher {
public:
    explicit PageFetcher(HttpClient& client) : client(client) {}

    FetchResult fetch(const std::string& url);

private:
    HttpClient& client;
};

} // namespace harvester

#endif // PAGE_FETCHER_HPP
