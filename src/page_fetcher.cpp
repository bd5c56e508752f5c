#include "page_fetcher.hpp"

#include <exception>

#include "html_document.hpp"

namespace harvester {

FetchResult PageFetcher::fetch(const std::string& url) {
    FetchResult result;
    try {
        HttpResponse response = client.get(url);
        if (!response.success) {
            result.error = FetchError{url, response.error.empty() ? "request failed" : response.error};
            return result;
        }
        result.text = HtmlDocument(response.body).visible_text();
    } catch (const std::exception& e) {
        // e.g. std::bad_alloc on a huge body
        result.text.clear();
        result.error = FetchError{url, e.what()};
    }
    return result;
}

} // namespace harvester
