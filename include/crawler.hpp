#ifndef CRAWLER_HPP
#define CRAWLER_HPP

#include <string>
#include <vector>

#include "http_client.hpp"
#include "link_discoverer.hpp"
#include "page_fetcher.hpp"
#include "page_result.hpp"
#include "thread_safe_queue.hpp"

namespace harvester {

struct CrawlOptions {
    size_t max_pages = DEFAULT_MAX_PAGES;  // per seed, seed included
    size_t max_concurrency = 0;            // simultaneous fetches, 0 = one worker per URL
    bool verbose = true;
};

// Runs link discovery for every seed, then fetches and extracts contacts
// from each discovered page on a pool of worker threads.
class Crawler {
public:
    explicit Crawler(HttpClient& client, CrawlOptions options = CrawlOptions());

    // Seeds expanded by link discovery, deduplicated across seeds, in the
    // order they were first discovered.
    std::vector<std::string> discover_all(const std::vector<std::string>& seeds);

    // One PageResult per discovered URL, in discovery order. Blocks until
    // every page has been fetched or has failed; a failed page never
    // affects the others. Throws InvalidInputError for an empty seed list.
    std::vector<PageResult> crawl(const std::vector<std::string>& seeds);

    // Fetch and extract a single page.
    PageResult scrape_page(const std::string& url);

private:
    void worker_thread_function(int id, ThreadSafeQueue<size_t>& queue,
                                const std::vector<std::string>& urls,
                                std::vector<PageResult>& results);

    LinkDiscoverer discoverer;
    PageFetcher fetcher;
    CrawlOptions options;
};

} // namespace harvester

#endif // CRAWLER_HPP
