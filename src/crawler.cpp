#include "crawler.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include "contact_extractor.hpp"
#include "ordered_url_set.hpp"
#include "seed_input.hpp"

namespace harvester {

Crawler::Crawler(HttpClient& client, CrawlOptions options)
    : discoverer(client), fetcher(client), options(options) {}

std::vector<std::string> Crawler::discover_all(const std::vector<std::string>& seeds) {
    OrderedUrlSet urls;
    for (const std::string& seed : seeds) {
        std::vector<std::string> found = discoverer.discover(seed, options.max_pages);
        size_t added = 0;
        for (const std::string& url : found) {
            if (urls.insert(url)) {
                ++added;
            }
        }
        if (options.verbose) {
            std::cerr << "[crawler] " << seed << ": discovered " << found.size() << " pages, "
                      << added << " new" << std::endl;
        }
    }
    return urls.items();
}

PageResult Crawler::scrape_page(const std::string& url) {
    PageResult result;
    result.url = url;

    FetchResult page = fetcher.fetch(url);
    if (page.ok()) {
        ExtractedContacts contacts = extract_contacts(page.text);
        result.emails = std::move(contacts.emails);
        result.phones = std::move(contacts.phones);
    } else {
        result.error = page.error->cause;
    }
    result.timestamp = Clock::now();
    return result;
}

void Crawler::worker_thread_function(int id, ThreadSafeQueue<size_t>& queue,
                                     const std::vector<std::string>& urls,
                                     std::vector<PageResult>& results) {
    while (true) {
        std::optional<size_t> index = queue.pop();
        if (!index) {
            break;
        }

        // Each worker writes only the slot it popped, so no lock is needed.
        PageResult& result = results[*index];
        try {
            result = scrape_page(urls[*index]);
        } catch (const std::exception& e) {
            result = PageResult();
            result.url = urls[*index];
            result.timestamp = Clock::now();
            result.error = e.what();
        }

        // Workers log concurrently: each line goes to std::cerr in one write.
        std::ostringstream line;
        if (result.ok()) {
            if (!options.verbose) {
                continue;
            }
            line << "[crawler] worker [" << id << "] " << result.url << ": "
                 << result.emails.size() << " emails, " << result.phones.size() << " phones\n";
        } else {
            line << "[crawler] worker [" << id << "] failed " << result.url << ": "
                 << *result.error << "\n";
        }
        std::cerr << line.str() << std::flush;
    }
}

std::vector<PageResult> Crawler::crawl(const std::vector<std::string>& seeds) {
    if (seeds.empty()) {
        throw InvalidInputError("A list of URLs is required");
    }

    const std::vector<std::string> urls = discover_all(seeds);
    std::vector<PageResult> results(urls.size());

    ThreadSafeQueue<size_t> queue;
    for (size_t i = 0; i < urls.size(); ++i) {
        queue.push(i);
    }
    // Workers exit once the queue is drained.
    queue.request_stop();

    size_t worker_count = urls.size();
    if (options.max_concurrency > 0) {
        worker_count = std::min(worker_count, options.max_concurrency);
    }

    if (options.verbose) {
        std::cerr << "[crawler] fetching " << urls.size() << " pages with " << worker_count
                  << " workers" << std::endl;
    }

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        try {
            workers.emplace_back(&Crawler::worker_thread_function, this, static_cast<int>(i),
                                 std::ref(queue), std::cref(urls), std::ref(results));
        } catch (const std::system_error& e) {
            // Out of threads: the workers already running drain the queue.
            std::cerr << "[crawler] could only start " << workers.size()
                      << " workers: " << e.what() << std::endl;
            break;
        }
    }

    if (workers.empty()) {
        worker_thread_function(0, queue, urls, results);
    }

    for (std::thread& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    return results;
}

} // namespace harvester
