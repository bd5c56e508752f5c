#include <chrono>
#include <csignal>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "background_persister.hpp"
#include "config.hpp"
#include "contact_report.hpp"
#include "crawler.hpp"
#include "dataset_merger.hpp"
#include "dataset_store.hpp"
#include "http_client.hpp"
#include "seed_input.hpp"

using namespace harvester;

namespace {

volatile std::sig_atomic_t stop_requested = 0;

void handle_stop_signal(int) {
    stop_requested = 1;
}

// --- Error responses share the shape of the JSON contract ---
void print_error(const std::string& message) {
    std::cout << to_json_text(nlohmann::json{{"error", message}}) << std::endl;
}

std::vector<std::string> read_urls_from_stdin() {
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(std::cin, line)) {
        urls.push_back(line);
    }
    return urls;
}

int export_dataset(DatasetMerger& merger) {
    try {
        auto dataset = merger.snapshot();
        if (!dataset) {
            print_error("No data file found");
            return 1;
        }
        std::cout << to_json_text(dataset_to_json(*dataset), 2) << std::endl;
        return 0;
    } catch (const PersistenceError& e) {
        std::cerr << "[dataset] " << e.what() << std::endl;
        print_error(e.what());
        return 1;
    }
}

// Sleeps in short steps so a signal ends watch mode promptly.
void wait_for_next_round(unsigned seconds) {
    for (unsigned i = 0; i < seconds * 10 && !stop_requested; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    CsvDatasetStore store(config.dataset_path);
    DatasetMerger merger(store, !config.quiet);

    if (config.export_dataset) {
        return export_dataset(merger);
    }

    // --- Validate input before touching the network ---
    std::vector<std::string> raw_urls =
        config.urls.empty() ? read_urls_from_stdin() : config.urls;
    std::vector<std::string> seeds;
    try {
        seeds = normalize_seeds(raw_urls);
    } catch (const InvalidInputError& e) {
        print_error(e.what());
        return 2;
    }

    // Needs to happen once, before any worker thread starts
    CurlGlobal curl;
    if (!curl.ok()) {
        std::cerr << "[crawler] curl_global_init failed" << std::endl;
        return 1;
    }

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    CurlHttpClient client(config.http);
    CrawlOptions options;
    options.max_pages = config.max_pages;
    options.max_concurrency = config.max_concurrency;
    options.verbose = !config.quiet;
    Crawler crawler(client, options);

    BackgroundPersister persister(merger);
    std::set<std::pair<ContactType, std::string>> seen;

    for (unsigned round = 1; !stop_requested; ++round) {
        if (!config.quiet) {
            std::cerr << "[crawler] round " << round << ": scraping " << seeds.size()
                      << " seed(s)" << std::endl;
        }

        std::vector<PageResult> results = crawler.crawl(seeds);
        ContactReport report = build_report(results);

        // Respond first; persistence happens on the background thread.
        std::cout << to_json_text(report_to_json(report)) << std::endl;
        persister.submit(std::move(results));

        size_t fresh = 0;
        for (const ReportEntry& entry : report.entries) {
            if (seen.emplace(entry.type, entry.value).second) {
                ++fresh;
            }
        }
        if (!config.quiet) {
            if (fresh > 0) {
                std::cerr << "[crawler] Found " << fresh << " new items." << std::endl;
            } else {
                std::cerr << "[crawler] No new data found." << std::endl;
            }
        }

        if (config.interval_seconds == 0) {
            break;
        }
        wait_for_next_round(config.interval_seconds);
    }

    persister.shutdown();
    return 0;
}
