#include <cassert>
#include <iostream>
#include <string>

#include "config.hpp"

using namespace harvester;

void test_defaults() {
    const char* argv[] = {"contact_harvester", "example.com"};
    Config config = parse_args(2, argv);
    assert(config.urls.size() == 1);
    assert(config.urls[0] == "example.com");
    assert(config.dataset_path == "scraped_data.csv");
    assert(config.max_pages == 10);
    assert(config.max_concurrency == 0);
    assert(config.http.timeout_seconds == 20);
    assert(config.interval_seconds == 0);
    assert(!config.export_dataset);
    std::cout << "✓ test_defaults\n";
}

void test_flags_with_separate_and_inline_values() {
    const char* argv[] = {"contact_harvester", "--dataset", "/tmp/out.csv", "--max-pages=5",
                          "a.com", "--max-concurrency", "4", "--timeout=15", "--quiet",
                          "--", "--not-a-flag.com"};
    Config config = parse_args(11, argv);
    assert(config.dataset_path == "/tmp/out.csv");
    assert(config.max_pages == 5);
    assert(config.max_concurrency == 4);
    assert(config.http.timeout_seconds == 15);
    assert(config.quiet);
    assert(config.urls.size() == 2);
    assert(config.urls[1] == "--not-a-flag.com");
    std::cout << "✓ test_flags_with_separate_and_inline_values\n";
}

bool rejects(int argc, const char* const argv[]) {
    try {
        parse_args(argc, argv);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void test_bad_values_rejected() {
    const char* unknown[] = {"p", "--verbose"};
    const char* missing[] = {"p", "--dataset"};
    const char* negative[] = {"p", "--max-pages", "-3"};
    const char* garbage[] = {"p", "--timeout=ten"};
    const char* zero_pages[] = {"p", "--max-pages=0"};
    const char* short_timeout[] = {"p", "--timeout", "10"};
    const char* long_timeout[] = {"p", "--timeout=30"};
    assert(rejects(2, unknown));
    assert(rejects(2, missing));
    assert(rejects(3, negative));
    assert(rejects(2, garbage));
    assert(rejects(2, zero_pages));
    assert(rejects(3, short_timeout));
    assert(rejects(2, long_timeout));
    std::cout << "✓ test_bad_values_rejected\n";
}

void test_usage_mentions_flags() {
    std::string text = usage("contact_harvester");
    assert(text.find("--dataset") != std::string::npos);
    assert(text.find("--export") != std::string::npos);
    std::cout << "✓ test_usage_mentions_flags\n";
}

int main() {
    std::cout << "Running config tests...\n\n";

    test_defaults();
    test_flags_with_separate_and_inline_values();
    test_bad_values_rejected();
    test_usage_mentions_flags();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
