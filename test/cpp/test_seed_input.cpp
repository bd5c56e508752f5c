#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "seed_input.hpp"

using namespace harvester;

void test_missing_scheme_defaults_to_https() {
    assert(normalize_seed("example.com") == "https://example.com");
    assert(normalize_seed("  example.com/contact \n") == "https://example.com/contact");
    assert(normalize_seed("http://example.com") == "http://example.com");
    assert(normalize_seed("HTTPS://Example.com") == "HTTPS://Example.com");
    std::cout << "✓ test_missing_scheme_defaults_to_https\n";
}

void test_blank_entries_dropped() {
    auto seeds = normalize_seeds({"", "   ", "example.com", "\t", "https://b.org"});
    assert(seeds.size() == 2);
    assert(seeds[0] == "https://example.com");
    assert(seeds[1] == "https://b.org");
    std::cout << "✓ test_blank_entries_dropped\n";
}

void test_unusable_entries_dropped() {
    auto seeds = normalize_seeds({"has space.com", "example.com"});
    assert(seeds.size() == 1);
    assert(seeds[0] == "https://example.com");
    std::cout << "✓ test_unusable_entries_dropped\n";
}

void test_invalid_input_rejected() {
    bool thrown = false;
    try {
        normalize_seeds({});
    } catch (const InvalidInputError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        normalize_seeds({" ", ""});
    } catch (const InvalidInputError& e) {
        thrown = std::string(e.what()) == "No valid URLs provided";
    }
    assert(thrown);
    std::cout << "✓ test_invalid_input_rejected\n";
}

int main() {
    std::cout << "Running seed_input tests...\n\n";

    test_missing_scheme_defaults_to_https();
    test_blank_entries_dropped();
    test_unusable_entries_dropped();
    test_invalid_input_rejected();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
