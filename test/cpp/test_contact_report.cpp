#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <utility>
#include <string>
#include <vector>

#include "contact_report.hpp"

using namespace harvester;

PageResult ok_page(const std::string& url, std::set<std::string> emails, std::set<std::string> phones) {
    PageResult r;
    r.url = url;
    r.emails = std::move(emails);
    r.phones = std::move(phones);
    r.timestamp = Clock::now();
    return r;
}

void test_values_deduplicated_across_pages() {
    PageResult failed;
    failed.url = "https://a.com/down";
    failed.error = "timeout";

    std::vector<PageResult> results = {
        ok_page("https://a.com", {"info@a.com"}, {"+15551234567"}),
        failed,
        ok_page("https://a.com/team", {"info@a.com", "jobs@a.com"}, {"+15551234567"}),
    };
    ContactReport report = build_report(results);

    assert(report.entries.size() == 3);
    assert(report.entries[0].type == ContactType::Email);
    assert(report.entries[0].value == "info@a.com");
    assert(report.entries[0].source == "https://a.com");
    assert(report.entries[1].type == ContactType::Phone);
    assert(report.entries[2].value == "jobs@a.com");
    assert(report.entries[2].source == "https://a.com/team");

    assert(report.summary.total_emails == 2);
    assert(report.summary.total_phones == 1);
    assert(report.summary.total_urls_scraped == 2);
    std::cout << "✓ test_values_deduplicated_across_pages\n";
}

void test_json_contract() {
    ContactReport report = build_report({ok_page("https://a.com", {"info@a.com"}, {})});
    nlohmann::json json = report_to_json(report);

    assert(json["success"] == true);
    assert(json["data"].size() == 1);
    assert(json["data"][0]["type"] == "Email");
    assert(json["data"][0]["value"] == "info@a.com");
    assert(json["data"][0]["source"] == "https://a.com");
    assert(json["summary"]["total_emails"] == 1);
    assert(json["summary"]["total_phones"] == 0);
    assert(json["summary"]["total_urls_scraped"] == 1);
    std::cout << "✓ test_json_contract\n";
}

void test_empty_crawl() {
    nlohmann::json json = report_to_json(build_report({}));
    assert(json["data"].is_array());
    assert(json["data"].empty());
    assert(json["summary"]["total_urls_scraped"] == 0);
    std::cout << "✓ test_empty_crawl\n";
}

void test_dataset_export_json() {
    Dataset dataset = {{Timestamp(std::chrono::seconds(0)), ContactType::Phone, "5551234567", "https://a.com"}};
    nlohmann::json json = dataset_to_json(dataset);
    assert(json.size() == 1);
    assert(json[0]["timestamp"] == "1970-01-01T00:00:00.000000Z");
    assert(json[0]["type"] == "Phone");
    assert(json[0]["source_url"] == "https://a.com");
    std::cout << "✓ test_dataset_export_json\n";
}

void test_invalid_utf8_source_is_replaced() {
    const std::string latin1_url = "https://example.com/caf\xe9";
    ContactReport report = build_report({ok_page(latin1_url, {"info@example.com"}, {})});

    std::string text = to_json_text(report_to_json(report));
    assert(text.find("https://example.com/caf\xEF\xBF\xBD") != std::string::npos);

    nlohmann::json round_trip = nlohmann::json::parse(text);
    assert(round_trip["data"][0]["value"] == "info@example.com");
    assert(to_json_text(dataset_to_json({}), 2) == "[]");
    std::cout << "✓ test_invalid_utf8_source_is_replaced\n";
}

int main() {
    std::cout << "Running contact_report tests...\n\n";

    test_values_deduplicated_across_pages();
    test_json_contract();
    test_empty_crawl();
    test_dataset_export_json();
    test_invalid_utf8_source_is_replaced();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
