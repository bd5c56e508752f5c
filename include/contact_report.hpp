#ifndef CONTACT_REPORT_HPP
#define CONTACT_REPORT_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dataset_store.hpp"
#include "page_result.hpp"

namespace harvester {

struct ReportEntry {
    ContactType type;
    std::string value;
    std::string source;
};

struct ReportSummary {
    size_t total_emails = 0;
    size_t total_phones = 0;
    size_t total_urls_scraped = 0;  // results without an error
};

// What the caller gets back from one crawl: every distinct contact once,
// attributed to the first page (in result order) it was found on.
struct ContactReport {
    std::vector<ReportEntry> entries;
    ReportSummary summary;
};

ContactReport build_report(const std::vector<PageResult>& results);

// {"success": true, "data": [...], "summary": {...}}
nlohmann::json report_to_json(const ContactReport& report);

// Array of {"timestamp", "type", "value", "source_url"} objects.
nlohmann::json dataset_to_json(const Dataset& dataset);

// Serializes for output. Bytes that are not valid UTF-8 (URLs taken verbatim
// from the command line can carry them) become U+FFFD instead of throwing.
std::string to_json_text(const nlohmann::json& value, int indent = -1);

} // namespace harvester

#endif // CONTACT_REPORT_HPP
