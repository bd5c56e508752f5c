#include "contact_report.hpp"

#include <unordered_set>

#include "timestamp.hpp"

namespace harvester {

ContactReport build_report(const std::vector<PageResult>& results) {
    ContactReport report;
    std::unordered_set<std::string> seen_emails;
    std::unordered_set<std::string> seen_phones;

    for (const PageResult& result : results) {
        if (!result.ok()) {
            continue;
        }
        ++report.summary.total_urls_scraped;

        for (const std::string& email : result.emails) {
            if (seen_emails.insert(email).second) {
                report.entries.push_back({ContactType::Email, email, result.url});
            }
        }
        for (const std::string& phone : result.phones) {
            if (seen_phones.insert(phone).second) {
                report.entries.push_back({ContactType::Phone, phone, result.url});
            }
        }
    }

    report.summary.total_emails = seen_emails.size();
    report.summary.total_phones = seen_phones.size();
    return report;
}

nlohmann::json report_to_json(const ContactReport& report) {
    nlohmann::json data = nlohmann::json::array();
    for (const ReportEntry& entry : report.entries) {
        data.push_back({{"type", contact_type_name(entry.type)},
                        {"value", entry.value},
                        {"source", entry.source}});
    }

    return {{"success", true},
            {"data", data},
            {"summary",
             {{"total_emails", report.summary.total_emails},
              {"total_phones", report.summary.total_phones},
              {"total_urls_scraped", report.summary.total_urls_scraped}}}};
}

nlohmann::json dataset_to_json(const Dataset& dataset) {
    nlohmann::json out = nlohmann::json::array();
    for (const ContactRecord& record : dataset) {
        out.push_back({{"timestamp", format_timestamp(record.timestamp)},
                       {"type", contact_type_name(record.type)},
                       {"value", record.value},
                       {"source_url", record.source_url}});
    }
    return out;
}

std::string to_json_text(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace harvester
