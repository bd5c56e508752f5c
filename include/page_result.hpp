#ifndef PAGE_RESULT_HPP
#define PAGE_RESULT_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>

namespace harvester {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Outcome of fetching and extracting one URL.
// When `error` is set both contact sets are empty.
struct PageResult {
    std::string url;
    std::set<std::string> emails;
    std::set<std::string> phones;
    Timestamp timestamp;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

enum class ContactType { Email, Phone };

const char* contact_type_name(ContactType type);
std::optional<ContactType> parse_contact_type(const std::string& name);

// One persisted contact fact. (value, source_url) is unique within a dataset.
struct ContactRecord {
    Timestamp timestamp;
    ContactType type = ContactType::Email;
    std::string value;
    std::string source_url;
};

bool operator==(const ContactRecord& a, const ContactRecord& b);

} // namespace harvester

#endif // PAGE_RESULT_HPP
