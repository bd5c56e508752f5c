#include "page_result.hpp"

namespace harvester {

const char* contact_type_name(ContactType type) {
    switch (type) {
    case ContactType::Email:
        return "Email";
    case ContactType::Phone:
        return "Phone";
    }
    return "Unknown";
}

std::optional<ContactType> parse_contact_type(const std::string& name) {
    if (name == "Email") {
        return ContactType::Email;
    }
    if (name == "Phone") {
        return ContactType::Phone;
    }
    return std::nullopt;
}

bool operator==(const ContactRecord& a, const ContactRecord& b) {
    return a.timestamp == b.timestamp && a.type == b.type && a.value == b.value &&
           a.source_url == b.source_url;
}

} // namespace harvester
