#ifndef CONTACT_EXTRACTOR_HPP
#define CONTACT_EXTRACTOR_HPP

#include <set>
#include <string>

namespace harvester {

struct ExtractedContacts {
    std::set<std::string> emails;
    std::set<std::string> phones;
};

// Finds email- and phone-shaped substrings in visible page text.
// Emails are lower-cased; phones keep only digits and '+'.
// Input is expected to be free of markup, scripts and stylesheets.
ExtractedContacts extract_contacts(const std::string& text);

} // namespace harvester

#endif // CONTACT_EXTRACTOR_HPP
