#include "contact_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace harvester {

namespace {

const size_t MIN_EMAIL_LENGTH = 6;
const size_t MIN_PHONE_DIGITS = 10;

// Repetitions are bounded: libstdc++ matches recursively, one frame per
// repeated character, so an unbounded run over a long token exhausts the stack.
// The limits are the RFC 5321 local part and domain lengths.
const std::regex& email_pattern() {
    static const std::regex re(
        R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& phone_pattern() {
    static const std::regex re(
        R"((\+\d{1,3}[-.\s]?)?\(?\d{1,4}\)?[-.\s]?\d{1,4}[-.\s]?\d{1,9})");
    return re;
}

std::string normalize_email(const std::string& match) {
    std::string email = match;
    std::transform(email.begin(), email.end(), email.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return email;
}

bool is_plausible_email(const std::string& email) {
    if (email.size() < MIN_EMAIL_LENGTH) {
        return false;
    }
    size_t at = email.find('@');
    return at != std::string::npos && email.find('.', at + 1) != std::string::npos;
}

} // namespace

ExtractedContacts extract_contacts(const std::string& text) {
    ExtractedContacts contacts;

    for (std::sregex_iterator it(text.begin(), text.end(), email_pattern()), end; it != end; ++it) {
        std::string email = normalize_email(it->str());
        if (is_plausible_email(email)) {
            contacts.emails.insert(email);
        }
    }

    for (std::sregex_iterator it(text.begin(), text.end(), phone_pattern()), end; it != end; ++it) {
        const std::string match = it->str();
        std::string phone;
        size_t digits = 0;
        for (char c : match) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                phone.push_back(c);
                ++digits;
            } else if (c == '+') {
                phone.push_back(c);
            }
        }
        if (digits >= MIN_PHONE_DIGITS) {
            contacts.phones.insert(phone);
        }
    }

    return contacts;
}

} // namespace harvester
