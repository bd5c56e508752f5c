#include "seed_input.hpp"

#include <algorithm>
#include <cctype>

#include "url.hpp"

namespace harvester {

namespace {

bool starts_with_ci(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

std::string normalize_seed(const std::string& raw) {
    size_t first = raw.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = raw.find_last_not_of(" \t\r\n\f\v");
    std::string url = raw.substr(first, last - first + 1);

    if (!starts_with_ci(url, "http://") && !starts_with_ci(url, "https://")) {
        url = "https://" + url;
    }
    return is_http_url(url) ? url : "";
}

std::vector<std::string> normalize_seeds(const std::vector<std::string>& raw) {
    if (raw.empty()) {
        throw InvalidInputError("A list of URLs is required");
    }

    std::vector<std::string> seeds;
    for (const std::string& entry : raw) {
        std::string url = normalize_seed(entry);
        if (!url.empty()) {
            seeds.push_back(url);
        }
    }

    if (seeds.empty()) {
        throw InvalidInputError("No valid URLs provided");
    }
    return seeds;
}

} // namespace harvester
