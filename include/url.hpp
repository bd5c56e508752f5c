#ifndef URL_HPP
#define URL_HPP

#include <optional>
#include <string>

namespace harvester {

// The five RFC 3986 components of a URI reference.
// `has_authority`, `has_query` and `has_fragment` distinguish an empty
// component from a missing one ("http://h/?" vs "http://h/").
struct Url {
    std::string scheme;
    std::string authority;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_authority = false;
    bool has_query = false;
    bool has_fragment = false;
};

// Splits a URI reference into its components. Returns std::nullopt for
// strings that cannot be a reference at all (empty, or containing
// whitespace/control characters). Scheme and authority keep their case.
std::optional<Url> parse_url(const std::string& text);

// Reassembles a Url into its textual form.
std::string to_string(const Url& url);

// Resolves `href` against the absolute `base` (RFC 3986 section 5.2),
// removes dot segments and drops any fragment.
// Returns an empty string when the result is not an http(s) URL
// (mailto:, javascript:, tel:, unparsable input...).
std::string resolve_url(const std::string& base, const std::string& href);

// Lower-cased network location (host[:port]) of an absolute URL, or an
// empty string when it has none.
std::string network_location(const std::string& url);

// True for absolute http:// or https:// URLs with a non-empty host.
bool is_http_url(const std::string& url);

} // namespace harvester

#endif // URL_HPP
