#include "url.hpp"

#include <algorithm>
#include <cctype>

namespace harvester {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// RFC 3986 section 5.2.4.
std::string remove_dot_segments(const std::string& path) {
    std::string input = path;
    std::string output;

    auto drop_last_segment = [&output]() {
        size_t slash = output.rfind('/');
        output.erase(slash == std::string::npos ? 0 : slash);
    };

    while (!input.empty()) {
        if (input.compare(0, 3, "../") == 0) {
            input.erase(0, 3);
        } else if (input.compare(0, 2, "./") == 0) {
            input.erase(0, 2);
        } else if (input.compare(0, 3, "/./") == 0) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (input.compare(0, 4, "/../") == 0) {
            input.replace(0, 4, "/");
            drop_last_segment();
        } else if (input == "/..") {
            input = "/";
            drop_last_segment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            // Move the first segment, with its leading '/', to the output.
            size_t next = input.find('/', input[0] == '/' ? 1 : 0);
            output += input.substr(0, next);
            input.erase(0, next);
        }
    }
    return output;
}

// RFC 3986 section 5.2.3.
std::string merge_paths(const Url& base, const std::string& ref_path) {
    if (base.has_authority && base.path.empty()) {
        return "/" + ref_path;
    }
    size_t slash = base.path.rfind('/');
    if (slash == std::string::npos) {
        return ref_path;
    }
    return base.path.substr(0, slash + 1) + ref_path;
}

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

} // namespace

std::optional<Url> parse_url(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    for (unsigned char c : text) {
        if (c <= 0x20 || c == 0x7f) {
            return std::nullopt;
        }
    }

    Url url;
    size_t pos = 0;

    // scheme ":" only counts if it appears before any of "/?#"
    if (std::isalpha(static_cast<unsigned char>(text[0]))) {
        size_t i = 1;
        while (i < text.size() && is_scheme_char(text[i])) {
            ++i;
        }
        if (i < text.size() && text[i] == ':') {
            url.scheme = text.substr(0, i);
            pos = i + 1;
        }
    }

    if (text.compare(pos, 2, "//") == 0) {
        size_t end = text.find_first_of("/?#", pos + 2);
        if (end == std::string::npos) {
            end = text.size();
        }
        url.authority = text.substr(pos + 2, end - pos - 2);
        url.has_authority = true;
        pos = end;
    }

    size_t path_end = text.find_first_of("?#", pos);
    if (path_end == std::string::npos) {
        path_end = text.size();
    }
    url.path = text.substr(pos, path_end - pos);
    pos = path_end;

    if (pos < text.size() && text[pos] == '?') {
        size_t query_end = text.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = text.size();
        }
        url.query = text.substr(pos + 1, query_end - pos - 1);
        url.has_query = true;
        pos = query_end;
    }

    if (pos < text.size() && text[pos] == '#') {
        url.fragment = text.substr(pos + 1);
        url.has_fragment = true;
    }

    return url;
}

std::string to_string(const Url& url) {
    std::string out;
    if (!url.scheme.empty()) {
        out += url.scheme + ":";
    }
    if (url.has_authority) {
        out += "//" + url.authority;
    }
    out += url.path;
    if (url.has_query) {
        out += "?" + url.query;
    }
    if (url.has_fragment) {
        out += "#" + url.fragment;
    }
    return out;
}

std::string resolve_url(const std::string& base, const std::string& href) {
    auto base_url = parse_url(base);
    if (!base_url || base_url->scheme.empty()) {
        return "";
    }

    // Attribute values often carry surrounding whitespace.
    size_t first = href.find_first_not_of(" \t\r\n\f");
    std::string trimmed;
    if (first != std::string::npos) {
        size_t last = href.find_last_not_of(" \t\r\n\f");
        trimmed = href.substr(first, last - first + 1);
    }

    Url target;
    if (trimmed.empty()) {
        // An empty reference is the base document itself.
        target = *base_url;
    } else {
        auto ref = parse_url(trimmed);
        if (!ref) {
            return "";
        }

        if (!ref->scheme.empty()) {
            target = *ref;
            target.path = remove_dot_segments(ref->path);
        } else if (ref->has_authority) {
            target = *ref;
            target.scheme = base_url->scheme;
            target.path = remove_dot_segments(ref->path);
        } else {
            target.scheme = base_url->scheme;
            target.authority = base_url->authority;
            target.has_authority = base_url->has_authority;
            if (ref->path.empty()) {
                target.path = base_url->path;
                target.query = ref->has_query ? ref->query : base_url->query;
                target.has_query = ref->has_query || base_url->has_query;
            } else {
                if (ref->path[0] == '/') {
                    target.path = remove_dot_segments(ref->path);
                } else {
                    target.path = remove_dot_segments(merge_paths(*base_url, ref->path));
                }
                target.query = ref->query;
                target.has_query = ref->has_query;
            }
        }
    }

    target.fragment.clear();
    target.has_fragment = false;
    target.scheme = to_lower(target.scheme);

    std::string resolved = to_string(target);
    return is_http_url(resolved) ? resolved : "";
}

std::string network_location(const std::string& url) {
    auto parsed = parse_url(url);
    if (!parsed || !parsed->has_authority) {
        return "";
    }
    return to_lower(parsed->authority);
}

bool is_http_url(const std::string& url) {
    auto parsed = parse_url(url);
    if (!parsed || !parsed->has_authority || parsed->authority.empty()) {
        return false;
    }
    std::string scheme = to_lower(parsed->scheme);
    return scheme == "http" || scheme == "https";
}

} // namespace harvester
