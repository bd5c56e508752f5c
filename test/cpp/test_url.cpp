#include <cassert>
#include <iostream>
#include <string>

#include "url.hpp"

using namespace harvester;

const std::string BASE = "https://example.com/a/b/page.html?x=1";

void test_parse_components() {
    auto url = parse_url("https://User@Example.com:8443/p/q?k=v#frag");
    assert(url);
    assert(url->scheme == "https");
    assert(url->authority == "User@Example.com:8443");
    assert(url->path == "/p/q");
    assert(url->query == "k=v");
    assert(url->fragment == "frag");
    assert(to_string(*url) == "https://User@Example.com:8443/p/q?k=v#frag");
    assert(!parse_url(""));
    assert(!parse_url("has space"));
    std::cout << "✓ test_parse_components\n";
}

void test_resolve_relative_paths() {
    assert(resolve_url(BASE, "other.html") == "https://example.com/a/b/other.html");
    assert(resolve_url(BASE, "../up.html") == "https://example.com/a/up.html");
    assert(resolve_url(BASE, "./here/") == "https://example.com/a/b/here/");
    assert(resolve_url(BASE, "../../../../top") == "https://example.com/top");
    assert(resolve_url(BASE, "/root") == "https://example.com/root");
    assert(resolve_url("https://example.com", "contact") == "https://example.com/contact");
    std::cout << "✓ test_resolve_relative_paths\n";
}

void test_resolve_query_and_fragment() {
    assert(resolve_url(BASE, "?y=2") == "https://example.com/a/b/page.html?y=2");
    assert(resolve_url(BASE, "#team") == "https://example.com/a/b/page.html?x=1");
    assert(resolve_url(BASE, "") == "https://example.com/a/b/page.html?x=1");
    assert(resolve_url(BASE, "/about#us") == "https://example.com/about");
    std::cout << "✓ test_resolve_query_and_fragment\n";
}

void test_resolve_absolute_and_protocol_relative() {
    assert(resolve_url(BASE, "//cdn.example.com/x") == "https://cdn.example.com/x");
    assert(resolve_url("http://example.com/", "//example.com/y") == "http://example.com/y");
    assert(resolve_url(BASE, "HTTP://Other.org/a/./b/../c") == "http://Other.org/a/c");
    assert(resolve_url(BASE, "  /padded  ") == "https://example.com/padded");
    std::cout << "✓ test_resolve_absolute_and_protocol_relative\n";
}

void test_non_http_targets_dropped() {
    assert(resolve_url(BASE, "mailto:info@example.com").empty());
    assert(resolve_url(BASE, "javascript:void(0)").empty());
    assert(resolve_url(BASE, "tel:+15551234567").empty());
    assert(resolve_url("not a url", "/x").empty());
    std::cout << "✓ test_non_http_targets_dropped\n";
}

void test_network_location() {
    assert(network_location("https://Example.COM:8080/x") == "example.com:8080");
    assert(network_location("https://example.com") == "example.com");
    assert(network_location("/relative").empty());
    assert(is_http_url("http://a.b"));
    assert(!is_http_url("ftp://a.b"));
    assert(!is_http_url("https://"));
    std::cout << "✓ test_network_location\n";
}

int main() {
    std::cout << "Running url tests...\n\n";

    test_parse_components();
    test_resolve_relative_paths();
    test_resolve_query_and_fragment();
    test_resolve_absolute_and_protocol_relative();
    test_non_http_targets_dropped();
    test_network_location();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
