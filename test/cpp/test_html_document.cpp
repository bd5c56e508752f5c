#include <cassert>
#include <iostream>
#include <string>

#include "html_document.hpp"

using namespace harvester;

void test_visible_text_skips_scripts_and_styles() {
    HtmlDocument doc(R"(<html><head><title>Acme</title>
<style>.x { content: "hidden@style.com"; }</style>
<script>var email = "hidden@script.com";</script></head>
<body><p>Write to <b>hello@acme.com</b></p><noscript>nojs@acme.com</noscript></body></html>)");
    std::string text = doc.visible_text();
    assert(text.find("hello@acme.com") != std::string::npos);
    assert(text.find("Acme") != std::string::npos);
    assert(text.find("hidden@style.com") == std::string::npos);
    assert(text.find("hidden@script.com") == std::string::npos);
    assert(text.find("nojs@acme.com") == std::string::npos);
    std::cout << "✓ test_visible_text_skips_scripts_and_styles\n";
}

void test_adjacent_text_nodes_are_separated() {
    HtmlDocument doc("<div>555</div><div>1234567</div>");
    assert(doc.visible_text() == "555 1234567");
    std::cout << "✓ test_adjacent_text_nodes_are_separated\n";
}

void test_inline_markup_does_not_split_text() {
    HtmlDocument phone("<p>Call +1-555-<b>123-4567</b> today</p>");
    assert(phone.visible_text() == "Call +1-555-123-4567 today");

    HtmlDocument email("<p>Mail <span>sales</span>@acme.com</p>");
    assert(email.visible_text() == "Mail sales@acme.com");

    HtmlDocument blocks("<ul><li>555</li><li>1234567</li></ul>line<br>break\n\n  end");
    assert(blocks.visible_text() == "555 1234567 line break end");
    std::cout << "✓ test_inline_markup_does_not_split_text\n";
}

void test_link_targets_in_document_order() {
    HtmlDocument doc(R"(<a href="/one">1</a><div><a href="two.html">2</a></div>
<a name="anchor">no href</a><a href="">empty</a><a href="#top">top</a>)");
    auto links = doc.link_targets();
    assert(links.size() == 4);
    assert(links[0] == "/one");
    assert(links[1] == "two.html");
    assert(links[2].empty());
    assert(links[3] == "#top");
    std::cout << "✓ test_link_targets_in_document_order\n";
}

void test_malformed_markup() {
    HtmlDocument doc("<p>unclosed <a href='/x'>link <b>bold");
    assert(doc.link_targets().size() == 1);
    assert(doc.visible_text() == "unclosed link bold");
    HtmlDocument empty("");
    assert(empty.visible_text().empty());
    assert(empty.link_targets().empty());
    std::cout << "✓ test_malformed_markup\n";
}

int main() {
    std::cout << "Running html_document tests...\n\n";

    test_visible_text_skips_scripts_and_styles();
    test_adjacent_text_nodes_are_separated();
    test_inline_markup_does_not_split_text();
    test_link_targets_in_document_order();
    test_malformed_markup();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
