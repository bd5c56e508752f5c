#include "html_document.hpp"

namespace harvester {

namespace {

bool is_hidden_element(GumboTag tag) {
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT ||
           tag == GUMBO_TAG_TEMPLATE;
}

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

// Elements that start a new line when rendered. Text on either side of them
// is kept apart; inline elements such as <b> or <span> do not split text.
bool is_block_element(GumboTag tag) {
    switch (tag) {
    case GUMBO_TAG_ADDRESS:
    case GUMBO_TAG_ARTICLE:
    case GUMBO_TAG_ASIDE:
    case GUMBO_TAG_BLOCKQUOTE:
    case GUMBO_TAG_BODY:
    case GUMBO_TAG_BR:
    case GUMBO_TAG_DD:
    case GUMBO_TAG_DIV:
    case GUMBO_TAG_DL:
    case GUMBO_TAG_DT:
    case GUMBO_TAG_FIELDSET:
    case GUMBO_TAG_FIGCAPTION:
    case GUMBO_TAG_FIGURE:
    case GUMBO_TAG_FOOTER:
    case GUMBO_TAG_FORM:
    case GUMBO_TAG_H1:
    case GUMBO_TAG_H2:
    case GUMBO_TAG_H3:
    case GUMBO_TAG_H4:
    case GUMBO_TAG_H5:
    case GUMBO_TAG_H6:
    case GUMBO_TAG_HEAD:
    case GUMBO_TAG_HEADER:
    case GUMBO_TAG_HR:
    case GUMBO_TAG_LI:
    case GUMBO_TAG_MAIN:
    case GUMBO_TAG_NAV:
    case GUMBO_TAG_OL:
    case GUMBO_TAG_OPTION:
    case GUMBO_TAG_P:
    case GUMBO_TAG_PRE:
    case GUMBO_TAG_SECTION:
    case GUMBO_TAG_TABLE:
    case GUMBO_TAG_TD:
    case GUMBO_TAG_TEXTAREA:
    case GUMBO_TAG_TH:
    case GUMBO_TAG_TITLE:
    case GUMBO_TAG_TR:
    case GUMBO_TAG_UL:
        return true;
    default:
        return false;
    }
}

void append_separator(std::string& out) {
    if (!out.empty() && !is_whitespace(out.back())) {
        out.push_back(' ');
    }
}

void collect_text(const GumboNode* node, std::string& out) {
    switch (node->type) {
    case GUMBO_NODE_TEXT:
    case GUMBO_NODE_CDATA:
    case GUMBO_NODE_WHITESPACE:
        out.append(node->v.text.text);
        return;
    case GUMBO_NODE_ELEMENT:
    case GUMBO_NODE_TEMPLATE:
        if (is_hidden_element(node->v.element.tag)) {
            return;
        }
        break;
    case GUMBO_NODE_DOCUMENT:
        for (unsigned int i = 0; i < node->v.document.children.length; ++i) {
            collect_text(static_cast<const GumboNode*>(node->v.document.children.data[i]), out);
        }
        return;
    default:
        // comments
        return;
    }

    const bool block = is_block_element(node->v.element.tag);
    if (block) {
        append_separator(out);
    }
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
    if (block) {
        append_separator(out);
    }
}

// Collapses every whitespace run to one space and trims both ends.
std::string collapse_whitespace(const std::string& raw) {
    std::string text;
    text.reserve(raw.size());
    bool pending_space = false;
    for (char c : raw) {
        if (is_whitespace(c)) {
            pending_space = !text.empty();
        } else {
            if (pending_space) {
                text.push_back(' ');
                pending_space = false;
            }
            text.push_back(c);
        }
    }
    return text;
}

void collect_links(const GumboNode* node, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT) {
        return;
    }

    if (node->v.element.tag == GUMBO_TAG_A) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href && href->value) {
            links.emplace_back(href->value);
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<const GumboNode*>(children->data[i]), links);
    }
}

} // namespace

HtmlDocument::HtmlDocument(const std::string& html)
    : output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {}

HtmlDocument::~HtmlDocument() {
    if (output) {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
}

std::string HtmlDocument::visible_text() const {
    std::string raw;
    if (output && output->document) {
        collect_text(output->document, raw);
    }
    return collapse_whitespace(raw);
}

std::vector<std::string> HtmlDocument::link_targets() const {
    std::vector<std::string> links;
    if (output && output->root) {
        collect_links(output->root, links);
    }
    return links;
}

} // namespace harvester
