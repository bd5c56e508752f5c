#ifndef HTML_DOCUMENT_HPP
#define HTML_DOCUMENT_HPP

#include <string>
#include <vector>

#include <gumbo.h>

namespace harvester {

// Owns one gumbo parse tree.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    // Visible text: text outside <script>, <style>, <noscript> and
    // <template>. Block elements are separated by a space, inline markup
    // is transparent, and whitespace runs collapse to one space.
    std::string visible_text() const;

    // Raw href values of every <a> element, in document order.
    std::vector<std::string> link_targets() const;

private:
    GumboOutput* output;
};

} // namespace harvester

#endif // HTML_DOCUMENT_HPP
