#include "link_discoverer.hpp"

#include <exception>
#include <iostream>
#include <unordered_set>

#include "html_document.hpp"
#include "url.hpp"

namespace harvester {

std::vector<std::string> LinkDiscoverer::discover(const std::string& seed, size_t max_pages) {
    if (max_pages == 0) {
        return {};
    }
    std::vector<std::string> links{seed};
    if (max_pages == 1) {
        return links;
    }

    try {
        HttpResponse response = client.get(seed);
        if (!response.success) {
            std::cerr << "[discover] " << seed << ": " << response.error << std::endl;
            return links;
        }
        // Only HTML is searched for links. A missing header is treated as HTML.
        if (!response.content_type.empty() &&
            response.content_type.find("text/html") == std::string::npos) {
            std::cerr << "[discover] " << seed << ": skipping non-HTML content ("
                      << response.content_type << ")" << std::endl;
            return links;
        }

        const std::string seed_host = network_location(seed);
        std::unordered_set<std::string> seen{seed};

        HtmlDocument document(response.body);
        for (const std::string& href : document.link_targets()) {
            if (links.size() >= max_pages) {
                break;
            }
            std::string resolved = resolve_url(seed, href);
            if (resolved.empty() || network_location(resolved) != seed_host) {
                continue;
            }
            if (seen.insert(resolved).second) {
                links.push_back(resolved);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[discover] " << seed << ": " << e.what() << std::endl;
        links.resize(1);
    }
    return links;
}

} // namespace harvester
