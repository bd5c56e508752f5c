#ifndef LINK_DISCOVERER_HPP
#define LINK_DISCOVERER_HPP

#include <string>
#include <vector>

#include "http_client.hpp"

namespace harvester {

const size_t DEFAULT_MAX_PAGES = 10;

// Expands a seed URL into the same-site pages linked from it.
class LinkDiscoverer {
public:
    explicit LinkDiscoverer(HttpClient& client) : client(client) {}

    // Returns the seed followed by the distinct same-host links found on it,
    // in document order, at most `max_pages` entries in total.
    // If the seed cannot be fetched, or is not HTML, the result is just
    // { seed }. A cap of 0 yields an empty list.
    std::vector<std::string> discover(const std::string& seed,
                                      size_t max_pages = DEFAULT_MAX_PAGES);

private:
    HttpClient& client;
};

} // namespace harvester

#endif // LINK_DISCOVERER_HPP
