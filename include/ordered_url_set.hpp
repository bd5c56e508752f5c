#ifndef ORDERED_URL_SET_HPP
#define ORDERED_URL_SET_HPP

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace harvester {

// A thread-safe set of URLs that remembers insertion order.
// The first insertion of a URL fixes its position; later duplicates are
// ignored, so iteration order only depends on the order of inserts.
class OrderedUrlSet {
public:
    // Returns true if the URL was not present and has been appended.
    bool insert(const std::string& url) {
        std::lock_guard<std::mutex> lock(mut);
        if (!seen.insert(url).second) {
            return false;
        }
        order.push_back(url);
        return true;
    }

    // Copy of the URLs in insertion order.
    std::vector<std::string> items() const {
        std::lock_guard<std::mutex> lock(mut);
        return order;
    }

private:
    std::unordered_set<std::string> seen;
    std::vector<std::string> order;
    mutable std::mutex mut;
};

} // namespace harvester

#endif // ORDERED_URL_SET_HPP
