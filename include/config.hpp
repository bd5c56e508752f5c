#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "link_discoverer.hpp"

namespace harvester {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::vector<std::string> urls;             // positional arguments
    std::string dataset_path = "scraped_data.csv";
    size_t max_pages = DEFAULT_MAX_PAGES;
    size_t max_concurrency = 0;                // 0 = one worker per page
    HttpOptions http;
    unsigned interval_seconds = 0;             // watch mode when > 0
    bool export_dataset = false;
    bool quiet = false;
    bool show_help = false;
};

// Parses "--name value" and "--name=value" flags; everything else is a URL.
// Throws ConfigError on unknown flags or bad values.
Config parse_args(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace harvester

#endif // CONFIG_HPP
