#include "config.hpp"

#include <exception>
#include <sstream>

namespace harvester {

namespace {

unsigned long parse_number(const std::string& flag, const std::string& value,
                           unsigned long min, unsigned long max) {
    size_t used = 0;
    unsigned long n = 0;
    try {
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument(value);
        }
        n = std::stoul(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || n < min || n > max) {
        throw ConfigError(flag + " must be between " + std::to_string(min) + " and " +
                          std::to_string(max));
    }
    return n;
}

} // namespace

Config parse_args(int argc, const char* const argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.compare(0, 2, "--") != 0 || arg == "--") {
            if (arg != "--") {
                config.urls.push_back(arg);
            } else {
                for (++i; i < argc; ++i) {
                    config.urls.push_back(argv[i]);
                }
            }
            continue;
        }

        std::string name = arg;
        std::string value;
        bool has_value = false;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            has_value = true;
        }

        auto take_value = [&]() -> std::string {
            if (has_value) {
                return value;
            }
            if (i + 1 >= argc) {
                throw ConfigError(name + " requires a value");
            }
            return argv[++i];
        };

        if (name == "--help") {
            config.show_help = true;
        } else if (name == "--export") {
            config.export_dataset = true;
        } else if (name == "--quiet") {
            config.quiet = true;
        } else if (name == "--dataset") {
            config.dataset_path = take_value();
            if (config.dataset_path.empty()) {
                throw ConfigError("--dataset must not be empty");
            }
        } else if (name == "--max-pages") {
            config.max_pages = parse_number(name, take_value(), 1, 1000);
        } else if (name == "--max-concurrency") {
            config.max_concurrency = parse_number(name, take_value(), 0, 1000);
        } else if (name == "--timeout") {
            config.http.timeout_seconds = static_cast<long>(parse_number(name, take_value(), 15, 20));
        } else if (name == "--user-agent") {
            config.http.user_agent = take_value();
        } else if (name == "--interval") {
            config.interval_seconds = static_cast<unsigned>(parse_number(name, take_value(), 0, 86400));
        } else {
            throw ConfigError("unknown option " + name);
        }
    }

    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options] <url>...\n"
        << "Extracts email addresses and phone numbers from the given sites and\n"
        << "their same-site links. URLs are read from stdin, one per line, when\n"
        << "none are given.\n\n"
        << "Options:\n"
        << "  --dataset PATH          persisted CSV dataset (default scraped_data.csv)\n"
        << "  --max-pages N           pages per seed, seed included (default 10)\n"
        << "  --max-concurrency N     simultaneous fetches, 0 = unbounded (default 0)\n"
        << "  --timeout SECONDS       per-request timeout, 15 to 20 (default 20)\n"
        << "  --user-agent STRING     User-Agent header\n"
        << "  --interval SECONDS      repeat the crawl every SECONDS until interrupted\n"
        << "  --export                print the persisted dataset as JSON and exit\n"
        << "  --quiet                 only log errors\n"
        << "  --help                  show this text\n";
    return out.str();
}

} // namespace harvester
