#include "timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace harvester {

std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;

    auto since_epoch = duration_cast<microseconds>(ts.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    auto micros = since_epoch - secs;
    // Keep the fraction positive for instants before the epoch.
    if (micros.count() < 0) {
        secs -= seconds(1);
        micros += seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                  tm.tm_sec, static_cast<long long>(micros.count()));
    return buf;
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &sep,
                    &hour, &minute, &second, &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != ' ') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) {
            return std::nullopt;
        }
        for (int d = digits; d < 6; ++d) {
            micros *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);

    return Timestamp(std::chrono::seconds(t)) + std::chrono::microseconds(micros);
}

} // namespace harvester
