#ifndef TIMESTAMP_HPP
#define TIMESTAMP_HPP

#include <optional>
#include <string>

#include "page_result.hpp"

namespace harvester {

// ISO 8601 UTC with microseconds, e.g. "2026-10-19T12:00:00.000000Z".
std::string format_timestamp(Timestamp ts);

// Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fraction (up to 9 digits)
// and an optional trailing 'Z'. A space is accepted in place of the 'T'.
std::optional<Timestamp> parse_timestamp(const std::string& text);

} // namespace harvester

#endif // TIMESTAMP_HPP
