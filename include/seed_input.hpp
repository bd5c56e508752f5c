#ifndef SEED_INPUT_HPP
#define SEED_INPUT_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace harvester {

// The caller supplied no usable URL. Raised before any network activity.
class InvalidInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Trims a raw URL and prefixes "https://" when it has no http(s) scheme.
// Returns an empty string for blank input or when the result is not a
// usable http(s) URL.
std::string normalize_seed(const std::string& raw);

// Normalizes every entry, dropping blank and unusable ones.
// Throws InvalidInputError when `raw` is empty or nothing survives.
std::vector<std::string> normalize_seeds(const std::vector<std::string>& raw);

} // namespace harvester

#endif // SEED_INPUT_HPP
