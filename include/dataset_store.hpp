#ifndef DATASET_STORE_HPP
#define DATASET_STORE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "page_result.hpp"

namespace harvester {

using Dataset = std::vector<ContactRecord>;

// Reading, parsing or writing the persisted dataset failed.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Storage behind the dataset merger. Implementations do no locking of
// their own; DatasetMerger serializes every call.
class DatasetStore {
public:
    virtual ~DatasetStore() = default;

    // std::nullopt when nothing has been stored yet.
    // Throws PersistenceError when the stored data cannot be read.
    virtual std::optional<Dataset> load() = 0;

    // Replaces the stored dataset. Throws PersistenceError on failure.
    virtual void save(const Dataset& dataset) = 0;
};

// CSV file with the header "Timestamp,Type,Value,Source URL".
// save() writes a sibling temporary file and renames it over the target.
class CsvDatasetStore : public DatasetStore {
public:
    explicit CsvDatasetStore(std::string path) : path(std::move(path)) {}

    std::optional<Dataset> load() override;
    void save(const Dataset& dataset) override;

private:
    std::string path;
};

// Exposed for tests.
std::vector<std::string> parse_csv_line(const std::string& line);
std::string csv_escape(const std::string& field);

} // namespace harvester

#endif // DATASET_STORE_HPP
