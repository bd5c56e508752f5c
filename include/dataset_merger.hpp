#ifndef DATASET_MERGER_HPP
#define DATASET_MERGER_HPP

#include <mutex>
#include <optional>
#include <vector>

#include "dataset_store.hpp"
#include "page_result.hpp"

namespace harvester {

// Sole owner of the persisted dataset. Every read and every
// read-modify-write cycle holds the same mutex, so a reader never sees a
// partially merged dataset.
class DatasetMerger {
public:
    explicit DatasetMerger(DatasetStore& store, bool verbose = true)
        : store(store), verbose(verbose) {}

    // Adds the contacts of the successful results to the stored dataset.
    // Records already stored for the same (value, source URL) are kept
    // unchanged. Failures are logged and swallowed.
    void merge_and_persist(const std::vector<PageResult>& results);

    // Current dataset, or std::nullopt if none has been stored yet.
    // Throws PersistenceError when the store cannot be read.
    std::optional<Dataset> snapshot();

    // One record per email and phone of each successful result.
    static Dataset flatten(const std::vector<PageResult>& results);

    // existing + incoming, first occurrence per (value, source URL) kept,
    // stably sorted newest first.
    static Dataset merge(const Dataset& existing, const Dataset& incoming);

private:
    DatasetStore& store;
    bool verbose;
    std::mutex mut;
};

} // namespace harvester

#endif // DATASET_MERGER_HPP
