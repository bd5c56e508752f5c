#include "dataset_merger.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace harvester {

Dataset DatasetMerger::flatten(const std::vector<PageResult>& results) {
    Dataset records;
    for (const PageResult& result : results) {
        if (!result.ok()) {
            continue;
        }
        for (const std::string& email : result.emails) {
            records.push_back(ContactRecord{result.timestamp, ContactType::Email, email, result.url});
        }
        for (const std::string& phone : result.phones) {
            records.push_back(ContactRecord{result.timestamp, ContactType::Phone, phone, result.url});
        }
    }
    return records;
}

Dataset DatasetMerger::merge(const Dataset& existing, const Dataset& incoming) {
    Dataset merged;
    merged.reserve(existing.size() + incoming.size());
    std::set<std::pair<std::string, std::string>> keys;

    auto append_unique = [&](const Dataset& records) {
        for (const ContactRecord& record : records) {
            if (keys.emplace(record.value, record.source_url).second) {
                merged.push_back(record);
            }
        }
    };
    append_unique(existing);
    append_unique(incoming);

    std::stable_sort(merged.begin(), merged.end(),
                     [](const ContactRecord& a, const ContactRecord& b) {
                         return a.timestamp > b.timestamp;
                     });
    return merged;
}

void DatasetMerger::merge_and_persist(const std::vector<PageResult>& results) {
    std::lock_guard<std::mutex> lock(mut);
    try {
        Dataset incoming = flatten(results);
        if (incoming.empty()) {
            return;
        }

        Dataset existing = store.load().value_or(Dataset());
        size_t known = merge(existing, Dataset()).size();
        Dataset merged = merge(existing, incoming);
        if (merged.size() == known) {
            if (verbose) {
                std::cerr << "[dataset] no new records" << std::endl;
            }
            return;
        }

        store.save(merged);
        if (verbose) {
            std::ostringstream line;
            line << "[dataset] saved " << merged.size() << " records (" << merged.size() - known
                 << " new)\n";
            std::cerr << line.str() << std::flush;
        }
    } catch (const std::exception& e) {
        std::cerr << "[dataset] error saving dataset: " << e.what() << std::endl;
    }
}

std::optional<Dataset> DatasetMerger::snapshot() {
    std::lock_guard<std::mutex> lock(mut);
    return store.load();
}

} // namespace harvester
