#include "background_persister.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace harvester {

BackgroundPersister::BackgroundPersister(DatasetMerger& merger)
    : merger(merger), worker(&BackgroundPersister::run, this) {}

BackgroundPersister::~BackgroundPersister() {
    shutdown();
}

void BackgroundPersister::submit(std::vector<PageResult> results) {
    jobs.push(std::move(results));
}

void BackgroundPersister::shutdown() {
    jobs.request_stop();
    if (worker.joinable()) {
        worker.join();
    }
}

void BackgroundPersister::run() {
    while (auto job = jobs.pop()) {
        try {
            merger.merge_and_persist(*job);
        } catch (const std::exception& e) {
            std::cerr << "[persist] job failed: " << e.what() << std::endl;
        }
    }
}

} // namespace harvester
