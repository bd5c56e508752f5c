#ifndef BACKGROUND_PERSISTER_HPP
#define BACKGROUND_PERSISTER_HPP

#include <thread>
#include <vector>

#include "dataset_merger.hpp"
#include "page_result.hpp"
#include "thread_safe_queue.hpp"

namespace harvester {

// Runs dataset merges on a dedicated thread so callers can answer before
// the results are on disk. Jobs run one at a time in submission order.
// Errors end up in the log only.
class BackgroundPersister {
public:
    explicit BackgroundPersister(DatasetMerger& merger);
    ~BackgroundPersister();

    BackgroundPersister(const BackgroundPersister&) = delete;
    BackgroundPersister& operator=(const BackgroundPersister&) = delete;

    // Queues the results for merging and returns immediately.
    void submit(std::vector<PageResult> results);

    // Finishes every queued job, then stops the worker. Idempotent.
    // Jobs submitted afterwards are never run.
    void shutdown();

private:
    void run();

    DatasetMerger& merger;
    ThreadSafeQueue<std::vector<PageResult>> jobs;
    std::thread worker;
};

} // namespace harvester

#endif // BACKGROUND_PERSISTER_HPP
