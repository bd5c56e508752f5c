#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace harvester {

// A blocking multi-producer/multi-consumer queue.
// Used to hand URL indices to fetch workers and persistence jobs to the
// background persister.
template <typename T>
class ThreadSafeQueue {
public:
    // Adds an item to the back of the queue and wakes one waiting consumer.
    // Items pushed after request_stop() are still delivered.
    void push(T item) {
        std::lock_guard<std::mutex> lock(mut);
        items.push(std::move(item));
        cond.notify_one();
    }

    // Removes and returns the front item, waiting while the queue is empty.
    // Returns std::nullopt once a stop was requested and nothing is left,
    // so consumers drain everything queued before stopping.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mut);
        cond.wait(lock, [this] { return !items.empty() || stop_requested; });

        if (items.empty()) {
            return std::nullopt;
        }

        T item = std::move(items.front());
        items.pop();
        return item;
    }

    // Wakes up every waiting consumer; pop() returns nullopt once drained.
    void request_stop() {
        std::lock_guard<std::mutex> lock(mut);
        stop_requested = true;
        cond.notify_all();
    }

private:
    std::queue<T> items;
    std::mutex mut;
    std::condition_variable cond;
    bool stop_requested = false;
};

} // namespace harvester

#endif // THREAD_SAFE_QUEUE_HPP
