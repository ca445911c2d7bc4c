#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace respool {

class ResourceRecord;

// Bounded FIFO of idle resource records handed out to acquirers
class FreeRegistry {
public:
    enum class PopStatus {
        Acquired,
        TimedOut,
        Closed
    };

    explicit FreeRegistry(size_t capacity);

    // Non-copyable
    FreeRegistry(const FreeRegistry&) = delete;
    FreeRegistry& operator=(const FreeRegistry&) = delete;

    // Queue an idle record; false if the registry is full, closed, or
    // already holds a record with the same id
    bool tryPush(std::shared_ptr<ResourceRecord> record);

    // Take the oldest idle record without waiting; nullptr if none or closed
    std::shared_ptr<ResourceRecord> tryPop();

    // Wait up to timeout for an idle record. Returns Closed as soon as the
    // registry is closed, even if records remain queued.
    PopStatus popFor(std::chrono::milliseconds timeout, std::shared_ptr<ResourceRecord>& out);

    // Dequeue the record with this id if it is currently idle; other
    // records are left where they are
    bool tryRemove(int id);

    bool contains(int id) const;

    // Wake all waiters and refuse further pushes/pops
    void close();
    bool isClosed() const;

    // Remove and return everything still queued
    std::vector<std::shared_ptr<ResourceRecord>> drain();

    size_t size() const;
    size_t capacity() const { return m_capacity; }

private:
    const size_t m_capacity;
    std::deque<std::shared_ptr<ResourceRecord>> m_idle;
    bool m_closed = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;   ///< Signaled when a record is queued or on close
};

}  // namespace respool
