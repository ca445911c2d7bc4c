#pragma once

/**
 * @file ResourceRecord.hpp
 * @brief Pool-visible bookkeeping for one live resource.
 */

#include "CommandResult.hpp"
#include "ErrorHandler.hpp"
#include "ResourceWorker.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <shared_mutex>
#include <string>
#include <type_traits>

namespace respool {

/**
 * @class ResourceRecord
 * @brief Identity, usage statistics and worker of one pooled resource.
 *
 * The busy flag, last-used stamps and use counter are guarded by a
 * reader/writer lock so status reporting can read them while the worker is
 * executing a command. The resource handle itself is never reachable from
 * here; all access goes through the worker's queue.
 */
class ResourceRecord {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Wrap a started worker.
     * @param id Unique, never reused identity assigned by the pool.
     * @param worker Worker whose resource is already initialized.
     */
    ResourceRecord(int id, std::unique_ptr<ResourceWorker> worker);

    // Non-copyable
    ResourceRecord(const ResourceRecord&) = delete;
    ResourceRecord& operator=(const ResourceRecord&) = delete;

    int id() const { return m_id; }

    bool isBusy() const;
    Clock::time_point lastUsed() const;
    std::chrono::system_clock::time_point lastUsedWallClock() const;
    int64_t useCount() const;

    /**
     * @brief Check whether the record has been idle (not busy) for longer
     *        than @p threshold as of @p now.
     */
    bool isIdleLongerThan(std::chrono::milliseconds threshold, Clock::time_point now) const;

    /**
     * @brief Mark checked out: busy, stamp last-used, bump the use counter.
     */
    void markAcquired();

    /**
     * @brief Mark checked in: not busy, stamp last-used.
     * @return false if the record was not checked out; nothing is changed then
     */
    bool markReleased();

    /**
     * @brief Run one command on the worker and wait for its result.
     * @param command Operation and parameters passed to the backend.
     * @param submitTimeout Maximum wait for space in the worker queue.
     * @return Result bytes.
     * @throws PoolException(Execution) with the backend's message,
     *         PoolException(ResultShape) if the result has no usable value,
     *         PoolException(WorkerUnavailable) if the command could not be
     *         queued or the worker shut down before running it.
     */
    std::string executeCommand(const Command& command, std::chrono::milliseconds submitTimeout);

    /**
     * @brief Run an arbitrary callable against the resource handle on the
     *        worker thread and wait for its result.
     *
     * Exceptions thrown by @p fn propagate unchanged.
     */
    template<typename Func>
    auto execute(Func&& fn, std::chrono::milliseconds submitTimeout)
        -> std::invoke_result_t<Func, ResourceHandle&> {
        auto future = m_worker->submit(std::forward<Func>(fn), submitTimeout);
        try {
            return future.get();
        } catch (const std::future_error&) {
            throw PoolException(PoolError::WorkerUnavailable,
                                fmt::format("resource {} shut down before the command ran", m_id));
        }
    }

    /**
     * @brief Stop the worker, waiting at most @p grace for it to exit.
     * @return false if the worker had to be abandoned.
     */
    bool shutdown(std::chrono::milliseconds grace);

    size_t queuedCount() const;

private:
    const int m_id;
    std::unique_ptr<ResourceWorker> m_worker;

    mutable std::shared_mutex m_mutex;   ///< Protects the fields below
    bool m_busy = false;
    Clock::time_point m_lastUsed;
    std::chrono::system_clock::time_point m_lastUsedWall;
    int64_t m_useCount = 0;
};

}  // namespace respool
