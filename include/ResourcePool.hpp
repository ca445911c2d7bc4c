#pragma once

/**
 * @file ResourcePool.hpp
 * @brief Bounded pool of single-thread-bound backend resources.
 *
 * Each pooled resource lives on its own worker thread for its whole
 * lifetime. The pool hands resources out to callers, grows on demand up to
 * a maximum, returns them for reuse, reaps idle ones down to a minimum and
 * tears everything down on close().
 */

#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "FreeRegistry.hpp"
#include "IdleReaper.hpp"
#include "ResourceBackend.hpp"
#include "ResourceLease.hpp"
#include "ResourceRecord.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace respool {

struct ResourceStatus {
    int id = 0;
    int64_t useCount = 0;
    std::chrono::system_clock::time_point lastUsed;
    bool busy = false;
};

struct PoolStatus {
    std::vector<ResourceStatus> resources;
    size_t activeCount = 0;
    size_t availableCount = 0;
    bool shutdown = false;
};

/**
 * @class ResourcePool
 * @brief Thread-safe pool manager; the only component callers talk to.
 *
 * Key features:
 * - Creates min_pool_size resources up front; construction fails (and
 *   unwinds what it built) if any of them cannot be initialized
 * - Acquire waits up to wait_conn_timeout for a free resource, then grows
 *   the pool by one if it is below max_pool_size
 * - Release returns the resource to the free registry, or tears it down if
 *   the registry is saturated
 * - An IdleReaper thread evicts resources idle longer than idle_timeout,
 *   never going below min_pool_size
 * - close() is idempotent and waits for each worker at most
 *   worker_close_timeout
 *
 * Invariants:
 * - activeCount() <= max_pool_size at all times
 * - A record is never in the free registry while marked busy
 * - Resource ids are unique and never reused for the pool's lifetime
 *
 * Locking: m_createMutex serializes growth; m_poolMutex guards the active
 * set. When both are needed m_createMutex is taken first, and m_poolMutex is
 * always taken before the registry's own lock.
 */
class ResourcePool {
public:
    /**
     * @brief Create a pool and populate it with the minimum number of resources.
     * @param config Pool configuration; normalized before use.
     * @param backend Factory for resources.
     * @param logger Logger for the pool and its workers (default logger if null).
     * @throws PoolException(Construction) if an initial resource could not be
     *         created; resources created before the failure are torn down.
     * @throws PoolException(InvalidConfig) if @p backend is null.
     */
    ResourcePool(PoolConfig config,
                 std::shared_ptr<ResourceBackend> backend,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Destructor - closes the pool.
     */
    ~ResourcePool();

    // Non-copyable, non-movable
    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    /**
     * @brief Check out a resource.
     * @return The record, marked busy. Must be handed back with release().
     * @throws PoolException(AcquireTimeout) if none became free in time and
     *         the pool is at maximum size.
     * @throws PoolException(ShutdownInProgress) if the pool is closing.
     * @throws PoolException(Initialization) if growing the pool failed.
     */
    std::shared_ptr<ResourceRecord> acquire();

    /**
     * @brief Check a resource back in.
     *
     * The record is queued for reuse, or torn down if the registry is full
     * or the pool is closing.
     */
    void release(const std::shared_ptr<ResourceRecord>& record);

    /**
     * @brief acquire() wrapped in a lease that releases on destruction.
     */
    ResourceLease lease();

    /**
     * @brief Run @p fn against a leased record; the record is released
     *        whether @p fn returns or throws.
     */
    template<typename Func>
    auto execute(Func&& fn) -> std::invoke_result_t<Func, ResourceRecord&> {
        ResourceLease held = lease();
        return std::forward<Func>(fn)(*held);
    }

    /**
     * @brief Acquire a resource, run one command on it and release it.
     * @param operation Backend operation name.
     * @param params Opaque parameter payload.
     * @return Result bytes.
     * @throws PoolException for acquisition, execution, result shape or
     *         worker availability failures.
     */
    std::string executeCommand(const std::string& operation, const std::string& params);

    /**
     * @brief Snapshot of all resources for observability.
     */
    PoolStatus status() const;

    size_t activeCount() const;
    size_t availableCount() const;
    size_t totalCount() const { return activeCount(); }

    /**
     * @brief True if the pool is open and holds at least one resource.
     */
    bool healthCheck() const;

    bool isShutdown() const { return m_shutdown.load(); }

    /**
     * @brief One idle sweep: evict resources idle longer than idle_timeout
     *        while the pool is above min_pool_size.
     *
     * Called periodically by the IdleReaper.
     */
    void reapIdle();

    /**
     * @brief Shut the pool down and tear down every resource.
     *
     * Safe to call repeatedly and concurrently; the shutdown runs once and
     * later callers wait for it to finish. Workers that do not exit within
     * worker_close_timeout are logged and abandoned.
     */
    void close();

    const PoolConfig& config() const { return m_config; }

private:
    // Create one resource if the pool is below max; nullptr if it is full
    std::shared_ptr<ResourceRecord> createResource();

    std::shared_ptr<ResourceRecord> checkout(std::shared_ptr<ResourceRecord> record);

    // Remove from the active set, then tear down
    void closeResource(const std::shared_ptr<ResourceRecord>& record);

    // Stop the worker, logging a shutdown timeout
    void teardown(const std::shared_ptr<ResourceRecord>& record);

    bool isTracked(int id) const;

    PoolConfig m_config;
    std::shared_ptr<ResourceBackend> m_backend;
    std::shared_ptr<spdlog::logger> m_logger;

    std::vector<std::shared_ptr<ResourceRecord>> m_records;   ///< Active set
    FreeRegistry m_free;                                      ///< Idle records
    int m_nextId = 0;                                         ///< Guarded by m_createMutex

    std::mutex m_createMutex;
    mutable std::shared_mutex m_poolMutex;   ///< Protects m_records

    std::atomic<bool> m_shutdown{false};
    std::once_flag m_closeOnce;

    std::unique_ptr<IdleReaper> m_reaper;
};

}  // namespace respool
