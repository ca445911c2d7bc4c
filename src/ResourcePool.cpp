/**
 * @file ResourcePool.cpp
 * @brief Implementation of the resource pool manager.
 *
 * Acquisition is a bounded state machine: take a free record, else wait
 * for one, else grow the pool by one resource, else (if another caller won
 * the race to grow) wait once more before giving up.
 */

#include "ResourcePool.hpp"
#include <algorithm>

namespace respool {

namespace {

PoolConfig normalized(PoolConfig config) {
    config.normalize();
    return config;
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

ResourcePool::ResourcePool(PoolConfig config,
                           std::shared_ptr<ResourceBackend> backend,
                           std::shared_ptr<spdlog::logger> logger)
    : m_config(normalized(std::move(config))),
      m_backend(std::move(backend)),
      m_logger(logger ? std::move(logger) : spdlog::default_logger()),
      m_free(static_cast<size_t>(m_config.max_pool_size)) {

    if (!m_backend) {
        throw PoolException(PoolError::InvalidConfig, "no resource backend given");
    }

    // Initialize minimum resources
    try {
        for (int i = 0; i < m_config.min_pool_size; ++i) {
            auto record = createResource();
            if (record) {
                m_free.tryPush(std::move(record));
            }
        }
    } catch (const PoolException& e) {
        m_logger->error("Failed to create initial resources: {}", e.what());
        close();
        throw PoolException(PoolError::Construction,
                            std::string("failed to create initial resource: ") + e.what());
    }

    m_reaper = std::make_unique<IdleReaper>(
        m_config.cleanup_idle_interval, [this] { reapIdle(); }, m_logger);
    m_reaper->start();

    m_logger->info("Resource pool ({} backend) initialized with {} resources (min {}, max {})",
                   m_backend->name(), activeCount(),
                   m_config.min_pool_size, m_config.max_pool_size);
}

ResourcePool::~ResourcePool() {
    close();
}

// ============================================================================
// Resource Creation and Teardown
// ============================================================================

std::shared_ptr<ResourceRecord> ResourcePool::createResource() {
    std::lock_guard<std::mutex> createLock(m_createMutex);

    if (m_shutdown) {
        throw PoolException(PoolError::ShutdownInProgress, "pool is shutdown");
    }

    {
        std::shared_lock<std::shared_mutex> lock(m_poolMutex);
        if (m_records.size() >= static_cast<size_t>(m_config.max_pool_size)) {
            return nullptr;
        }
    }

    // Initialization may take a while; only growth is serialized meanwhile
    int id = m_nextId++;
    auto worker = std::make_unique<ResourceWorker>(id, m_backend, m_config, m_logger);
    worker->start();

    auto record = std::make_shared<ResourceRecord>(id, std::move(worker));
    size_t active = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_poolMutex);
        m_records.push_back(record);
        active = m_records.size();
    }

    m_logger->info("Created resource {}, total active: {}", id, active);
    return record;
}

void ResourcePool::closeResource(const std::shared_ptr<ResourceRecord>& record) {
    size_t remaining = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_poolMutex);
        m_records.erase(std::remove(m_records.begin(), m_records.end(), record),
                        m_records.end());
        remaining = m_records.size();
    }

    teardown(record);
    m_logger->info("Closed resource {}, remaining: {}", record->id(), remaining);
}

void ResourcePool::teardown(const std::shared_ptr<ResourceRecord>& record) {
    if (!record->shutdown(m_config.worker_close_timeout)) {
        m_logger->warn("Resource {} worker shutdown timeout ({}), abandoning it",
                       record->id(), ErrorHandler::errorName(PoolError::WorkerShutdownTimeout));
    }
}

bool ResourcePool::isTracked(int id) const {
    std::shared_lock<std::shared_mutex> lock(m_poolMutex);
    return std::any_of(m_records.begin(), m_records.end(),
                       [id](const auto& record) { return record->id() == id; });
}

// ============================================================================
// Acquisition and Release
// ============================================================================

std::shared_ptr<ResourceRecord> ResourcePool::checkout(std::shared_ptr<ResourceRecord> record) {
    record->markAcquired();
    m_logger->debug("Reusing resource {}", record->id());
    return record;
}

std::shared_ptr<ResourceRecord> ResourcePool::acquire() {
    if (m_shutdown) {
        throw PoolException(PoolError::ShutdownInProgress, "pool is shutdown");
    }

    // Free resource available right away
    if (auto record = m_free.tryPop()) {
        return checkout(std::move(record));
    }

    // Wait for a release
    std::shared_ptr<ResourceRecord> record;
    switch (m_free.popFor(m_config.wait_conn_timeout, record)) {
        case FreeRegistry::PopStatus::Acquired:
            return checkout(std::move(record));
        case FreeRegistry::PopStatus::Closed:
            throw PoolException(PoolError::ShutdownInProgress, "pool is shutdown");
        case FreeRegistry::PopStatus::TimedOut:
            break;
    }

    // Grow if below maximum
    if (activeCount() >= static_cast<size_t>(m_config.max_pool_size)) {
        throw PoolException(PoolError::AcquireTimeout, "timeout waiting for resource");
    }

    try {
        record = createResource();
    } catch (const PoolException& e) {
        if (e.code() == PoolError::ShutdownInProgress) {
            throw;
        }
        m_logger->warn("Failed to grow pool: {}", e.what());
        throw PoolException(e.code(), std::string("failed to create new resource: ") + e.what());
    }
    if (record) {
        return checkout(std::move(record));
    }

    // Another caller filled the last slot first; wait once more
    switch (m_free.popFor(m_config.wait_conn_timeout, record)) {
        case FreeRegistry::PopStatus::Acquired:
            return checkout(std::move(record));
        case FreeRegistry::PopStatus::Closed:
            throw PoolException(PoolError::ShutdownInProgress, "pool is shutdown");
        case FreeRegistry::PopStatus::TimedOut:
            break;
    }
    throw PoolException(PoolError::AcquireTimeout, "timeout waiting for resource");
}

void ResourcePool::release(const std::shared_ptr<ResourceRecord>& record) {
    if (!record) return;

    // A record that is not checked out is already queued or torn down
    if (!record->markReleased()) {
        m_logger->warn("Resource {} released while not checked out, ignoring", record->id());
        return;
    }

    // Closed pool or a record that is no longer part of it
    if (m_shutdown || !isTracked(record->id())) {
        teardown(record);
        return;
    }

    if (m_free.tryPush(record)) {
        m_logger->debug("Released resource {} back to pool", record->id());
        return;
    }

    // Registry closed by a concurrent close()
    m_logger->debug("Free registry full, closing resource {}", record->id());
    closeResource(record);
}

ResourceLease ResourcePool::lease() {
    return ResourceLease(this, acquire());
}

std::string ResourcePool::executeCommand(const std::string& operation,
                                         const std::string& params) {
    return execute([&](ResourceRecord& record) {
        m_logger->debug("Executing '{}' on resource {}", operation, record.id());
        return record.executeCommand(Command{operation, params}, m_config.submit_timeout);
    });
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

PoolStatus ResourcePool::status() const {
    PoolStatus status;
    {
        std::shared_lock<std::shared_mutex> lock(m_poolMutex);
        status.resources.reserve(m_records.size());
        for (const auto& record : m_records) {
            status.resources.push_back(ResourceStatus{
                record->id(),
                record->useCount(),
                record->lastUsedWallClock(),
                record->isBusy()
            });
        }
        status.activeCount = m_records.size();
    }
    status.availableCount = m_free.size();
    status.shutdown = m_shutdown;
    return status;
}

size_t ResourcePool::activeCount() const {
    std::shared_lock<std::shared_mutex> lock(m_poolMutex);
    return m_records.size();
}

size_t ResourcePool::availableCount() const {
    return m_free.size();
}

bool ResourcePool::healthCheck() const {
    return !m_shutdown && activeCount() > 0;
}

void ResourcePool::reapIdle() {
    if (m_shutdown) {
        return;
    }

    const size_t minSize = static_cast<size_t>(m_config.min_pool_size);
    const auto now = ResourceRecord::Clock::now();
    std::vector<std::shared_ptr<ResourceRecord>> reaped;

    {
        std::unique_lock<std::shared_mutex> lock(m_poolMutex);
        if (m_records.size() <= minSize) {
            return;
        }

        for (auto it = m_records.begin(); it != m_records.end() && m_records.size() > minSize;) {
            const auto& record = *it;
            // Only a record still sitting in the registry is safe to take;
            // one claimed by a concurrent acquire is left alone
            if (record->isIdleLongerThan(m_config.idle_timeout, now) &&
                m_free.tryRemove(record->id())) {
                reaped.push_back(record);
                it = m_records.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& record : reaped) {
        teardown(record);
        m_logger->info("Reaped idle resource {}", record->id());
    }
    if (!reaped.empty()) {
        m_logger->debug("Idle sweep removed {} resources, active: {}",
                        reaped.size(), activeCount());
    }
}

void ResourcePool::close() {
    std::call_once(m_closeOnce, [this] {
        m_logger->info("Closing resource pool");
        m_shutdown = true;

        // Wake waiting acquirers, then stop sweeping
        m_free.close();
        if (m_reaper) {
            m_reaper->stop();
        }

        std::vector<std::shared_ptr<ResourceRecord>> records;
        {
            // Wait out any creation in progress so its record is included
            std::lock_guard<std::mutex> createLock(m_createMutex);
            std::unique_lock<std::shared_mutex> lock(m_poolMutex);
            records.swap(m_records);
        }
        m_free.drain();

        for (const auto& record : records) {
            teardown(record);
        }

        m_logger->info("Resource pool closed, {} resources torn down", records.size());
    });
}

}  // namespace respool
