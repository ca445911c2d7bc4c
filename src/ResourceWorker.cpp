/**
 * @file ResourceWorker.cpp
 * @brief Implementation of the per-resource worker thread.
 */

#include "ResourceWorker.hpp"
#include <fmt/format.h>

namespace respool {

// ============================================================================
// Construction and Destruction
// ============================================================================

ResourceWorker::ResourceWorker(int id,
                               std::shared_ptr<ResourceBackend> backend,
                               const PoolConfig& config,
                               std::shared_ptr<spdlog::logger> logger)
    : m_id(id),
      m_backend(std::move(backend)),
      m_config(config),
      m_logger(std::move(logger)),
      m_state(std::make_shared<State>()) {
    if (!m_logger) {
        m_logger = spdlog::default_logger();
    }
    m_state->capacity = m_config.command_queue_capacity;
}

ResourceWorker::~ResourceWorker() {
    stop(m_config.worker_close_timeout);
}

// ============================================================================
// Lifecycle
// ============================================================================

void ResourceWorker::start() {
    std::promise<void> ready;
    std::future<void> readyFuture = ready.get_future();
    std::promise<void> exited;
    m_exited = exited.get_future();

    m_thread = std::thread(&ResourceWorker::run, m_id, m_state, m_backend, m_config,
                           m_logger, std::move(ready), std::move(exited));

    try {
        readyFuture.get();
    } catch (const PoolException&) {
        // The thread has already given up; reap it before reporting
        m_thread.join();
        std::lock_guard<std::mutex> lock(m_stopMutex);
        m_stopped = true;
        throw;
    }
}

bool ResourceWorker::stop(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> stopLock(m_stopMutex);
    if (m_stopped) {
        return m_stoppedCleanly;
    }
    m_stopped = true;

    std::deque<Task> abandoned;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->quit = true;
        abandoned.swap(m_state->queue);
    }
    m_state->workAvailable.notify_all();
    m_state->spaceAvailable.notify_all();

    if (!abandoned.empty()) {
        m_logger->debug("Resource {} dropping {} queued commands on shutdown",
                        m_id, abandoned.size());
    }
    abandoned.clear();

    if (!m_thread.joinable()) {
        return m_stoppedCleanly;
    }

    if (m_exited.wait_for(grace) == std::future_status::ready) {
        m_thread.join();
    } else {
        m_thread.detach();
        m_stoppedCleanly = false;
    }
    return m_stoppedCleanly;
}

size_t ResourceWorker::queuedCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->queue.size();
}

bool ResourceWorker::isRunning() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->running && !m_state->quit;
}

// ============================================================================
// Task Submission
// ============================================================================

void ResourceWorker::enqueue(Task task, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_state->mutex);

    if (!m_state->running && !m_state->quit) {
        throw PoolException(PoolError::WorkerUnavailable,
                            fmt::format("resource {} is not running", m_id));
    }

    bool hasSpace = m_state->spaceAvailable.wait_for(lock, timeout, [this] {
        return m_state->quit || m_state->queue.size() < m_state->capacity;
    });

    if (m_state->quit || !m_state->running) {
        throw PoolException(PoolError::WorkerUnavailable,
                            fmt::format("resource {} is shutting down", m_id));
    }
    if (!hasSpace) {
        throw PoolException(PoolError::WorkerUnavailable,
                            fmt::format("command queue of resource {} is full", m_id));
    }

    m_state->queue.push_back(std::move(task));
    lock.unlock();
    m_state->workAvailable.notify_one();
}

// ============================================================================
// Worker Thread
// ============================================================================

void ResourceWorker::run(int id,
                         std::shared_ptr<State> state,
                         std::shared_ptr<ResourceBackend> backend,
                         PoolConfig config,
                         std::shared_ptr<spdlog::logger> logger,
                         std::promise<void> ready,
                         std::promise<void> exited) {
    logger->debug("Initializing resource {} ({} backend)", id, backend->name());

    std::unique_ptr<ResourceHandle> handle;
    try {
        handle = backend->initialize(config);
        if (!handle) {
            throw PoolException(PoolError::Initialization,
                                fmt::format("backend returned no handle for resource {}", id));
        }
    } catch (const PoolException&) {
        ready.set_exception(std::current_exception());
        exited.set_value();
        return;
    } catch (const std::exception& e) {
        ready.set_exception(std::make_exception_ptr(PoolException(
            PoolError::Initialization,
            fmt::format("failed to initialize resource {}: {}", id, e.what()))));
        exited.set_value();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->running = true;
    }
    ready.set_value();

    // Process incoming tasks
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->workAvailable.wait(lock, [&state] {
                return state->quit || !state->queue.empty();
            });
            if (state->quit) {
                break;
            }
            task = std::move(state->queue.front());
            state->queue.pop_front();
        }
        state->spaceAvailable.notify_one();

        task(*handle);
    }

    logger->debug("Resource {} worker shutting down", id);

    std::deque<Task> abandoned;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        abandoned.swap(state->queue);
        state->running = false;
    }
    abandoned.clear();

    try {
        handle->release();
    } catch (const std::exception& e) {
        logger->warn("Resource {} release failed: {}", id, e.what());
    }
    handle.reset();

    exited.set_value();
}

}  // namespace respool
