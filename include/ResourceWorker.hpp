#pragma once

/**
 * @file ResourceWorker.hpp
 * @brief Dedicated thread owning exactly one backend resource.
 *
 * A backend resource may only be driven from the thread that created it.
 * ResourceWorker spawns that thread, initializes the resource on it and then
 * runs queued tasks against the resource one at a time until stopped.
 */

#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "ResourceBackend.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace respool {

/**
 * @class ResourceWorker
 * @brief Serializes all work against one ResourceHandle on one thread.
 *
 * The handle never leaves the worker thread; other threads interact with it
 * only by submitting tasks, which run strictly in submission order with at
 * most one task in flight.
 *
 * Shutdown:
 * - stop() signals the thread, which finishes the task it is running (if
 *   any), releases the handle and exits.
 * - Tasks still queued when stop() is called never run. Their futures
 *   report std::future_error (broken_promise), which ResourceRecord turns
 *   into PoolException(WorkerUnavailable), so no waiter is left hanging.
 * - If the thread does not exit within the grace period it is detached and
 *   abandoned; it cannot be cancelled while the backend holds control.
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 */
class ResourceWorker {
public:
    using Task = std::packaged_task<void(ResourceHandle&)>;

    /**
     * @brief Prepare a worker; no thread is started until start().
     * @param id Identity of the resource this worker will own.
     * @param backend Factory used on the worker thread to create the resource.
     * @param config Pool configuration (queue capacity, backend parameters).
     * @param logger Logger shared with the owning pool.
     */
    ResourceWorker(int id,
                   std::shared_ptr<ResourceBackend> backend,
                   const PoolConfig& config,
                   std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Destructor - stops the worker using the configured grace period.
     */
    ~ResourceWorker();

    // Non-copyable, non-movable
    ResourceWorker(const ResourceWorker&) = delete;
    ResourceWorker& operator=(const ResourceWorker&) = delete;

    /**
     * @brief Start the worker thread and wait until the resource is ready.
     * @throws PoolException(Initialization) (or the backend's own
     *         PoolException) if the backend failed to initialize; the
     *         thread has exited by then.
     */
    void start();

    /**
     * @brief Queue a callable to run against the resource.
     * @param fn Callable taking ResourceHandle&.
     * @param timeout Maximum time to wait for space in a full queue.
     * @return Future for the callable's result; exceptions thrown by the
     *         callable are rethrown by future.get().
     * @throws PoolException(WorkerUnavailable) if the worker is not running,
     *         is shutting down, or the queue stayed full for @p timeout.
     */
    template<typename Func>
    auto submit(Func&& fn, std::chrono::milliseconds timeout)
        -> std::future<std::invoke_result_t<Func, ResourceHandle&>> {
        using R = std::invoke_result_t<Func, ResourceHandle&>;

        auto task = std::make_shared<std::packaged_task<R(ResourceHandle&)>>(
            std::forward<Func>(fn));
        auto future = task->get_future();
        enqueue(Task([task](ResourceHandle& handle) { (*task)(handle); }), timeout);
        return future;
    }

    /**
     * @brief Signal shutdown and wait for the thread to exit.
     * @param grace Maximum time to wait for the thread.
     * @return true if the thread exited in time (or never ran), false if it
     *         was abandoned. Repeated calls return the first outcome.
     */
    bool stop(std::chrono::milliseconds grace);

    int id() const { return m_id; }

    /**
     * @brief Number of tasks waiting in the queue (excluding a running one).
     */
    size_t queuedCount() const;

    /**
     * @brief True between successful initialization and shutdown.
     */
    bool isRunning() const;

private:
    // Shared with the worker thread so it stays valid if the thread is abandoned
    struct State {
        mutable std::mutex mutex;
        std::condition_variable workAvailable;
        std::condition_variable spaceAvailable;
        std::deque<Task> queue;
        size_t capacity = 0;
        bool quit = false;
        bool running = false;
    };

    void enqueue(Task task, std::chrono::milliseconds timeout);

    static void run(int id,
                    std::shared_ptr<State> state,
                    std::shared_ptr<ResourceBackend> backend,
                    PoolConfig config,
                    std::shared_ptr<spdlog::logger> logger,
                    std::promise<void> ready,
                    std::promise<void> exited);

    int m_id;
    std::shared_ptr<ResourceBackend> m_backend;
    PoolConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<State> m_state;

    std::thread m_thread;
    std::future<void> m_exited;

    std::mutex m_stopMutex;   ///< Serializes stop() calls
    bool m_stopped = false;
    bool m_stoppedCleanly = true;
};

}  // namespace respool
