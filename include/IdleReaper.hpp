#pragma once

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace respool {

// Background thread invoking a sweep callback on a fixed interval
class IdleReaper {
public:
    IdleReaper(std::chrono::milliseconds interval,
               std::function<void()> sweep,
               std::shared_ptr<spdlog::logger> logger);
    ~IdleReaper();

    // Non-copyable
    IdleReaper(const IdleReaper&) = delete;
    IdleReaper& operator=(const IdleReaper&) = delete;

    void start();

    // Stop and join; a sweep in progress is allowed to finish
    void stop();

    bool isRunning() const;
    uint64_t sweepCount() const { return m_sweeps.load(); }

private:
    void run();

    std::chrono::milliseconds m_interval;
    std::function<void()> m_sweep;
    std::shared_ptr<spdlog::logger> m_logger;

    std::thread m_thread;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stop = false;
    std::atomic<uint64_t> m_sweeps{0};
};

}  // namespace respool
