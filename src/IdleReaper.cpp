#include "IdleReaper.hpp"

namespace respool {

IdleReaper::IdleReaper(std::chrono::milliseconds interval,
                       std::function<void()> sweep,
                       std::shared_ptr<spdlog::logger> logger)
    : m_interval(interval),
      m_sweep(std::move(sweep)),
      m_logger(logger ? std::move(logger) : spdlog::default_logger()) {
}

IdleReaper::~IdleReaper() {
    stop();
}

void IdleReaper::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) {
        return;
    }
    m_stop = false;
    m_thread = std::thread(&IdleReaper::run, this);
    m_logger->debug("Idle reaper started (interval {}ms)", m_interval.count());
}

void IdleReaper::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();

    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
        m_logger->debug("Idle reaper stopped after {} sweeps", m_sweeps.load());
    }
}

bool IdleReaper::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread.joinable() && !m_stop;
}

void IdleReaper::run() {
    auto next = std::chrono::steady_clock::now() + m_interval;

    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop) {
        if (m_cv.wait_until(lock, next, [this] { return m_stop; })) {
            break;
        }

        lock.unlock();
        try {
            m_sweep();
        } catch (const std::exception& e) {
            m_logger->error("Idle sweep failed: {}", e.what());
        }
        m_sweeps++;
        lock.lock();

        // Ticker semantics: skip missed ticks instead of bursting
        auto now = std::chrono::steady_clock::now();
        next += m_interval;
        if (next <= now) {
            next = now + m_interval;
        }
    }
}

}  // namespace respool
