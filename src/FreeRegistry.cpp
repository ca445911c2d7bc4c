#include "FreeRegistry.hpp"
#include "ResourceRecord.hpp"
#include <algorithm>
#include <iterator>

namespace respool {

FreeRegistry::FreeRegistry(size_t capacity)
    : m_capacity(capacity) {
}

bool FreeRegistry::tryPush(std::shared_ptr<ResourceRecord> record) {
    if (!record) return false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_idle.size() >= m_capacity) {
            return false;
        }
        const int id = record->id();
        if (std::any_of(m_idle.begin(), m_idle.end(),
                        [id](const auto& queued) { return queued->id() == id; })) {
            return false;
        }
        m_idle.push_back(std::move(record));
    }
    m_cv.notify_one();
    return true;
}

std::shared_ptr<ResourceRecord> FreeRegistry::tryPop() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_closed || m_idle.empty()) {
        return nullptr;
    }

    auto record = std::move(m_idle.front());
    m_idle.pop_front();
    return record;
}

FreeRegistry::PopStatus FreeRegistry::popFor(std::chrono::milliseconds timeout,
                                             std::shared_ptr<ResourceRecord>& out) {
    std::unique_lock<std::mutex> lock(m_mutex);

    bool ready = m_cv.wait_for(lock, timeout, [this] {
        return m_closed || !m_idle.empty();
    });

    if (m_closed) {
        return PopStatus::Closed;
    }
    if (!ready) {
        return PopStatus::TimedOut;
    }

    out = std::move(m_idle.front());
    m_idle.pop_front();
    return PopStatus::Acquired;
}

bool FreeRegistry::tryRemove(int id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find_if(m_idle.begin(), m_idle.end(),
                           [id](const auto& record) { return record->id() == id; });
    if (it == m_idle.end()) {
        return false;
    }
    m_idle.erase(it);
    return true;
}

bool FreeRegistry::contains(int id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_idle.begin(), m_idle.end(),
                       [id](const auto& record) { return record->id() == id; });
}

void FreeRegistry::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool FreeRegistry::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::vector<std::shared_ptr<ResourceRecord>> FreeRegistry::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::shared_ptr<ResourceRecord>> drained(
        std::make_move_iterator(m_idle.begin()), std::make_move_iterator(m_idle.end()));
    m_idle.clear();
    return drained;
}

size_t FreeRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_idle.size();
}

}  // namespace respool
