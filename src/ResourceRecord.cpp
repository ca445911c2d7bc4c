#include "ResourceRecord.hpp"

namespace respool {

ResourceRecord::ResourceRecord(int id, std::unique_ptr<ResourceWorker> worker)
    : m_id(id),
      m_worker(std::move(worker)),
      m_lastUsed(Clock::now()),
      m_lastUsedWall(std::chrono::system_clock::now()) {
}

bool ResourceRecord::isBusy() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_busy;
}

ResourceRecord::Clock::time_point ResourceRecord::lastUsed() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_lastUsed;
}

std::chrono::system_clock::time_point ResourceRecord::lastUsedWallClock() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_lastUsedWall;
}

int64_t ResourceRecord::useCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_useCount;
}

bool ResourceRecord::isIdleLongerThan(std::chrono::milliseconds threshold,
                                      Clock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return !m_busy && now - m_lastUsed > threshold;
}

void ResourceRecord::markAcquired() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_busy = true;
    m_lastUsed = Clock::now();
    m_lastUsedWall = std::chrono::system_clock::now();
    m_useCount++;
}

bool ResourceRecord::markReleased() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_busy) {
        return false;
    }
    m_busy = false;
    m_lastUsed = Clock::now();
    m_lastUsedWall = std::chrono::system_clock::now();
    return true;
}

std::string ResourceRecord::executeCommand(const Command& command,
                                           std::chrono::milliseconds submitTimeout) {
    ResultPayload payload;
    try {
        payload = execute([command](ResourceHandle& handle) {
            return handle.execute(command);
        }, submitTimeout);
    } catch (const PoolException&) {
        throw;
    } catch (const std::exception& e) {
        // Backend failures are surfaced verbatim
        throw PoolException(PoolError::Execution, e.what());
    }

    return payloadToBytes(payload);
}

bool ResourceRecord::shutdown(std::chrono::milliseconds grace) {
    return m_worker->stop(grace);
}

size_t ResourceRecord::queuedCount() const {
    return m_worker->queuedCount();
}

}  // namespace respool
