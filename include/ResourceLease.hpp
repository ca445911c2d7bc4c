#pragma once

/**
 * @file ResourceLease.hpp
 * @brief RAII checkout of a resource from the pool.
 */

#include <memory>

namespace respool {

class ResourcePool;
class ResourceRecord;

/**
 * @class ResourceLease
 * @brief Holds an acquired ResourceRecord and releases it back to the pool
 *        when destroyed.
 *
 * Usage:
 * @code
 *   {
 *       auto lease = pool.lease();
 *       std::string out = lease->executeCommand({"ping", ""}, timeout);
 *   }  // Record released back to the pool here
 * @endcode
 */
class ResourceLease {
public:
    /**
     * @brief Construct a lease.
     * @param pool Owning pool (for releasing the record).
     * @param record The acquired record.
     *
     * @note Normally only created by ResourcePool::lease().
     */
    ResourceLease(ResourcePool* pool, std::shared_ptr<ResourceRecord> record);

    /**
     * @brief Destructor - releases the record back to the pool.
     */
    ~ResourceLease();

    // Non-copyable to prevent double-release
    ResourceLease(const ResourceLease&) = delete;
    ResourceLease& operator=(const ResourceLease&) = delete;

    // Movable for transfer of ownership
    ResourceLease(ResourceLease&& other) noexcept;
    ResourceLease& operator=(ResourceLease&& other) noexcept;

    ResourceRecord* get() const { return m_record.get(); }
    ResourceRecord* operator->() const { return m_record.get(); }
    ResourceRecord& operator*() const { return *m_record; }

    /**
     * @brief Check if the lease still holds a record.
     */
    bool isValid() const { return m_pool != nullptr && m_record != nullptr; }

    /**
     * @brief Release the record early. Safe to call more than once.
     */
    void release();

private:
    ResourcePool* m_pool;
    std::shared_ptr<ResourceRecord> m_record;
};

}  // namespace respool
