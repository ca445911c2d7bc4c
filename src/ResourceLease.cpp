/**
 * @file ResourceLease.cpp
 * @brief Implementation of the RAII resource checkout.
 */

#include "ResourceLease.hpp"
#include "ResourcePool.hpp"

namespace respool {

// ============================================================================
// Construction and Destruction
// ============================================================================

ResourceLease::ResourceLease(ResourcePool* pool, std::shared_ptr<ResourceRecord> record)
    : m_pool(pool), m_record(std::move(record)) {
}

ResourceLease::~ResourceLease() {
    release();
}

// ============================================================================
// Move Operations
// ============================================================================

ResourceLease::ResourceLease(ResourceLease&& other) noexcept
    : m_pool(other.m_pool), m_record(std::move(other.m_record)) {
    other.m_pool = nullptr;
}

ResourceLease& ResourceLease::operator=(ResourceLease&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = other.m_pool;
        m_record = std::move(other.m_record);
        other.m_pool = nullptr;
    }
    return *this;
}

// ============================================================================
// Release
// ============================================================================

void ResourceLease::release() {
    if (m_pool && m_record) {
        m_pool->release(m_record);
    }
    m_pool = nullptr;
    m_record.reset();
}

}  // namespace respool
