#pragma once

#include "CommandResult.hpp"
#include <memory>
#include <string>

namespace respool {

struct PoolConfig;

// One initialized backend resource. Only ever touched from the worker
// thread that created it.
class ResourceHandle {
public:
    virtual ~ResourceHandle() = default;

    // Non-copyable, non-movable
    ResourceHandle(const ResourceHandle&) = delete;
    ResourceHandle& operator=(const ResourceHandle&) = delete;

    // Run one command; backend failures are thrown
    virtual ResultPayload execute(const Command& command) = 0;

    // Tear down in reverse acquisition order; called once before destruction
    virtual void release() = 0;

protected:
    ResourceHandle() = default;
};

// Factory for resources of one backend kind
class ResourceBackend {
public:
    virtual ~ResourceBackend() = default;

    // Non-copyable, non-movable
    ResourceBackend(const ResourceBackend&) = delete;
    ResourceBackend& operator=(const ResourceBackend&) = delete;

    virtual std::string name() const = 0;

    // Construct and initialize one resource; called on the worker thread
    // that will own the returned handle. Failures are thrown.
    virtual std::unique_ptr<ResourceHandle> initialize(const PoolConfig& config) = 0;

protected:
    ResourceBackend() = default;
};

}  // namespace respool
