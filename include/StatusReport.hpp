#pragma once

#include "ResourcePool.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace respool {

using json = nlohmann::json;

// {"status": "running"|"stopped", "connCount": N, "available": N,
//  "connStatuses": {"<id>": {"useCount": N, "lastUsed": "...", "busy": b}}}
json statusToJson(const PoolStatus& status);

// UTC timestamp with milliseconds, e.g. 2024-01-31T12:00:00.123Z
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace respool
