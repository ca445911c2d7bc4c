#include "StatusReport.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace respool {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
    if (millis < 0) {
        seconds -= std::chrono::seconds(1);
        millis += 1000;
    }

    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

json statusToJson(const PoolStatus& status) {
    json resources = json::object();
    for (const auto& resource : status.resources) {
        resources[std::to_string(resource.id)] = {
            {"useCount", resource.useCount},
            {"lastUsed", formatTimestamp(resource.lastUsed)},
            {"busy", resource.busy}
        };
    }

    return {
        {"status", status.shutdown ? "stopped" : "running"},
        {"connCount", status.activeCount},
        {"available", status.availableCount},
        {"connStatuses", std::move(resources)}
    };
}

}  // namespace respool
