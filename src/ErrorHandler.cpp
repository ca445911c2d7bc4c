#include "ErrorHandler.hpp"
#include <algorithm>

namespace respool {

PoolException::PoolException(PoolError code, const std::string& message)
    : std::runtime_error(message), m_code(code) {
}

const char* ErrorHandler::errorName(PoolError code) {
    switch (code) {
        case PoolError::Construction:
            return "construction_error";
        case PoolError::Initialization:
            return "initialization_error";
        case PoolError::AcquireTimeout:
            return "acquire_timeout";
        case PoolError::ShutdownInProgress:
            return "shutdown_in_progress";
        case PoolError::Execution:
            return "execution_error";
        case PoolError::ResultShape:
            return "result_shape_error";
        case PoolError::WorkerUnavailable:
            return "worker_unavailable";
        case PoolError::WorkerShutdownTimeout:
            return "worker_shutdown_timeout";
        case PoolError::InvalidConfig:
            return "invalid_config";
    }
    return "unknown_error";
}

bool ErrorHandler::isRetryable(PoolError code) {
    switch (code) {
        // Transient: another caller may release a resource or drain a queue
        case PoolError::AcquireTimeout:
        case PoolError::WorkerUnavailable:
            return true;

        default:
            return false;
    }
}

std::chrono::milliseconds ErrorHandler::backoffDelay(int retry) {
    constexpr int kMaxDoublings = 10;
    const int doublings = std::clamp(retry - 1, 0, kMaxDoublings);
    return std::chrono::milliseconds(100LL << doublings);
}

}  // namespace respool
