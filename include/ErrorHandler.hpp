#pragma once

#include <string>
#include <stdexcept>
#include <thread>
#include <chrono>

namespace respool {

enum class PoolError {
    Construction,           // initial population of the pool failed
    Initialization,         // a backend resource could not be initialized
    AcquireTimeout,         // no resource became free and the pool is at maximum
    ShutdownInProgress,     // pool is closing or closed
    Execution,              // backend reported a command failure
    ResultShape,            // backend result could not be interpreted
    WorkerUnavailable,      // worker queue full or worker shut down
    WorkerShutdownTimeout,  // worker did not exit within the grace period
    InvalidConfig
};

// Exception for all pool failures
class PoolException : public std::runtime_error {
public:
    PoolException(PoolError code, const std::string& message);

    PoolError code() const { return m_code; }

private:
    PoolError m_code;
};

class ErrorHandler {
public:
    // Stable identifier for a pool error, e.g. "acquire_timeout"
    static const char* errorName(PoolError code);

    // Check if a failed attempt may succeed when repeated later
    static bool isRetryable(PoolError code);

    // Sleep before the given retry (1-based): 100ms, 200ms, 400ms...
    // doubling stops after ten steps
    static std::chrono::milliseconds backoffDelay(int retry);

    // Execute with retry logic; non-pool exceptions and non-retryable
    // pool errors propagate immediately
    template<typename Func>
    static auto executeWithRetry(Func&& operation, int maxRetries = 3) {
        int retries = 0;

        while (true) {
            try {
                return operation();
            } catch (const PoolException& e) {
                if (!isRetryable(e.code()) || retries >= maxRetries) {
                    throw;
                }
            }

            retries++;
            std::this_thread::sleep_for(backoffDelay(retries));
        }
    }
};

}  // namespace respool
