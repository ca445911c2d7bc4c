#pragma once

/**
 * @file CommandResult.hpp
 * @brief Command and result types exchanged with a resource worker.
 */

#include <cstdint>
#include <string>
#include <variant>

namespace respool {

/**
 * @brief One unit of work for a resource: an operation name plus an
 * opaque parameter payload. Both are passed to the backend untouched.
 */
struct Command {
    std::string operation;
    std::string params;
};

/**
 * @brief Value produced by a backend handle for one command.
 *
 * std::monostate means the backend produced nothing usable.
 */
using ResultPayload = std::variant<std::monostate, std::string, int64_t, double, bool>;

/**
 * @brief Convert a backend result into the bytes returned to callers.
 * @param payload Value returned by ResourceHandle::execute().
 * @return The string as-is, or the textual form of a number/boolean.
 * @throws PoolException(ResultShape) if the payload is empty.
 */
std::string payloadToBytes(const ResultPayload& payload);

}  // namespace respool
