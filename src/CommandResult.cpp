#include "CommandResult.hpp"
#include "ErrorHandler.hpp"
#include <fmt/format.h>

namespace respool {

namespace {

struct BytesVisitor {
    std::string operator()(std::monostate) const {
        throw PoolException(PoolError::ResultShape,
                            "result can not be converted to string");
    }
    std::string operator()(const std::string& value) const { return value; }
    std::string operator()(int64_t value) const { return fmt::format("{}", value); }
    std::string operator()(double value) const { return fmt::format("{}", value); }
    std::string operator()(bool value) const { return value ? "true" : "false"; }
};

}  // namespace

std::string payloadToBytes(const ResultPayload& payload) {
    return std::visit(BytesVisitor{}, payload);
}

}  // namespace respool
