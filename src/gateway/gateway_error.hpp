//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/gateway_error.hpp
//
// Error taxonomy shared by every gateway component
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sqlgate {

enum class ErrorKind : uint8_t {
    VALIDATION = 1,  // not a single read query, never reaches the store
    TIMEOUT = 2,     // deadline elapsed, partial results discarded
    EXECUTION = 3,   // engine rejected the statement or no connection available
    NOT_FOUND = 4    // unknown catalog object or example category
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::TIMEOUT:    return "TimeoutError";
        case ErrorKind::EXECUTION:  return "ExecutionError";
        case ErrorKind::NOT_FOUND:  return "NotFoundError";
        default:                    return "ExecutionError";
    }
}

// External error shape: {kind, message, hint}
struct ErrorReport {
    ErrorKind kind = ErrorKind::EXECUTION;
    std::string message;
    std::string hint;
};

// Thrown by gateway components; converted to ErrorReport by ErrorTranslator
class GatewayException : public std::runtime_error {
public:
    GatewayException(ErrorKind kind_p, const std::string& message, std::string hint_p = "")
        : std::runtime_error(message), kind(kind_p), hint(std::move(hint_p)) {}

    ErrorKind GetKind() const { return kind; }
    const std::string& GetHint() const { return hint; }

private:
    ErrorKind kind;
    std::string hint;
};

} // namespace sqlgate
