//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/error_translator.hpp
//
// Maps every failure surface onto the external {kind, message, hint} shape
//===----------------------------------------------------------------------===//

#pragma once

#include "gateway/gateway_error.hpp"
#include "gateway/statement_validator.hpp"
#include <exception>

namespace sqlgate {

class ErrorTranslator {
public:
    static ErrorReport FromVerdict(const ValidationVerdict& verdict);

    // GatewayException keeps its kind and hint; engine exceptions become
    // ExecutionError (TimeoutError for interrupts); anything else is an
    // ExecutionError carrying its what() text
    static ErrorReport FromException(const std::exception& e);

    static std::string DefaultHint(ErrorKind kind);

    static bool IsEngineException(const std::exception& e);

    static constexpr const char* EXECUTION_PREFIX = "Query execution failed: ";
};

} // namespace sqlgate
