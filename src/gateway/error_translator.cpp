//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/error_translator.cpp
//
// Error translator implementation
//===----------------------------------------------------------------------===//

#include "gateway/error_translator.hpp"
#include <algorithm>
#include <cctype>
#include "duckdb.hpp"
#include "duckdb/common/error_data.hpp"

namespace sqlgate {

namespace {

std::string WithExecutionPrefix(const std::string& message) {
    if (message.rfind(ErrorTranslator::EXECUTION_PREFIX, 0) == 0) {
        return message;
    }
    return ErrorTranslator::EXECUTION_PREFIX + message;
}

} // anonymous namespace

std::string ErrorTranslator::DefaultHint(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:
            return "Only single read-only SELECT (or WITH ... SELECT) statements are allowed; "
                   "remove the offending keyword or extra statement";
        case ErrorKind::TIMEOUT:
            return "Simplify filters or aggregate before returning large result sets";
        case ErrorKind::NOT_FOUND:
            return "Call get_schema() with no arguments to list available tables and views";
        case ErrorKind::EXECUTION:
        default:
            return "Check table/column names using the get_schema tool";
    }
}

ErrorReport ErrorTranslator::FromVerdict(const ValidationVerdict& verdict) {
    ErrorReport report;
    report.kind = ErrorKind::VALIDATION;
    report.message = verdict.reason.empty() ? "Query rejected" : verdict.reason;
    if (verdict.rule == ValidationRule::FORBIDDEN_KEYWORD) {
        std::string word = verdict.offending_token;
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        report.hint = "Only read-only SELECT (or WITH ... SELECT) statements are allowed. "
                      "If " + verdict.offending_token + " names a column or table, "
                      "double-quote it (\"" + word + "\")";
    } else {
        report.hint = DefaultHint(ErrorKind::VALIDATION);
    }
    return report;
}

ErrorReport ErrorTranslator::FromException(const std::exception& e) {
    ErrorReport report;

    if (auto gateway_error = dynamic_cast<const GatewayException*>(&e)) {
        report.kind = gateway_error->GetKind();
        report.message = report.kind == ErrorKind::EXECUTION ? WithExecutionPrefix(e.what())
                                                             : std::string(e.what());
        report.hint = gateway_error->GetHint().empty() ? DefaultHint(report.kind)
                                                       : gateway_error->GetHint();
        return report;
    }

    if (!IsEngineException(e)) {
        report.kind = ErrorKind::EXECUTION;
        report.message = WithExecutionPrefix(e.what());
        report.hint = DefaultHint(ErrorKind::EXECUTION);
        return report;
    }

    // Engine exceptions carry a typed, JSON-encoded message
    duckdb::ErrorData error(e);
    if (error.Type() == duckdb::ExceptionType::INTERRUPT) {
        report.kind = ErrorKind::TIMEOUT;
        report.message = "Query was interrupted before completion";
        report.hint = DefaultHint(ErrorKind::TIMEOUT);
        return report;
    }

    report.kind = ErrorKind::EXECUTION;
    report.message = WithExecutionPrefix(error.Message());
    report.hint = DefaultHint(ErrorKind::EXECUTION);
    return report;
}

bool ErrorTranslator::IsEngineException(const std::exception& e) {
    return dynamic_cast<const duckdb::Exception*>(&e) != nullptr;
}

} // namespace sqlgate
