//===----------------------------------------------------------------------===//
//                         SQLGate
//
// protocol/tool_handler.cpp
//
// Tool handler implementation
//===----------------------------------------------------------------------===//

#include "protocol/tool_handler.hpp"
#include "gateway/query_gateway.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace sqlgate {

ToolHandler::ToolHandler(QueryGateway& gateway_p)
    : gateway(gateway_p) {
}

const std::vector<std::string>& ToolHandler::Operations() {
    static const std::vector<std::string> operations = {
        "execute_sql",
        "get_schema",
        "get_example_queries",
    };
    return operations;
}

bool ToolHandler::IsKnownOperation(const std::string& operation) {
    const auto& operations = Operations();
    return std::find(operations.begin(), operations.end(), operation) != operations.end();
}

int ToolHandler::StatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return 400;
        case ErrorKind::NOT_FOUND:  return 404;
        case ErrorKind::TIMEOUT:    return 504;
        case ErrorKind::EXECUTION:
        default:                    return 422;
    }
}

ToolResponse ToolHandler::Handle(const std::string& operation, const std::string& arguments_text) {
    json arguments = json::object();
    if (!arguments_text.empty()) {
        try {
            arguments = json::parse(arguments_text);
        } catch (const json::parse_error& e) {
            return Malformed("Tool arguments are not valid JSON: " + std::string(e.what()));
        }
    }
    return Handle(operation, arguments);
}

ToolResponse ToolHandler::Handle(const std::string& operation, const json& arguments) {
    if (!IsKnownOperation(operation)) {
        ErrorReport error;
        error.kind = ErrorKind::NOT_FOUND;
        error.message = "Unknown tool '" + operation + "'";
        error.hint = "Available tools: execute_sql, get_schema, get_example_queries";
        return Failure(error);
    }

    if (!arguments.is_object() && !arguments.is_null()) {
        return Malformed("Tool arguments must be a JSON object");
    }
    const json& args = arguments.is_null() ? json::object() : arguments;

    LOG_DEBUG("tool_handler", "Dispatching " + operation);

    if (operation == "execute_sql") {
        return HandleExecuteSql(args);
    } else if (operation == "get_schema") {
        return HandleGetSchema(args);
    }
    return HandleGetExampleQueries(args);
}

ToolResponse ToolHandler::HandleExecuteSql(const json& arguments) {
    std::optional<std::string> query;
    std::string error;
    if (!OptionalString(arguments, "query", query, error)) {
        return Malformed(error);
    }

    // A missing query is rejected by the validator as empty
    auto response = gateway.ExecuteSql(query.value_or(""));
    if (!response.Ok()) {
        return Failure(*response.error);
    }
    return ToolResponse{200, JsonSerializer::Serialize(response.value)};
}

ToolResponse ToolHandler::HandleGetSchema(const json& arguments) {
    std::optional<std::string> table_name;
    std::string error;
    if (!OptionalString(arguments, "table_name", table_name, error)) {
        return Malformed(error);
    }

    auto response = gateway.GetSchema(table_name);
    if (!response.Ok()) {
        return Failure(*response.error);
    }
    if (response.value.is_listing) {
        return ToolResponse{200, JsonSerializer::Serialize(response.value.listing)};
    }
    return ToolResponse{200, JsonSerializer::Serialize(response.value.descriptor)};
}

ToolResponse ToolHandler::HandleGetExampleQueries(const json& arguments) {
    std::optional<std::string> category;
    std::string error;
    if (!OptionalString(arguments, "category", category, error)) {
        return Malformed(error);
    }

    auto response = gateway.GetExampleQueries(category);
    if (!response.Ok()) {
        return Failure(*response.error);
    }
    return ToolResponse{200, JsonSerializer::Serialize(response.value)};
}

ToolResponse ToolHandler::Failure(const ErrorReport& error) {
    return ToolResponse{StatusFor(error.kind), JsonSerializer::Serialize(error)};
}

ToolResponse ToolHandler::Malformed(const std::string& message) {
    LOG_WARN("tool_handler", "Malformed request: " + message);
    ErrorReport error;
    error.kind = ErrorKind::VALIDATION;
    error.message = message;
    error.hint = "Send the tool arguments as a JSON object, e.g. {\"query\": \"SELECT 1\"}";
    return Failure(error);
}

bool ToolHandler::OptionalString(const json& arguments, const char* key,
                                 std::optional<std::string>& out, std::string& error) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        out.reset();
        return true;
    }
    if (!it->is_string()) {
        error = std::string("Argument '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // namespace sqlgate
