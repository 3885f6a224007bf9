//===----------------------------------------------------------------------===//
//                         SQLGate
//
// protocol/tool_handler.hpp
//
// Tool call dispatch: JSON arguments in, JSON payload and status out
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "gateway/gateway_error.hpp"
#include "serialization/json_serializer.hpp"
#include <optional>

namespace sqlgate {

class QueryGateway;

struct ToolResponse {
    int status = 200;  // HTTP status code
    json body;
};

class ToolHandler {
public:
    explicit ToolHandler(QueryGateway& gateway_p);

    // arguments_text must be empty or a JSON object
    ToolResponse Handle(const std::string& operation, const std::string& arguments_text);
    ToolResponse Handle(const std::string& operation, const json& arguments);

    static bool IsKnownOperation(const std::string& operation);
    static const std::vector<std::string>& Operations();

    static int StatusFor(ErrorKind kind);

private:
    ToolResponse HandleExecuteSql(const json& arguments);
    ToolResponse HandleGetSchema(const json& arguments);
    ToolResponse HandleGetExampleQueries(const json& arguments);

    static ToolResponse Failure(const ErrorReport& error);
    static ToolResponse Malformed(const std::string& message);

    // Absent and null map to nullopt; any other non-string is malformed
    static bool OptionalString(const json& arguments, const char* key,
                               std::optional<std::string>& out, std::string& error);

private:
    QueryGateway& gateway;
};

} // namespace sqlgate
