//===----------------------------------------------------------------------===//
//                         SQLGate
//
// serialization/json_serializer.hpp
//
// JSON encoding of tool payloads
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "gateway/gateway_error.hpp"
#include "gateway/result_set.hpp"
#include "catalog/schema_catalog.hpp"
#include "catalog/example_queries.hpp"
#include <nlohmann/json.hpp>

namespace sqlgate {

using json = nlohmann::json;

class JsonSerializer {
public:
    // NULL -> null, BOOLEAN -> bool, integers -> number, HUGEINT/UHUGEINT ->
    // string, FLOAT/DOUBLE/DECIMAL -> number, anything else -> engine text
    static json EncodeValue(const duckdb::Value& value);

    static json EncodeRow(const ResultRow& row);

    static json Serialize(const ResultSet& result);
    static json Serialize(const ErrorReport& error);
    static json Serialize(const SchemaListingResult& listing);
    static json Serialize(const SchemaDescriptor& descriptor);
    static json Serialize(const ExampleQueryResult& examples);
    static json Serialize(const ExampleQuery& example);

    // Payloads echo caller bytes (tool names, statement fragments) that need
    // not be UTF-8. Invalid sequences become U+FFFD instead of throwing.
    static std::string Dump(const json& payload, int indent = -1);
};

} // namespace sqlgate
