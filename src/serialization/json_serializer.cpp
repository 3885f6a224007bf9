//===----------------------------------------------------------------------===//
//                         SQLGate
//
// serialization/json_serializer.cpp
//
// JSON serializer implementation
//===----------------------------------------------------------------------===//

#include "serialization/json_serializer.hpp"
#include <cmath>

namespace sqlgate {

json JsonSerializer::EncodeValue(const duckdb::Value& value) {
    if (value.IsNull()) {
        return nullptr;
    }

    switch (value.type().id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return value.GetValue<bool>();

        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::BIGINT:
            return value.GetValue<int64_t>();

        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
        case duckdb::LogicalTypeId::UINTEGER:
        case duckdb::LogicalTypeId::UBIGINT:
            return value.GetValue<uint64_t>();

        case duckdb::LogicalTypeId::FLOAT:
        case duckdb::LogicalTypeId::DOUBLE:
        case duckdb::LogicalTypeId::DECIMAL: {
            double number = value.GetValue<double>();
            // JSON has no NaN or infinity
            if (!std::isfinite(number)) {
                return value.ToString();
            }
            return number;
        }

        // Wider than any JSON number reader keeps exact
        case duckdb::LogicalTypeId::HUGEINT:
        case duckdb::LogicalTypeId::UHUGEINT:
        default:
            return value.ToString();
    }
}

json JsonSerializer::EncodeRow(const ResultRow& row) {
    json encoded = json::array();
    for (const auto& value : row) {
        encoded.push_back(EncodeValue(value));
    }
    return encoded;
}

json JsonSerializer::Serialize(const ResultSet& result) {
    json payload;
    payload["columns"] = result.ColumnNames();

    json rows = json::array();
    for (const auto& row : result.rows) {
        rows.push_back(EncodeRow(row));
    }
    payload["rows"] = std::move(rows);
    payload["row_count"] = result.row_count;
    payload["truncated"] = result.truncated;
    if (result.truncated) {
        payload["warning"] = result.warning;
    }
    return payload;
}

json JsonSerializer::Serialize(const ErrorReport& error) {
    return json{
        {"kind", ErrorKindToString(error.kind)},
        {"message", error.message},
        {"hint", error.hint},
    };
}

json JsonSerializer::Serialize(const SchemaListingResult& listing) {
    json tables = json::array();
    for (const auto& table : listing.tables) {
        tables.push_back({
            {"name", table.name},
            {"kind", table.kind},
            {"description", table.description},
        });
    }
    return json{
        {"tables", std::move(tables)},
        {"recommendation", listing.recommendation},
    };
}

json JsonSerializer::Serialize(const SchemaDescriptor& descriptor) {
    json columns = json::array();
    for (const auto& column : descriptor.columns) {
        columns.push_back({
            {"name", column.name},
            {"type", column.type},
            {"description", column.description},
        });
    }

    json samples = json::array();
    for (const auto& row : descriptor.sample_rows) {
        samples.push_back(EncodeRow(row));
    }

    return json{
        {"name", descriptor.name},
        {"kind", descriptor.kind},
        {"description", descriptor.description},
        {"columns", std::move(columns)},
        {"row_count", descriptor.row_count},
        {"sample_rows", std::move(samples)},
        {"sample_policy", descriptor.sample_policy},
        {"sample_note", descriptor.sample_note},
    };
}

json JsonSerializer::Serialize(const ExampleQuery& example) {
    return json{
        {"category", example.category},
        {"title", example.title},
        {"description", example.description},
        {"sql", example.sql},
        {"use_case", example.use_case},
    };
}

json JsonSerializer::Serialize(const ExampleQueryResult& examples) {
    json entries = json::array();
    for (const auto& example : examples.examples) {
        entries.push_back(Serialize(example));
    }
    return json{
        {"category", examples.category},
        {"examples", std::move(entries)},
        {"available_categories", examples.available_categories},
        {"note", examples.note},
    };
}

std::string JsonSerializer::Dump(const json& payload, int indent) {
    return payload.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace sqlgate
