//===----------------------------------------------------------------------===//
//                         SQLGate
//
// catalog/schema_catalog.cpp
//
// Schema catalog implementation
//===----------------------------------------------------------------------===//

#include "catalog/schema_catalog.hpp"
#include "gateway/execution_coordinator.hpp"
#include "gateway/gateway_error.hpp"
#include "logging/logger.hpp"
#include "duckdb/main/materialized_query_result.hpp"
#include <algorithm>
#include <cctype>

namespace sqlgate {

namespace {

constexpr const char* USER_OBJECTS_FILTER =
    "table_catalog = current_database() "
    "AND table_schema NOT IN ('information_schema', 'pg_catalog')";

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(begin, end - begin + 1);
}

std::string KindOf(const std::string& table_type) {
    return ToLower(table_type) == "view" ? "view" : "table";
}

duckdb::MaterializedQueryResult& Checked(duckdb::QueryResult* result) {
    if (!result || result->HasError()) {
        throw GatewayException(ErrorKind::EXECUTION,
                               result ? result->GetError() : "Catalog query returned no result");
    }
    return result->Cast<duckdb::MaterializedQueryResult>();
}

duckdb::unique_ptr<duckdb::QueryResult> RunPrepared(duckdb::Connection& conn,
                                                    const std::string& sql,
                                                    duckdb::vector<duckdb::Value> params) {
    auto prepared = conn.Prepare(sql);
    if (prepared->HasError()) {
        throw GatewayException(ErrorKind::EXECUTION, prepared->GetError());
    }
    return prepared->Execute(params, false);
}

} // anonymous namespace

SchemaCatalog::SchemaCatalog(ExecutionCoordinator& coordinator_p, CatalogMetadata metadata_p,
                             const Config& config_p)
    : coordinator(coordinator_p)
    , metadata(std::make_shared<const CatalogMetadata>(std::move(metadata_p)))
    , sample_rows(std::min(std::max(config_p.sample_rows, MIN_SAMPLE_ROWS), MAX_SAMPLE_ROWS))
    , recency_columns(config_p.recency_columns) {
}

std::string SchemaCatalog::QuoteIdentifier(const std::string& identifier) {
    std::string quoted = "\"";
    for (char c : identifier) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

SchemaListingResult SchemaCatalog::List() {
    auto listing = std::make_shared<SchemaListingResult>();
    auto meta = metadata;

    coordinator.RunWithDeadline("schema-list", [listing, meta](duckdb::Connection& conn) {
        auto result = conn.Query(std::string("SELECT table_name, table_type "
                                             "FROM information_schema.tables WHERE ") +
                                 USER_OBJECTS_FILTER + " ORDER BY table_name");
        auto& rows = Checked(result.get());

        for (duckdb::idx_t row = 0; row < rows.RowCount(); row++) {
            SchemaListing entry;
            entry.name = rows.GetValue(0, row).ToString();
            entry.kind = KindOf(rows.GetValue(1, row).ToString());
            entry.description = meta->TableDescription(entry.name);
            listing->tables.push_back(std::move(entry));
        }
    });

    listing->recommendation = metadata->recommendation;
    return std::move(*listing);
}

SchemaDescriptor SchemaCatalog::Describe(const std::string& name) {
    std::string lookup = Trim(name);
    if (lookup.empty()) {
        throw GatewayException(ErrorKind::VALIDATION, "table_name cannot be empty",
                               "Omit table_name to list every table and view");
    }

    auto descriptor = std::make_shared<SchemaDescriptor>();
    auto found = std::make_shared<bool>(false);
    auto meta = metadata;
    auto recency = recency_columns;
    size_t limit = sample_rows;

    coordinator.RunWithDeadline("schema-describe", [=](duckdb::Connection& conn) {
        // Prefer the default schema when the same name exists in several
        auto object = RunPrepared(conn,
            std::string("SELECT table_schema, table_name, table_type "
                        "FROM information_schema.tables WHERE ") + USER_OBJECTS_FILTER +
            " AND LOWER(table_name) = LOWER(?) "
            "ORDER BY (table_schema = 'main') DESC, table_schema LIMIT 1",
            {duckdb::Value(lookup)});
        auto& object_rows = Checked(object.get());
        if (object_rows.RowCount() == 0) {
            return;
        }
        *found = true;

        std::string schema = object_rows.GetValue(0, 0).ToString();
        descriptor->name = object_rows.GetValue(1, 0).ToString();
        descriptor->kind = KindOf(object_rows.GetValue(2, 0).ToString());
        descriptor->description = meta->TableDescription(descriptor->name);

        auto columns = RunPrepared(conn,
            "SELECT column_name, data_type FROM information_schema.columns "
            "WHERE table_catalog = current_database() AND table_schema = ? AND table_name = ? "
            "ORDER BY ordinal_position",
            {duckdb::Value(schema), duckdb::Value(descriptor->name)});
        auto& column_rows = Checked(columns.get());
        for (duckdb::idx_t row = 0; row < column_rows.RowCount(); row++) {
            ColumnDescriptor column;
            column.name = column_rows.GetValue(0, row).ToString();
            column.type = column_rows.GetValue(1, row).ToString();
            column.description = meta->ColumnDescription(column.name);
            descriptor->columns.push_back(std::move(column));
        }

        std::string qualified = QuoteIdentifier(schema) + "." + QuoteIdentifier(descriptor->name);

        auto count = conn.Query("SELECT COUNT(*) FROM " + qualified);
        auto& count_rows = Checked(count.get());
        descriptor->row_count = count_rows.GetValue(0, 0).GetValue<int64_t>();

        std::string recency_column;
        for (const auto& candidate : recency) {
            for (const auto& column : descriptor->columns) {
                if (ToLower(column.name) == ToLower(candidate)) {
                    recency_column = column.name;
                    break;
                }
            }
            if (!recency_column.empty()) {
                break;
            }
        }

        std::string sample_sql = "SELECT * FROM " + qualified;
        if (!recency_column.empty()) {
            std::string quoted = QuoteIdentifier(recency_column);
            sample_sql += " WHERE " + quoted + " = (SELECT MAX(" + quoted + ") FROM " +
                          qualified + ")";
            descriptor->sample_policy = "most_recent:" + recency_column;
            descriptor->sample_note = "Rows from the most recent " + recency_column + " value";
        } else {
            descriptor->sample_policy = "arbitrary";
            descriptor->sample_note = "Rows in natural storage order; arbitrary, "
                                      "not guaranteed stable across releases";
        }
        sample_sql += " LIMIT " + std::to_string(limit);

        auto sample = conn.Query(sample_sql);
        auto& sample_rows_result = Checked(sample.get());
        for (duckdb::idx_t row = 0; row < sample_rows_result.RowCount(); row++) {
            ResultRow values;
            values.reserve(sample_rows_result.ColumnCount());
            for (duckdb::idx_t col = 0; col < sample_rows_result.ColumnCount(); col++) {
                values.push_back(sample_rows_result.GetValue(col, row));
            }
            descriptor->sample_rows.push_back(std::move(values));
        }
    });

    if (!*found) {
        LOG_DEBUG("catalog", "Describe miss for '" + name + "'");
        throw GatewayException(ErrorKind::NOT_FOUND, "Table or view '" + name + "' not found",
                               "Call get_schema() with no arguments to list available tables and views");
    }
    return std::move(*descriptor);
}

} // namespace sqlgate
