//===----------------------------------------------------------------------===//
//                         SQLGate
//
// catalog/schema_catalog.hpp
//
// Read-only introspection of the tables and views in the store
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "catalog/catalog_metadata.hpp"
#include "gateway/result_set.hpp"

namespace sqlgate {

class ExecutionCoordinator;

struct SchemaListing {
    std::string name;
    std::string kind;  // "table" or "view"
    std::string description;
};

struct SchemaListingResult {
    std::vector<SchemaListing> tables;
    std::string recommendation;
};

struct SchemaDescriptor {
    std::string name;  // as stored, regardless of the case used to look it up
    std::string kind;
    std::string description;
    std::vector<ColumnDescriptor> columns;
    uint64_t row_count = 0;
    std::vector<ResultRow> sample_rows;  // same column order as columns
    std::string sample_policy;           // "most_recent:<column>" or "arbitrary"
    std::string sample_note;
};

class SchemaCatalog {
public:
    struct Config {
        size_t sample_rows;
        std::vector<std::string> recency_columns;

        Config()
            : sample_rows(DEFAULT_SAMPLE_ROWS)
            , recency_columns{"cycle_date"} {}
    };

    SchemaCatalog(ExecutionCoordinator& coordinator_p, CatalogMetadata metadata_p,
                  const Config& config_p = Config{});

    SchemaListingResult List();

    // Throws GatewayException(NOT_FOUND) if no table or view matches name
    // case-insensitively, GatewayException(VALIDATION) for a blank name.
    SchemaDescriptor Describe(const std::string& name);

    const CatalogMetadata& GetMetadata() const { return *metadata; }
    size_t GetSampleRows() const { return sample_rows; }

    static std::string QuoteIdentifier(const std::string& identifier);

private:
    ExecutionCoordinator& coordinator;
    std::shared_ptr<const CatalogMetadata> metadata;
    size_t sample_rows;
    std::vector<std::string> recency_columns;
};

} // namespace sqlgate
