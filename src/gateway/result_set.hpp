//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/result_set.hpp
//
// Materialized, size-bounded query results
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include <string>
#include <vector>

namespace sqlgate {

struct ColumnDescriptor {
    std::string name;
    std::string type;         // declared engine type, e.g. BIGINT, DATE
    std::string description;  // catalog columns only
};

using ResultRow = std::vector<duckdb::Value>;

struct ResultSet {
    std::vector<ColumnDescriptor> columns;  // names unique within the set
    std::vector<ResultRow> rows;
    uint64_t row_count = 0;
    bool truncated = false;
    std::string warning;  // set only when truncated

    std::vector<std::string> ColumnNames() const {
        std::vector<std::string> names;
        names.reserve(columns.size());
        for (const auto& col : columns) {
            names.push_back(col.name);
        }
        return names;
    }
};

} // namespace sqlgate
