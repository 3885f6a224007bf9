//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/result_materializer.cpp
//
// Result materializer implementation
//===----------------------------------------------------------------------===//

#include "gateway/result_materializer.hpp"
#include "gateway/gateway_error.hpp"
#include "logging/logger.hpp"
#include <unordered_set>

namespace sqlgate {

ResultMaterializer::ResultMaterializer(size_t row_cap)
    : row_cap_(row_cap) {
}

std::string ResultMaterializer::TruncationWarning(size_t row_cap) {
    return "Results limited to " + std::to_string(row_cap) +
           " rows; narrow the query with additional filters, aggregation or LIMIT";
}

std::vector<std::string> ResultMaterializer::UniqueColumnNames(const duckdb::vector<std::string>& names) {
    std::vector<std::string> unique;
    unique.reserve(names.size());
    std::unordered_set<std::string> seen(names.begin(), names.end());
    std::unordered_set<std::string> used;

    for (const auto& name : names) {
        if (used.insert(name).second) {
            unique.push_back(name);
            continue;
        }
        size_t suffix = 1;
        std::string candidate;
        do {
            candidate = name + "_" + std::to_string(suffix++);
        } while (used.count(candidate) > 0 || seen.count(candidate) > 0);
        used.insert(candidate);
        unique.push_back(candidate);
    }
    return unique;
}

ResultSet ResultMaterializer::Materialize(duckdb::QueryResult& result) const {
    if (result.HasError()) {
        throw GatewayException(ErrorKind::EXECUTION, result.GetError());
    }

    ResultSet set;

    // Header is known before the first row, so zero-row results keep their columns
    auto names = UniqueColumnNames(result.names);
    set.columns.reserve(names.size());
    for (size_t i = 0; i < names.size(); i++) {
        set.columns.push_back({names[i], result.types[i].ToString(), ""});
    }

    const size_t fetch_limit = row_cap_ + 1;
    const size_t column_count = result.ColumnCount();

    while (set.rows.size() < fetch_limit) {
        auto chunk = result.Fetch();
        if (!chunk || chunk->size() == 0) {
            break;
        }
        for (duckdb::idx_t row = 0; row < chunk->size() && set.rows.size() < fetch_limit; row++) {
            ResultRow values;
            values.reserve(column_count);
            for (duckdb::idx_t col = 0; col < column_count; col++) {
                values.push_back(chunk->GetValue(col, row));
            }
            set.rows.push_back(std::move(values));
        }
    }

    // A streaming result reports errors raised mid-fetch here
    if (result.HasError()) {
        throw GatewayException(ErrorKind::EXECUTION, result.GetError());
    }

    if (set.rows.size() > row_cap_) {
        set.rows.resize(row_cap_);
        set.truncated = true;
        set.warning = TruncationWarning(row_cap_);
        LOG_DEBUG("materializer", "Result truncated at " + std::to_string(row_cap_) + " rows");
    }
    set.row_count = set.rows.size();

    return set;
}

} // namespace sqlgate
