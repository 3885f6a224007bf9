//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/result_materializer.hpp
//
// Reads a live result up to a row cap and flags truncation
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "gateway/result_set.hpp"

namespace sqlgate {

class ResultMaterializer {
public:
    explicit ResultMaterializer(size_t row_cap = DEFAULT_MAX_ROWS);

    // Reads at most row_cap + 1 rows. Throws GatewayException(EXECUTION) if the
    // engine reports an error before or while fetching.
    ResultSet Materialize(duckdb::QueryResult& result) const;

    size_t GetRowCap() const { return row_cap_; }

    static std::string TruncationWarning(size_t row_cap);

    // Later duplicates get _1, _2, ... appended
    static std::vector<std::string> UniqueColumnNames(const duckdb::vector<std::string>& names);

private:
    size_t row_cap_;
};

} // namespace sqlgate
