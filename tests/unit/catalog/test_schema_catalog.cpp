//===----------------------------------------------------------------------===//
//                         SQLGate - Unit Tests
//
// tests/unit/catalog/test_schema_catalog.cpp
//
// Unit tests for SchemaCatalog against a read-only store file
//===----------------------------------------------------------------------===//

#include "catalog/schema_catalog.hpp"
#include "gateway/execution_coordinator.hpp"
#include "executor/executor_pool.hpp"
#include "session/session_manager.hpp"
#include "common/test_store.hpp"
#include <cassert>
#include <iostream>

using namespace sqlgate;

namespace {

struct CatalogHarness {
    explicit CatalogHarness(const testing::TestStore& store,
                            const SchemaCatalog::Config& config = SchemaCatalog::Config{})
        : sessions(store.OpenReadOnly())
        , executor(2)
        , coordinator(sessions, executor)
        , catalog(coordinator, CatalogMetadata::Defaults(), config) {
        executor.Start();
    }

    ~CatalogHarness() { executor.Stop(); }

    SessionManager sessions;
    ExecutorPool executor;
    ExecutionCoordinator coordinator;
    SchemaCatalog catalog;
};

ErrorKind DescribeFailure(SchemaCatalog& catalog, const std::string& name, std::string& message) {
    try {
        catalog.Describe(name);
    } catch (const GatewayException& e) {
        message = e.what();
        return e.GetKind();
    }
    assert(false && "describe was expected to fail");
    return ErrorKind::EXECUTION;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Listing Tests
//===----------------------------------------------------------------------===//

void TestListTablesAndViews() {
    std::cout << "  Testing listing of tables and views..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    auto listing = h.catalog.List();
    assert(listing.tables.size() == 5);
    assert(listing.tables[0].name == "acctdesc");
    assert(listing.tables[1].name == "cu_with_ratios");
    assert(listing.tables[2].name == "foicu");
    assert(listing.tables[3].name == "fs220");
    assert(listing.tables[4].name == "member_history");

    assert(listing.tables[0].kind == "table");
    assert(listing.tables[1].kind == "view");
    assert(listing.tables[4].kind == "view");

    assert(listing.recommendation == "Use the cu_with_ratios view for most analytical queries");

    std::cout << "    PASSED" << std::endl;
}

void TestListingDescriptions() {
    std::cout << "  Testing listing descriptions..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    auto listing = h.catalog.List();
    assert(listing.tables[1].description ==
           "Consolidated view that joins identifying info with pre-calculated ratios");
    assert(!listing.tables[2].description.empty());
    // No curated description, still listed
    assert(listing.tables[4].description.empty());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Describe Tests
//===----------------------------------------------------------------------===//

void TestDescribeView() {
    std::cout << "  Testing describe of a view with a recency column..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    auto descriptor = h.catalog.Describe("cu_with_ratios");
    assert(descriptor.name == "cu_with_ratios");
    assert(descriptor.kind == "view");
    assert(descriptor.row_count == static_cast<uint64_t>(2 * testing::CREDIT_UNIONS));

    assert(descriptor.columns.size() == 8);
    assert(descriptor.columns[0].name == "cu_number");
    assert(descriptor.columns[1].name == "cycle_date");
    assert(descriptor.columns[1].type == "DATE");
    assert(descriptor.columns[6].name == "roa");
    assert(descriptor.columns[6].description == "Return on Assets (annualized percentage)");

    assert(descriptor.sample_rows.size() == 5);
    for (const auto& row : descriptor.sample_rows) {
        assert(row.size() == descriptor.columns.size());
        assert(row[1].ToString() == "2024-06-30");
    }
    assert(descriptor.sample_policy == "most_recent:cycle_date");
    assert(descriptor.sample_note == "Rows from the most recent cycle_date value");

    std::cout << "    PASSED" << std::endl;
}

void TestDescribeTableWithoutRecency() {
    std::cout << "  Testing describe of a table without a recency column..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    auto descriptor = h.catalog.Describe("acctdesc");
    assert(descriptor.kind == "table");
    assert(descriptor.row_count == 5);
    assert(descriptor.columns.size() == 2);
    assert(descriptor.columns[0].type == "VARCHAR");
    assert(descriptor.sample_rows.size() == 5);
    assert(descriptor.sample_policy == "arbitrary");
    assert(descriptor.sample_note.find("arbitrary") != std::string::npos);

    std::cout << "    PASSED" << std::endl;
}

void TestDescribeLargeView() {
    std::cout << "  Testing describe of a large view..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    auto descriptor = h.catalog.Describe("member_history");
    assert(descriptor.row_count == static_cast<uint64_t>(testing::LARGE_VIEW_ROWS));
    assert(descriptor.sample_rows.size() == 5);

    std::cout << "    PASSED" << std::endl;
}

void TestCaseInsensitiveLookup() {
    std::cout << "  Testing case-insensitive lookup..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    auto descriptor = h.catalog.Describe("  CU_With_Ratios ");
    assert(descriptor.name == "cu_with_ratios");

    std::cout << "    PASSED" << std::endl;
}

void TestSampleRowClamp() {
    std::cout << "  Testing sample row count is clamped..." << std::endl;

    testing::TestStore store;

    {
        SchemaCatalog::Config many;
        many.sample_rows = 50;
        CatalogHarness wide(store, many);
        assert(wide.catalog.GetSampleRows() == 5);
        assert(wide.catalog.Describe("foicu").sample_rows.size() == 5);
    }
    {
        SchemaCatalog::Config few;
        few.sample_rows = 1;
        CatalogHarness narrow(store, few);
        assert(narrow.catalog.GetSampleRows() == 3);
        assert(narrow.catalog.Describe("foicu").sample_rows.size() == 3);
    }

    std::cout << "    PASSED" << std::endl;
}

void TestCustomRecencyColumns() {
    std::cout << "  Testing configured recency columns..." << std::endl;

    testing::TestStore store;
    SchemaCatalog::Config config;
    config.recency_columns = {"bucket"};
    CatalogHarness h(store, config);

    auto descriptor = h.catalog.Describe("member_history");
    assert(descriptor.sample_policy == "most_recent:bucket");
    for (const auto& row : descriptor.sample_rows) {
        assert(row[1].GetValue<int64_t>() == 96);
    }

    // cycle_date no longer counts as a recency column
    assert(h.catalog.Describe("foicu").sample_policy == "arbitrary");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Error Tests
//===----------------------------------------------------------------------===//

void TestUnknownName() {
    std::cout << "  Testing unknown table name..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    std::string message;
    assert(DescribeFailure(h.catalog, "nonexistent", message) == ErrorKind::NOT_FOUND);
    assert(message == "Table or view 'nonexistent' not found");

    // Names are bound as parameters, never spliced into the lookup
    assert(DescribeFailure(h.catalog, "x' OR '1'='1", message) == ErrorKind::NOT_FOUND);

    std::cout << "    PASSED" << std::endl;
}

void TestBlankName() {
    std::cout << "  Testing blank table name..." << std::endl;

    testing::TestStore store;
    CatalogHarness h(store);

    std::string message;
    assert(DescribeFailure(h.catalog, "   ", message) == ErrorKind::VALIDATION);
    assert(message == "table_name cannot be empty");

    std::cout << "    PASSED" << std::endl;
}

void TestQuoteIdentifier() {
    std::cout << "  Testing identifier quoting..." << std::endl;

    assert(SchemaCatalog::QuoteIdentifier("fs220") == "\"fs220\"");
    assert(SchemaCatalog::QuoteIdentifier("a\"b") == "\"a\"\"b\"");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== SchemaCatalog Unit Tests ===" << std::endl;

    std::cout << "\n1. Listing Tests:" << std::endl;
    TestListTablesAndViews();
    TestListingDescriptions();

    std::cout << "\n2. Describe Tests:" << std::endl;
    TestDescribeView();
    TestDescribeTableWithoutRecency();
    TestDescribeLargeView();
    TestCaseInsensitiveLookup();
    TestSampleRowClamp();
    TestCustomRecencyColumns();

    std::cout << "\n3. Error Tests:" << std::endl;
    TestUnknownName();
    TestBlankName();
    TestQuoteIdentifier();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
