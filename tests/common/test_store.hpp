//===----------------------------------------------------------------------===//
//                         SQLGate - Tests
//
// tests/common/test_store.hpp
//
// Small credit union store written to a temporary file. Tests reopen it
// read-only the same way the gateway does.
//===----------------------------------------------------------------------===//

#pragma once

#include "session/session_manager.hpp"
#include "duckdb.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace sqlgate {
namespace testing {

constexpr int64_t LARGE_VIEW_ROWS = 50000;
constexpr int64_t CREDIT_UNIONS = 8;

// Deliberately slow: a 10^10 row cross product the engine cannot shortcut
constexpr const char* LONG_RUNNING_QUERY =
    "SELECT SUM(a.range * b.range) FROM range(100000) a, range(100000) b";

class TestStore {
public:
    TestStore() {
        static int counter = 0;
        path_ = (std::filesystem::temp_directory_path() /
                 ("sqlgate_test_" + std::to_string(getpid()) + "_" +
                  std::to_string(counter++) + ".duckdb")).string();
        Remove();

        duckdb::DuckDB db(path_);
        duckdb::Connection conn(db);
        for (const char* sql : Statements()) {
            auto result = conn.Query(sql);
            if (result->HasError()) {
                throw std::runtime_error("Fixture setup failed: " + result->GetError());
            }
        }
    }

    ~TestStore() { Remove(); }

    TestStore(const TestStore&) = delete;
    TestStore& operator=(const TestStore&) = delete;

    const std::string& Path() const { return path_; }

    std::shared_ptr<duckdb::DuckDB> OpenReadOnly() const {
        StoreOptions options;
        options.path = path_;
        return SessionManager::OpenStore(options);
    }

private:
    static const std::vector<const char*>& Statements() {
        static const std::vector<const char*> statements = {
            "CREATE TABLE acctdesc (account VARCHAR, description VARCHAR)",
            "INSERT INTO acctdesc VALUES "
            "('ACCT_010', 'Cash and cash equivalents'), "
            "('ACCT_018', 'Total shares and deposits'), "
            "('ACCT_025B', 'Total loans and leases'), "
            "('ACCT_083', 'Number of current members'), "
            "('ACCT_661A', 'Net income')",

            "CREATE TABLE foicu AS "
            "SELECT 1000 + i AS cu_number, d AS cycle_date, "
            "       'Credit Union ' || i AS cu_name, "
            "       CASE WHEN i % 2 = 0 THEN 'CA' ELSE 'TX' END AS state "
            "FROM range(1, 9) t(i), "
            "     (VALUES (DATE '2024-03-31'), (DATE '2024-06-30')) dates(d)",

            "CREATE TABLE fs220 AS "
            "SELECT cu_number, cycle_date, "
            "       1000000.0 * (cu_number - 999) AS assets, "
            "       12000.0 * (cu_number - 999) AS net_income, "
            "       30000.0 * (cu_number - 999) AS operating_expense, "
            "       45000.0 * (cu_number - 999) AS revenue, "
            "       500 * (cu_number - 999) AS member_count "
            "FROM foicu",

            "CREATE VIEW cu_with_ratios AS "
            "SELECT f.cu_number, f.cycle_date, f.cu_name, f.state, s.assets, s.member_count, "
            "       ROUND(s.net_income / s.assets * 100, 4) AS roa, "
            "       ROUND(s.operating_expense / s.revenue * 100, 2) AS efficiency_ratio "
            "FROM foicu f JOIN fs220 s "
            "  ON f.cu_number = s.cu_number AND f.cycle_date = s.cycle_date",

            "CREATE VIEW member_history AS "
            "SELECT range AS n, range % 97 AS bucket FROM range(50000)",
        };
        return statements;
    }

    void Remove() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_ + ".wal", ec);
    }

    std::string path_;
};

} // namespace testing
} // namespace sqlgate
