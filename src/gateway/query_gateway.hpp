//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/query_gateway.hpp
//
// The three tool operations: execute_sql, get_schema, get_example_queries
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/gateway_config.hpp"
#include "gateway/gateway_error.hpp"
#include "gateway/statement_validator.hpp"
#include "gateway/execution_coordinator.hpp"
#include "catalog/schema_catalog.hpp"
#include "catalog/example_queries.hpp"
#include "session/connection_pool.hpp"
#include <optional>

namespace sqlgate {

class SessionManager;
class ExecutorPool;

// Either a value or the translated error, never both
template <typename T>
struct GatewayResponse {
    T value;
    std::optional<ErrorReport> error;

    bool Ok() const { return !error.has_value(); }
};

struct SchemaResponse {
    bool is_listing = true;
    SchemaListingResult listing;
    SchemaDescriptor descriptor;
};

struct GatewayMetrics {
    ConnectionPool::Stats pool;
    ExecutionCoordinator::Stats queries;
    size_t active_sessions = 0;
    size_t executor_threads = 0;
    size_t executor_pending = 0;
    uint64_t validation_rejections = 0;
    uint64_t schema_requests = 0;
    uint64_t example_requests = 0;
};

class QueryGateway {
public:
    // Opens the store named by config.database_path. Throws std::runtime_error
    // if the store or the catalog metadata file cannot be opened.
    explicit QueryGateway(const GatewayConfig& config_p);
    QueryGateway(std::shared_ptr<duckdb::DuckDB> db, const GatewayConfig& config_p);
    ~QueryGateway();

    QueryGateway(const QueryGateway&) = delete;
    QueryGateway& operator=(const QueryGateway&) = delete;

    void Start();

    // Cancels in-flight statements and joins the executor threads
    void Stop();

    GatewayResponse<ResultSet> ExecuteSql(const std::string& query);

    // No name or an empty one lists the catalog
    GatewayResponse<SchemaResponse> GetSchema(const std::optional<std::string>& table_name = std::nullopt);

    GatewayResponse<ExampleQueryResult> GetExampleQueries(
        const std::optional<std::string>& category = std::nullopt);

    bool CancelQuery(uint64_t query_id);

    GatewayMetrics GetMetrics() const;

    // Prometheus text exposition of GetMetrics()
    std::string RenderMetrics() const;
    // JSON health document
    std::string RenderHealth() const;

    const GatewayConfig& GetConfig() const { return config; }
    const StatementValidator& GetValidator() const { return validator; }

private:
    void Build(std::shared_ptr<duckdb::DuckDB> db);
    ErrorReport Fail(const std::string& operation, const std::exception& e);
    void Audit(const QueryRequest& request, const GatewayResponse<ResultSet>& response);

private:
    GatewayConfig config;

    // Declaration order matters: the executor is torn down before the
    // sessions whose connections its workers may still hold
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<ExecutorPool> executor;
    std::unique_ptr<ExecutionCoordinator> coordinator;
    std::unique_ptr<SchemaCatalog> catalog;
    std::unique_ptr<ExampleQueryCatalog> examples;
    StatementValidator validator;

    std::atomic<uint64_t> validation_rejections{0};
    std::atomic<uint64_t> schema_requests{0};
    std::atomic<uint64_t> example_requests{0};
};

} // namespace sqlgate
