//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/query_gateway.cpp
//
// Query gateway implementation
//===----------------------------------------------------------------------===//

#include "gateway/query_gateway.hpp"
#include "gateway/error_translator.hpp"
#include "executor/executor_pool.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace sqlgate {

namespace {

std::shared_ptr<duckdb::DuckDB> OpenConfiguredStore(const GatewayConfig& config) {
    StoreOptions options;
    options.path = config.database_path;
    options.max_memory = config.max_memory;
    options.threads = config.engine_threads;
    options.allow_external_access = config.allow_external_access;
    return SessionManager::OpenStore(options);
}

bool IsUnexpected(const std::exception& e) {
    return !dynamic_cast<const GatewayException*>(&e) && !ErrorTranslator::IsEngineException(e);
}

} // anonymous namespace

QueryGateway::QueryGateway(const GatewayConfig& config_p)
    : config(config_p)
    , validator(config_p.extra_forbidden_keywords) {
    Build(OpenConfiguredStore(config));
}

QueryGateway::QueryGateway(std::shared_ptr<duckdb::DuckDB> db, const GatewayConfig& config_p)
    : config(config_p)
    , validator(config_p.extra_forbidden_keywords) {
    Build(std::move(db));
}

QueryGateway::~QueryGateway() {
    Stop();
}

void QueryGateway::Build(std::shared_ptr<duckdb::DuckDB> db) {
    SessionManager::Config session_config;
    session_config.pool_min_connections = config.pool_min_connections;
    session_config.pool_max_connections = config.pool_max_connections;
    session_config.pool_acquire_timeout = std::chrono::milliseconds(config.pool_acquire_timeout_ms);
    session_config.pool_idle_timeout = std::chrono::seconds(config.pool_idle_timeout_seconds);
    sessions = std::make_unique<SessionManager>(std::move(db), session_config);

    executor = std::make_unique<ExecutorPool>(config.GetExecutorThreadCount());

    ExecutionCoordinator::Config coordinator_config;
    coordinator_config.query_timeout = std::chrono::milliseconds(config.query_timeout_ms);
    coordinator_config.cancel_grace = std::chrono::milliseconds(config.cancel_grace_ms);
    coordinator_config.max_rows = config.max_rows;
    coordinator = std::make_unique<ExecutionCoordinator>(*sessions, *executor, coordinator_config);

    CatalogMetadata metadata = CatalogMetadata::Defaults();
    if (!config.catalog_file.empty()) {
        std::string error;
        if (!metadata.LoadOverrides(config.catalog_file, error)) {
            throw std::runtime_error("Catalog metadata: " + error);
        }
    }

    examples = std::make_unique<ExampleQueryCatalog>(metadata.examples, metadata.examples_note);

    SchemaCatalog::Config catalog_config;
    catalog_config.sample_rows = config.sample_rows;
    catalog_config.recency_columns = config.recency_columns;
    catalog = std::make_unique<SchemaCatalog>(*coordinator, std::move(metadata), catalog_config);
}

void QueryGateway::Start() {
    executor->Start();
    LOG_INFO("gateway", "Gateway ready (timeout=" + std::to_string(config.query_timeout_ms) +
             "ms, max_rows=" + std::to_string(config.max_rows) + ")");
}

void QueryGateway::Stop() {
    if (!executor || !executor->IsRunning()) {
        return;
    }
    size_t cancelled = sessions->CancelAll(CancelReason::SHUTDOWN);
    executor->Stop();
    LOG_INFO("gateway", "Gateway stopped (" + std::to_string(cancelled) +
             " in-flight queries cancelled)");
}

ErrorReport QueryGateway::Fail(const std::string& operation, const std::exception& e) {
    ErrorReport report = ErrorTranslator::FromException(e);
    if (IsUnexpected(e)) {
        LOG_ERROR("gateway", operation + " unexpected failure: " + std::string(e.what()));
    } else {
        LOG_WARN("gateway", operation + " " + ErrorKindToString(report.kind) + ": " + report.message);
    }
    return report;
}

GatewayResponse<ResultSet> QueryGateway::ExecuteSql(const std::string& query) {
    GatewayResponse<ResultSet> response;
    QueryRequest request;
    request.sql = query;
    request.submitted_at = Clock::now();

    auto verdict = validator.Validate(query);
    if (!verdict.accepted) {
        validation_rejections++;
        response.error = ErrorTranslator::FromVerdict(verdict);
        LOG_WARN("gateway", std::string("execute_sql rejected (") +
                 ValidationRuleToString(verdict.rule) + "): " + verdict.reason);
        Audit(request, response);
        return response;
    }

    try {
        response.value = coordinator->Execute(request);
    } catch (const std::exception& e) {
        response.error = Fail("execute_sql", e);
    }
    Audit(request, response);
    return response;
}

void QueryGateway::Audit(const QueryRequest& request, const GatewayResponse<ResultSet>& response) {
    if (!Logger::IsAuditEnabled()) {
        return;
    }
    AuditEvent event;
    event.sql = request.sql;
    event.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - request.submitted_at).count();
    if (response.Ok()) {
        event.outcome = "ok";
        event.row_count = response.value.row_count;
        event.truncated = response.value.truncated;
    } else {
        event.outcome = ErrorKindToString(response.error->kind);
        event.message = response.error->message;
    }
    Logger::Audit(event);
}

GatewayResponse<SchemaResponse> QueryGateway::GetSchema(const std::optional<std::string>& table_name) {
    GatewayResponse<SchemaResponse> response;
    schema_requests++;

    try {
        if (!table_name || table_name->empty()) {
            response.value.is_listing = true;
            response.value.listing = catalog->List();
        } else {
            response.value.is_listing = false;
            response.value.descriptor = catalog->Describe(*table_name);
        }
    } catch (const std::exception& e) {
        response.error = Fail("get_schema", e);
    }
    return response;
}

GatewayResponse<ExampleQueryResult> QueryGateway::GetExampleQueries(
    const std::optional<std::string>& category) {
    GatewayResponse<ExampleQueryResult> response;
    example_requests++;

    try {
        response.value = examples->Get(category.value_or(""));
    } catch (const std::exception& e) {
        response.error = Fail("get_example_queries", e);
    }
    return response;
}

bool QueryGateway::CancelQuery(uint64_t query_id) {
    return coordinator->Cancel(query_id);
}

GatewayMetrics QueryGateway::GetMetrics() const {
    GatewayMetrics metrics;
    metrics.pool = sessions->GetPoolStats();
    metrics.queries = coordinator->GetStats();
    metrics.active_sessions = sessions->GetActiveSessionCount();
    metrics.executor_threads = executor->Size();
    metrics.executor_pending = executor->PendingTasks();
    metrics.validation_rejections = validation_rejections;
    metrics.schema_requests = schema_requests;
    metrics.example_requests = example_requests;
    return metrics;
}

std::string QueryGateway::RenderMetrics() const {
    GatewayMetrics m = GetMetrics();
    std::ostringstream out;

    auto write = [&out](const char* name, const char* type, const char* help, uint64_t value) {
        out << "# HELP " << name << " " << help << "\n"
            << "# TYPE " << name << " " << type << "\n"
            << name << " " << value << "\n";
    };

    write("sqlgate_queries_total", "counter", "Statements submitted to the store", m.queries.queries_total);
    write("sqlgate_queries_succeeded_total", "counter", "Statements that completed", m.queries.queries_succeeded);
    write("sqlgate_queries_failed_total", "counter", "Statements rejected by the engine", m.queries.queries_failed);
    write("sqlgate_queries_timed_out_total", "counter", "Statements cancelled at the deadline", m.queries.queries_timed_out);
    write("sqlgate_queries_truncated_total", "counter", "Result sets cut at the row cap", m.queries.queries_truncated);
    write("sqlgate_rows_returned_total", "counter", "Rows returned to callers", m.queries.rows_returned);
    write("sqlgate_validation_rejections_total", "counter", "Statements refused before execution", m.validation_rejections);
    write("sqlgate_schema_requests_total", "counter", "get_schema calls", m.schema_requests);
    write("sqlgate_example_requests_total", "counter", "get_example_queries calls", m.example_requests);
    write("sqlgate_sessions_active", "gauge", "Statements currently holding a connection", m.active_sessions);
    write("sqlgate_executor_threads", "gauge", "Executor worker threads", m.executor_threads);
    write("sqlgate_executor_pending", "gauge", "Tasks waiting for a worker", m.executor_pending);
    write("sqlgate_pool_connections", "gauge", "Open store connections", m.pool.current_size);
    write("sqlgate_pool_connections_available", "gauge", "Idle store connections", m.pool.available);
    write("sqlgate_pool_connections_in_use", "gauge", "Checked out store connections", m.pool.in_use);
    write("sqlgate_pool_created_total", "counter", "Store connections opened", m.pool.total_created);
    write("sqlgate_pool_discarded_total", "counter", "Connections dropped after cancellation", m.pool.total_discarded);
    write("sqlgate_pool_acquire_timeouts_total", "counter", "Connection checkouts that timed out", m.pool.acquire_timeout_count);

    return out.str();
}

std::string QueryGateway::RenderHealth() const {
    GatewayMetrics m = GetMetrics();
    nlohmann::json health = {
        {"status", executor->IsRunning() ? "healthy" : "stopping"},
        {"store", config.database_path},
        {"active_sessions", m.active_sessions},
        {"pool_available", m.pool.available},
        {"pool_in_use", m.pool.in_use},
    };
    return health.dump();
}

} // namespace sqlgate
