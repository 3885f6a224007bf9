//===----------------------------------------------------------------------===//
//                         SQLGate
//
// session/session_manager.cpp
//
// Session manager implementation
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "logging/logger.hpp"
#include "logging/store_log_bridge.hpp"
#include <filesystem>
#include <stdexcept>

namespace sqlgate {

namespace {

void SetupStoreLogging(duckdb::DatabaseInstance& db) {
    if (RegisterStoreLogBridge(db, Logger::Get())) {
        LOG_DEBUG("session_manager", "Store engine log routed to the process log");
    } else {
        LOG_WARN("session_manager", "Store engine log bridge already registered");
    }
}

} // anonymous namespace

std::shared_ptr<duckdb::DuckDB> SessionManager::OpenStore(const StoreOptions& options) {
    std::error_code ec;
    if (options.path.empty() || !std::filesystem::exists(options.path, ec)) {
        throw std::runtime_error("Database not found at " + options.path +
                                 ". Provision the store file before starting the gateway.");
    }

    duckdb::DBConfig db_config;
    db_config.options.access_mode = duckdb::AccessMode::READ_ONLY;
    db_config.options.enable_external_access = options.allow_external_access;
    if (options.max_memory > 0) {
        db_config.options.maximum_memory = options.max_memory;
    }
    if (options.threads > 0) {
        db_config.options.maximum_threads = options.threads;
    }

    LOG_INFO("session_manager", "Opening store (read-only): " + options.path);
    return std::make_shared<duckdb::DuckDB>(options.path, &db_config);
}

SessionManager::SessionManager(std::shared_ptr<duckdb::DuckDB> db_p, const Config& config_p)
    : db(std::move(db_p))
    , config(config_p)
    , next_query_id(1)
    , total_sessions_created(0) {

    ConnectionPool::Config pool_config;
    pool_config.min_connections = config.pool_min_connections;
    pool_config.max_connections = config.pool_max_connections;
    pool_config.acquire_timeout = config.pool_acquire_timeout;
    pool_config.idle_timeout = config.pool_idle_timeout;

    connection_pool = std::make_unique<ConnectionPool>(db->instance, pool_config);

    SetupStoreLogging(*db->instance);

    LOG_INFO("session_manager", "Session manager initialized (pool max=" +
             std::to_string(config.pool_max_connections) + ")");
}

SessionManager::~SessionManager() {
    CancelAll(CancelReason::SHUTDOWN);

    // Sessions return their connections before the pool goes away
    sessions.clear();
    connection_pool->Shutdown();

    LOG_INFO("session_manager", "Session manager shutdown");
}

QuerySessionPtr SessionManager::CreateSession(TimePoint deadline) {
    auto connection = connection_pool->Acquire();
    if (!connection) {
        return nullptr;
    }

    uint64_t query_id = NextQueryId();
    auto session = std::make_shared<QuerySession>(query_id, std::move(connection), deadline);

    sessions.insert({query_id, session});
    total_sessions_created++;

    LOG_TRACE("session_manager", "Created session for query " + std::to_string(query_id) +
              " (active: " + std::to_string(sessions.size()) + ")");

    return session;
}

QuerySessionPtr SessionManager::GetSession(uint64_t query_id) {
    QuerySessionPtr result = nullptr;
    sessions.if_contains(query_id, [&result](const auto& item) {
        result = item.second;
    });
    return result;
}

bool SessionManager::RemoveSession(uint64_t query_id) {
    return sessions.erase(query_id) > 0;
}

bool SessionManager::CancelQuery(uint64_t query_id, CancelReason reason) {
    auto session = GetSession(query_id);
    if (!session) {
        return false;
    }
    LOG_INFO("session_manager", "Cancelling query " + std::to_string(query_id));
    session->Cancel(reason);
    return true;
}

size_t SessionManager::CancelAll(CancelReason reason) {
    std::vector<QuerySessionPtr> active;
    sessions.for_each([&active](const auto& item) {
        active.push_back(item.second);
    });

    for (auto& session : active) {
        session->Cancel(reason);
    }
    return active.size();
}

size_t SessionManager::GetActiveSessionCount() const {
    return sessions.size();
}

ConnectionPool::Stats SessionManager::GetPoolStats() const {
    return connection_pool->GetStats();
}

uint64_t SessionManager::NextQueryId() {
    return next_query_id.fetch_add(1);
}

} // namespace sqlgate
