//===----------------------------------------------------------------------===//
//                         SQLGate
//
// session/session_manager.hpp
//
// Owns the process-wide read-only store handle, its connection pool and the
// registry of in-flight query sessions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/query_session.hpp"
#include "session/connection_pool.hpp"
#include "duckdb.hpp"
#include <parallel_hashmap/phmap.h>

namespace sqlgate {

struct StoreOptions {
    std::string path;
    uint64_t max_memory = 0;       // bytes, 0 = engine default
    uint32_t threads = 0;          // 0 = engine default
    bool allow_external_access = false;
};

class SessionManager {
public:
    struct Config {
        size_t pool_min_connections;
        size_t pool_max_connections;
        std::chrono::milliseconds pool_acquire_timeout;
        std::chrono::seconds pool_idle_timeout;

        Config()
            : pool_min_connections(2)
            , pool_max_connections(16)
            , pool_acquire_timeout(2000)
            , pool_idle_timeout(300) {}
    };

    // Opens the store file once in read-only mode. Throws std::runtime_error if
    // the file does not exist or the engine refuses to open it.
    static std::shared_ptr<duckdb::DuckDB> OpenStore(const StoreOptions& options);

    explicit SessionManager(std::shared_ptr<duckdb::DuckDB> db_p,
                           const Config& config_p = Config{});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Acquire a connection and register a session that must finish by
    // deadline. Returns nullptr if no connection became available within the
    // pool acquire timeout.
    QuerySessionPtr CreateSession(TimePoint deadline);

    QuerySessionPtr GetSession(uint64_t query_id);

    bool RemoveSession(uint64_t query_id);

    // Interrupt an in-flight query by id
    bool CancelQuery(uint64_t query_id, CancelReason reason = CancelReason::REQUESTED);

    // Interrupt everything in flight
    size_t CancelAll(CancelReason reason);

    size_t GetActiveSessionCount() const;
    uint64_t GetTotalSessionsCreated() const { return total_sessions_created; }

    ConnectionPool::Stats GetPoolStats() const;

    duckdb::DuckDB& GetDatabase() { return *db; }
    ConnectionPool& GetConnectionPool() { return *connection_pool; }

private:
    uint64_t NextQueryId();

private:
    std::shared_ptr<duckdb::DuckDB> db;
    std::unique_ptr<ConnectionPool> connection_pool;

    // Sharded map, N=4 means 2^4=16 submaps
    phmap::parallel_flat_hash_map<
        uint64_t,
        QuerySessionPtr,
        phmap::priv::hash_default_hash<uint64_t>,
        phmap::priv::hash_default_eq<uint64_t>,
        phmap::priv::Allocator<phmap::priv::Pair<const uint64_t, QuerySessionPtr>>,
        4,
        std::mutex
    > sessions;

    Config config;

    std::atomic<uint64_t> next_query_id;
    std::atomic<uint64_t> total_sessions_created;
};

} // namespace sqlgate
