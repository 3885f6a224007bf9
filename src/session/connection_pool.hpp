//===----------------------------------------------------------------------===//
//                         SQLGate
//
// session/connection_pool.hpp
//
// Pool of connections (cursors) over the shared read-only store handle
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "duckdb.hpp"
#include <parallel_hashmap/phmap.h>
#include <vector>
#include <condition_variable>
#include <atomic>

namespace sqlgate {

//===----------------------------------------------------------------------===//
// Pooled Connection - RAII wrapper that returns connection to pool
//===----------------------------------------------------------------------===//

class ConnectionPool;

class PooledConnection {
public:
    PooledConnection() : pool(nullptr), connection(nullptr) {}
    PooledConnection(ConnectionPool* pool_p, duckdb::Connection* conn);
    ~PooledConnection();

    // Move only
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    duckdb::Connection* Get() const { return connection; }
    duckdb::Connection* operator->() const { return connection; }
    duckdb::Connection& operator*() const { return *connection; }

    explicit operator bool() const { return connection != nullptr; }

    // Return to the pool for reuse (called automatically by destructor)
    void Release();

    // Hand back and destroy instead of reusing. Used after an interrupt so a
    // cancelled connection never serves another request.
    void Discard();

private:
    ConnectionPool* pool;
    duckdb::Connection* connection;
};

//===----------------------------------------------------------------------===//
// Connection Pool
//===----------------------------------------------------------------------===//

class ConnectionPool {
public:
    struct Config {
        size_t min_connections;
        size_t max_connections;
        std::chrono::milliseconds acquire_timeout;
        std::chrono::seconds idle_timeout;  // idle connections above min are closed after this

        Config()
            : min_connections(2)
            , max_connections(16)
            , acquire_timeout(2000)
            , idle_timeout(300) {}
    };

    struct Stats {
        size_t total_created = 0;
        size_t total_destroyed = 0;
        size_t total_discarded = 0;
        size_t current_size = 0;
        size_t available = 0;
        size_t in_use = 0;
        size_t acquire_count = 0;
        size_t acquire_timeout_count = 0;
    };

    explicit ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_instance_p,
                           const Config& config_p = Config{});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Returns an empty PooledConnection on timeout or shutdown; never blocks
    // longer than the timeout
    PooledConnection Acquire();
    PooledConnection Acquire(std::chrono::milliseconds timeout);

    Stats GetStats() const;
    const Config& GetConfig() const { return config; }

    // Stop handing out connections and drop idle ones. Connections still
    // checked out are destroyed as they come back.
    void Shutdown();

private:
    friend class PooledConnection;

    struct PoolEntry {
        std::unique_ptr<duckdb::Connection> connection;
        TimePoint last_used;
        uint64_t use_count = 0;

        explicit PoolEntry(std::unique_ptr<duckdb::Connection> conn)
            : connection(std::move(conn))
            , last_used(Clock::now()) {}
    };

    void Release(duckdb::Connection* conn, bool discard);
    std::unique_ptr<PoolEntry> CreateConnection();
    // Caller holds mutex; evicted entries are moved out to be destroyed unlocked
    void CollectIdle(std::vector<std::unique_ptr<PoolEntry>>& evicted);
    void EnsureMinConnections();

private:
    duckdb::shared_ptr<duckdb::DatabaseInstance> db_instance;
    Config config;

    std::vector<std::unique_ptr<PoolEntry>> available;
    phmap::flat_hash_map<duckdb::Connection*, std::unique_ptr<PoolEntry>> in_use;
    mutable std::mutex mutex;
    std::condition_variable available_cv;

    std::atomic<size_t> total_created{0};
    std::atomic<size_t> total_destroyed{0};
    std::atomic<size_t> total_discarded{0};
    std::atomic<size_t> acquire_count{0};
    std::atomic<size_t> acquire_timeout_count{0};

    std::atomic<bool> running{true};
};

} // namespace sqlgate
