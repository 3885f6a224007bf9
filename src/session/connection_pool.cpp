//===----------------------------------------------------------------------===//
//                         SQLGate
//
// session/connection_pool.cpp
//
// Connection pool implementation
//===----------------------------------------------------------------------===//

#include "session/connection_pool.hpp"
#include "logging/logger.hpp"

namespace sqlgate {

//===----------------------------------------------------------------------===//
// PooledConnection
//===----------------------------------------------------------------------===//

PooledConnection::PooledConnection(ConnectionPool* pool_p, duckdb::Connection* conn)
    : pool(pool_p), connection(conn) {}

PooledConnection::~PooledConnection() {
    Release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool(other.pool), connection(other.connection) {
    other.pool = nullptr;
    other.connection = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        Release();
        pool = other.pool;
        connection = other.connection;
        other.pool = nullptr;
        other.connection = nullptr;
    }
    return *this;
}

void PooledConnection::Release() {
    if (pool && connection) {
        pool->Release(connection, false);
        pool = nullptr;
        connection = nullptr;
    }
}

void PooledConnection::Discard() {
    if (pool && connection) {
        pool->Release(connection, true);
        pool = nullptr;
        connection = nullptr;
    }
}

//===----------------------------------------------------------------------===//
// ConnectionPool
//===----------------------------------------------------------------------===//

ConnectionPool::ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_instance_p,
                               const Config& config_p)
    : db_instance(std::move(db_instance_p))
    , config(config_p) {

    EnsureMinConnections();

    LOG_INFO("conn_pool", "Connection pool created with " +
             std::to_string(available.size()) + " connections " +
             "(min=" + std::to_string(config.min_connections) +
             ", max=" + std::to_string(config.max_connections) + ")");
}

ConnectionPool::~ConnectionPool() {
    Shutdown();
}

void ConnectionPool::Shutdown() {
    if (!running.exchange(false)) {
        return;
    }
    available_cv.notify_all();

    std::lock_guard<std::mutex> lock(mutex);
    size_t idle = available.size();
    total_destroyed += idle;
    available.clear();

    LOG_INFO("conn_pool", "Connection pool shutdown, " + std::to_string(idle) +
             " idle connections released, " + std::to_string(in_use.size()) + " still in use");
}

PooledConnection ConnectionPool::Acquire() {
    return Acquire(config.acquire_timeout);
}

PooledConnection ConnectionPool::Acquire(std::chrono::milliseconds timeout) {
    acquire_count++;
    auto deadline = Clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex);

    while (running) {
        if (!available.empty()) {
            auto entry = std::move(available.back());
            available.pop_back();

            entry->last_used = Clock::now();
            entry->use_count++;

            duckdb::Connection* raw_ptr = entry->connection.get();
            in_use[raw_ptr] = std::move(entry);

            LOG_TRACE("conn_pool", "Acquired connection (available=" +
                      std::to_string(available.size()) +
                      ", in_use=" + std::to_string(in_use.size()) + ")");

            return PooledConnection(this, raw_ptr);
        }

        // Grow up to max
        if (available.size() + in_use.size() < config.max_connections) {
            auto entry = CreateConnection();
            if (entry) {
                entry->use_count = 1;
                duckdb::Connection* raw_ptr = entry->connection.get();
                in_use[raw_ptr] = std::move(entry);

                LOG_DEBUG("conn_pool", "Created new connection (total=" +
                          std::to_string(in_use.size() + available.size()) + ")");

                return PooledConnection(this, raw_ptr);
            }
        }

        auto now = Clock::now();
        if (now >= deadline) {
            acquire_timeout_count++;
            LOG_WARN("conn_pool", "Connection acquire timeout after " +
                     std::to_string(timeout.count()) + "ms");
            return PooledConnection();
        }

        available_cv.wait_for(lock, deadline - now);
    }

    return PooledConnection();
}

void ConnectionPool::Release(duckdb::Connection* conn, bool discard) {
    if (!conn) return;

    std::unique_ptr<PoolEntry> entry;
    std::vector<std::unique_ptr<PoolEntry>> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex);

        auto it = in_use.find(conn);
        if (it == in_use.end()) {
            LOG_WARN("conn_pool", "Releasing unknown connection");
            return;
        }

        entry = std::move(it->second);
        in_use.erase(it);

        if (running && !discard) {
            entry->last_used = Clock::now();
            // LIFO: Acquire pops from the back, so the front holds the longest idle
            available.push_back(std::move(entry));
            available_cv.notify_one();
            CollectIdle(evicted);
        } else {
            total_destroyed++;
            if (discard) {
                total_discarded++;
            }
            // A discarded slot frees capacity for a fresh connection
            available_cv.notify_one();
        }
    }

    if (!evicted.empty()) {
        LOG_DEBUG("conn_pool", "Closed " + std::to_string(evicted.size()) + " idle connections");
        evicted.clear();
    }
    if (!entry) {
        return;
    }

    // Destroy outside the lock, the destructor may wait on engine cleanup
    entry.reset();
    LOG_DEBUG("conn_pool", discard ? "Discarded connection after cancellation"
                                   : "Destroyed connection returned during shutdown");
}

void ConnectionPool::CollectIdle(std::vector<std::unique_ptr<PoolEntry>>& evicted) {
    auto cutoff = Clock::now() - config.idle_timeout;
    while (available.size() + in_use.size() > config.min_connections && !available.empty() &&
           available.front()->last_used < cutoff) {
        evicted.push_back(std::move(available.front()));
        available.erase(available.begin());
        total_destroyed++;
    }
}

std::unique_ptr<ConnectionPool::PoolEntry> ConnectionPool::CreateConnection() {
    try {
        auto conn = std::make_unique<duckdb::Connection>(*db_instance);
        total_created++;
        return std::make_unique<PoolEntry>(std::move(conn));
    } catch (const std::exception& e) {
        LOG_ERROR("conn_pool", "Failed to create connection: " + std::string(e.what()));
        return nullptr;
    }
}

void ConnectionPool::EnsureMinConnections() {
    std::lock_guard<std::mutex> lock(mutex);

    while (available.size() < config.min_connections) {
        auto entry = CreateConnection();
        if (!entry) {
            LOG_WARN("conn_pool", "Failed to create minimum connections, only " +
                     std::to_string(available.size()) + " created");
            break;
        }
        available.push_back(std::move(entry));
    }
}

ConnectionPool::Stats ConnectionPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex);

    Stats stats;
    stats.total_created = total_created.load();
    stats.total_destroyed = total_destroyed.load();
    stats.total_discarded = total_discarded.load();
    stats.current_size = available.size() + in_use.size();
    stats.available = available.size();
    stats.in_use = in_use.size();
    stats.acquire_count = acquire_count.load();
    stats.acquire_timeout_count = acquire_timeout_count.load();

    return stats;
}

} // namespace sqlgate
