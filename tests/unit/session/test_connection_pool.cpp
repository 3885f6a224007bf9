//===----------------------------------------------------------------------===//
//                         SQLGate - Unit Tests
//
// tests/unit/session/test_connection_pool.cpp
//
// Unit tests for ConnectionPool
//===----------------------------------------------------------------------===//

#include "session/connection_pool.hpp"
#include "duckdb.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <atomic>
#include <chrono>
#include <vector>

using namespace sqlgate;

// Helper: create in-memory DuckDB instance
static duckdb::shared_ptr<duckdb::DatabaseInstance> CreateDB() {
    auto db = std::make_unique<duckdb::DuckDB>(nullptr);
    return db->instance;
}

static ConnectionPool::Config PoolConfig(size_t min, size_t max) {
    ConnectionPool::Config config;
    config.min_connections = min;
    config.max_connections = max;
    return config;
}

//===----------------------------------------------------------------------===//
// Construction Tests
//===----------------------------------------------------------------------===//

void TestPoolDefaultConstruction() {
    std::cout << "  Testing default construction..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db);

    auto stats = pool.GetStats();
    // Default min_connections = 2
    assert(stats.current_size == 2);
    assert(stats.available == 2);
    assert(stats.in_use == 0);
    assert(stats.total_created == 2);

    auto& cfg = pool.GetConfig();
    assert(cfg.max_connections == 16);
    assert(cfg.acquire_timeout == std::chrono::milliseconds(2000));
    assert(cfg.idle_timeout == std::chrono::seconds(300));

    std::cout << "    PASSED (created " << stats.current_size << " connections)" << std::endl;
}

void TestPoolZeroMinConnections() {
    std::cout << "  Testing zero min connections..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(0, 5));

    auto stats = pool.GetStats();
    assert(stats.current_size == 0);
    assert(stats.available == 0);

    // Grows on demand
    auto conn = pool.Acquire();
    assert(static_cast<bool>(conn));
    assert(pool.GetStats().total_created == 1);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Acquire/Release Tests
//===----------------------------------------------------------------------===//

void TestAcquireRelease() {
    std::cout << "  Testing Acquire/Release..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(2, 10));

    {
        auto conn = pool.Acquire();
        assert(static_cast<bool>(conn));
        assert(conn.Get() != nullptr);

        auto stats = pool.GetStats();
        assert(stats.in_use == 1);
        assert(stats.acquire_count == 1);

        auto result = conn->Query("SELECT 42 AS answer");
        assert(!result->HasError());
    }
    // conn released by RAII

    auto stats = pool.GetStats();
    assert(stats.in_use == 0);
    assert(stats.available == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestAcquireMaxLimit() {
    std::cout << "  Testing Acquire at max limit..." << std::endl;

    auto db = CreateDB();
    auto config = PoolConfig(1, 3);
    config.acquire_timeout = std::chrono::milliseconds(100);
    ConnectionPool pool(db, config);

    std::vector<PooledConnection> connections;
    for (int i = 0; i < 3; i++) {
        auto conn = pool.Acquire();
        assert(static_cast<bool>(conn));
        connections.push_back(std::move(conn));
    }
    assert(pool.GetStats().in_use == 3);

    // Next acquire times out and returns empty
    auto start = std::chrono::steady_clock::now();
    auto conn = pool.Acquire(std::chrono::milliseconds(50));
    auto waited = std::chrono::steady_clock::now() - start;
    assert(!static_cast<bool>(conn));
    assert(waited >= std::chrono::milliseconds(50));
    assert(pool.GetStats().acquire_timeout_count == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestAcquireWaitsForRelease() {
    std::cout << "  Testing Acquire waits for a release..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(1, 1));

    auto held = pool.Acquire();
    assert(static_cast<bool>(held));

    std::thread releaser([&held]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        held.Release();
    });

    auto conn = pool.Acquire(std::chrono::milliseconds(2000));
    releaser.join();
    assert(static_cast<bool>(conn));
    assert(pool.GetStats().acquire_timeout_count == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestManualRelease() {
    std::cout << "  Testing manual Release..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(1, 5));

    auto conn = pool.Acquire();
    assert(static_cast<bool>(conn));
    assert(pool.GetStats().in_use == 1);

    conn.Release();
    assert(!static_cast<bool>(conn));
    assert(conn.Get() == nullptr);
    assert(pool.GetStats().in_use == 0);

    // Second release is a no-op
    conn.Release();

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Discard Tests
//===----------------------------------------------------------------------===//

void TestDiscard() {
    std::cout << "  Testing Discard destroys the connection..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(1, 5));

    {
        auto conn = pool.Acquire();
        conn.Discard();
        assert(!static_cast<bool>(conn));
    }

    auto stats = pool.GetStats();
    assert(stats.in_use == 0);
    assert(stats.available == 0);
    assert(stats.total_discarded == 1);
    assert(stats.total_destroyed == 1);

    // A fresh connection takes the freed slot
    auto next = pool.Acquire();
    assert(static_cast<bool>(next));
    assert(pool.GetStats().total_created == 2);
    auto result = next->Query("SELECT 1");
    assert(!result->HasError());

    std::cout << "    PASSED" << std::endl;
}

void TestDiscardFreesCapacity() {
    std::cout << "  Testing Discard wakes a waiting Acquire..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(1, 1));

    auto held = pool.Acquire();
    std::thread discarder([&held]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        held.Discard();
    });

    auto conn = pool.Acquire(std::chrono::milliseconds(2000));
    discarder.join();
    assert(static_cast<bool>(conn));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// PooledConnection Move Semantics Tests
//===----------------------------------------------------------------------===//

void TestPooledConnectionMove() {
    std::cout << "  Testing PooledConnection move semantics..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(1, 5));

    auto conn1 = pool.Acquire();
    assert(static_cast<bool>(conn1));

    auto conn2 = std::move(conn1);
    assert(static_cast<bool>(conn2));
    assert(!static_cast<bool>(conn1));

    PooledConnection conn3;
    assert(!static_cast<bool>(conn3));
    conn3 = std::move(conn2);
    assert(static_cast<bool>(conn3));
    assert(!static_cast<bool>(conn2));

    assert(pool.GetStats().in_use == 1);

    conn3.Release();
    assert(pool.GetStats().in_use == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestPooledConnectionDefaultConstruct() {
    std::cout << "  Testing PooledConnection default construction..." << std::endl;

    PooledConnection conn;
    assert(!static_cast<bool>(conn));
    assert(conn.Get() == nullptr);

    // Release and Discard on empty should be safe
    conn.Release();
    conn.Discard();

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Idle Eviction Tests
//===----------------------------------------------------------------------===//

void TestIdleEviction() {
    std::cout << "  Testing idle connections above min are closed..." << std::endl;

    auto db = CreateDB();
    auto config = PoolConfig(1, 5);
    config.idle_timeout = std::chrono::seconds(0);
    ConnectionPool pool(db, config);

    std::vector<PooledConnection> connections;
    for (int i = 0; i < 3; i++) {
        connections.push_back(pool.Acquire());
    }
    assert(pool.GetStats().current_size == 3);

    for (auto& conn : connections) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        conn.Release();
    }

    auto stats = pool.GetStats();
    assert(stats.current_size == 1);
    assert(stats.total_destroyed >= 2);
    assert(stats.total_discarded == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestNoEvictionBeforeTimeout() {
    std::cout << "  Testing idle connections kept within the timeout..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(1, 5));

    {
        std::vector<PooledConnection> connections;
        for (int i = 0; i < 3; i++) {
            connections.push_back(pool.Acquire());
        }
    }

    auto stats = pool.GetStats();
    assert(stats.current_size == 3);
    assert(stats.available == 3);
    assert(stats.total_destroyed == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Concurrent Access Tests
//===----------------------------------------------------------------------===//

void TestConcurrentAcquireRelease() {
    std::cout << "  Testing concurrent Acquire/Release..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(2, 8));

    const int num_threads = 8;
    const int ops_per_thread = 50;
    std::atomic<int> completed{0};
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < ops_per_thread; i++) {
                auto conn = pool.Acquire();
                if (!conn) {
                    errors++;
                    continue;
                }
                auto result = conn->Query("SELECT 1");
                if (result->HasError()) {
                    errors++;
                }
                completed++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    assert(errors == 0);
    assert(completed == num_threads * ops_per_thread);

    auto stats = pool.GetStats();
    assert(stats.in_use == 0);
    assert(stats.current_size <= 8);
    assert(stats.acquire_count == static_cast<size_t>(num_threads * ops_per_thread));

    std::cout << "    PASSED (" << completed.load() << " operations, 0 errors)" << std::endl;
}

//===----------------------------------------------------------------------===//
// Shutdown Tests
//===----------------------------------------------------------------------===//

void TestPoolShutdown() {
    std::cout << "  Testing Shutdown..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(3, 10));

    auto conn1 = pool.Acquire();
    assert(static_cast<bool>(conn1));

    pool.Shutdown();
    pool.Shutdown();

    auto conn2 = pool.Acquire(std::chrono::milliseconds(50));
    assert(!static_cast<bool>(conn2));

    // Connection returned after shutdown is destroyed, not pooled
    conn1.Release();
    auto stats = pool.GetStats();
    assert(stats.available == 0);
    assert(stats.in_use == 0);
    assert(stats.total_destroyed == 3);
    assert(stats.total_discarded == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Connection Reuse Tests
//===----------------------------------------------------------------------===//

void TestConnectionReuse() {
    std::cout << "  Testing connection reuse (LIFO)..." << std::endl;

    auto db = CreateDB();
    ConnectionPool pool(db, PoolConfig(1, 5));

    duckdb::Connection* raw_ptr;
    {
        auto conn = pool.Acquire();
        raw_ptr = conn.Get();
    }

    {
        auto conn = pool.Acquire();
        assert(conn.Get() == raw_ptr);
    }

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ConnectionPool Unit Tests ===" << std::endl;

    std::cout << "\n1. Construction Tests:" << std::endl;
    TestPoolDefaultConstruction();
    TestPoolZeroMinConnections();

    std::cout << "\n2. Acquire/Release Tests:" << std::endl;
    TestAcquireRelease();
    TestAcquireMaxLimit();
    TestAcquireWaitsForRelease();
    TestManualRelease();

    std::cout << "\n3. Discard Tests:" << std::endl;
    TestDiscard();
    TestDiscardFreesCapacity();

    std::cout << "\n4. PooledConnection Tests:" << std::endl;
    TestPooledConnectionMove();
    TestPooledConnectionDefaultConstruct();

    std::cout << "\n5. Idle Eviction Tests:" << std::endl;
    TestIdleEviction();
    TestNoEvictionBeforeTimeout();

    std::cout << "\n6. Concurrent Access:" << std::endl;
    TestConcurrentAcquireRelease();

    std::cout << "\n7. Shutdown:" << std::endl;
    TestPoolShutdown();

    std::cout << "\n8. Connection Reuse:" << std::endl;
    TestConnectionReuse();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
