//===----------------------------------------------------------------------===//
//                         SQLGate
//
// session/query_session.hpp
//
// Execution session: one pooled connection, a deadline and a cancel signal,
// scoped to a single request
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/connection_pool.hpp"

namespace sqlgate {

enum class CancelReason : uint8_t {
    NONE = 0,
    DEADLINE,   // query timeout elapsed
    REQUESTED,  // explicit cancel by query id
    SHUTDOWN
};

class QuerySession {
public:
    using Ptr = std::shared_ptr<QuerySession>;

    QuerySession(uint64_t query_id_p, PooledConnection connection_p, TimePoint deadline_p);
    ~QuerySession();

    QuerySession(const QuerySession&) = delete;
    QuerySession& operator=(const QuerySession&) = delete;

    uint64_t GetQueryId() const { return query_id; }
    TimePoint GetCreatedAt() const { return created_at; }
    TimePoint GetDeadline() const { return deadline; }

    // Throws std::runtime_error once the connection has been released
    duckdb::Connection& GetConnection();

    bool IsCancelRequested() const { return cancel_reason.load() != CancelReason::NONE; }
    CancelReason GetCancelReason() const { return cancel_reason.load(); }

    // Sets the cancel signal and interrupts the running statement. Only the
    // first reason is kept.
    void Cancel(CancelReason reason);

    // Repeats the interrupt of a cancelled session. The engine clears a
    // pending interrupt when a statement begins, so one issued just before
    // the worker reached the engine is lost.
    void Reinterrupt();

    // Returns false without marking the start if the session was already
    // cancelled, e.g. while its task sat in the executor queue
    bool TryMarkQueryStart();
    void MarkQueryEnd() { query_running.store(false, std::memory_order_release); }
    bool IsQueryRunning() const { return query_running.load(std::memory_order_acquire); }

    // Returns the connection to the pool, or discards it if the session was
    // cancelled. Safe to call more than once; the destructor calls it too.
    void ReleaseConnection();

private:
    uint64_t query_id;
    TimePoint created_at;
    TimePoint deadline;

    PooledConnection connection;
    std::mutex connection_mutex;

    std::atomic<CancelReason> cancel_reason{CancelReason::NONE};
    std::atomic<bool> query_running{false};
    TimePoint query_start_time;
};

} // namespace sqlgate
