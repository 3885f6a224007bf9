//===----------------------------------------------------------------------===//
//                         SQLGate
//
// session/query_session.cpp
//
// Execution session implementation
//===----------------------------------------------------------------------===//

#include "session/query_session.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

namespace sqlgate {

QuerySession::QuerySession(uint64_t query_id_p, PooledConnection connection_p, TimePoint deadline_p)
    : query_id(query_id_p)
    , created_at(Clock::now())
    , deadline(deadline_p)
    , connection(std::move(connection_p)) {
}

QuerySession::~QuerySession() {
    ReleaseConnection();
}

duckdb::Connection& QuerySession::GetConnection() {
    std::lock_guard<std::mutex> lock(connection_mutex);
    if (!connection) {
        throw std::runtime_error("Session " + std::to_string(query_id) + " has no connection");
    }
    return *connection;
}

void QuerySession::Cancel(CancelReason reason) {
    CancelReason expected = CancelReason::NONE;
    if (!cancel_reason.compare_exchange_strong(expected, reason)) {
        return;
    }

    std::lock_guard<std::mutex> lock(connection_mutex);
    if (connection) {
        LOG_DEBUG("session", "Interrupting query " + std::to_string(query_id));
        connection->Interrupt();
    }
}

bool QuerySession::TryMarkQueryStart() {
    std::lock_guard<std::mutex> lock(connection_mutex);
    if (IsCancelRequested() || !connection) {
        return false;
    }
    query_start_time = Clock::now();
    query_running.store(true, std::memory_order_release);
    return true;
}

void QuerySession::Reinterrupt() {
    if (!IsCancelRequested() || !IsQueryRunning()) {
        return;
    }
    std::lock_guard<std::mutex> lock(connection_mutex);
    if (connection) {
        connection->Interrupt();
    }
}

void QuerySession::ReleaseConnection() {
    std::lock_guard<std::mutex> lock(connection_mutex);
    if (!connection) {
        return;
    }
    if (IsCancelRequested()) {
        connection.Discard();
    } else {
        connection.Release();
    }
    LOG_TRACE("session", "Query " + std::to_string(query_id) + " released its connection");
}

} // namespace sqlgate
