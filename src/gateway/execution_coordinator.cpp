//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/execution_coordinator.cpp
//
// Execution coordinator implementation
//===----------------------------------------------------------------------===//

#include "gateway/execution_coordinator.hpp"
#include "executor/executor_pool.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"
#include "logging/store_log_bridge.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>

namespace sqlgate {

namespace {

// Drops the session from the registry when the request leaves the coordinator.
// The connection itself goes back once the worker lets go of the session.
class SessionRegistration {
public:
    SessionRegistration(SessionManager& sessions_p, uint64_t query_id_p)
        : sessions(sessions_p), query_id(query_id_p) {}
    ~SessionRegistration() { sessions.RemoveSession(query_id); }

private:
    SessionManager& sessions;
    uint64_t query_id;
};

// How often a timed-out statement is interrupted again during the grace wait
constexpr std::chrono::milliseconds REINTERRUPT_INTERVAL(50);

int64_t ElapsedMs(TimePoint since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

} // anonymous namespace

ExecutionCoordinator::ExecutionCoordinator(SessionManager& sessions_p, ExecutorPool& executor_p,
                                           const Config& config_p)
    : sessions(sessions_p)
    , executor(executor_p)
    , config(config_p)
    , materializer(config_p.max_rows) {
}

std::string ExecutionCoordinator::TimeoutMessage(std::chrono::milliseconds timeout) {
    auto ms = timeout.count();
    std::string limit = (ms % 1000 == 0) ? std::to_string(ms / 1000) + " second"
                                         : std::to_string(ms) + " millisecond";
    return "Query exceeded the " + limit + " time limit and was cancelled";
}

ResultSet ExecutionCoordinator::Execute(const QueryRequest& request) {
    auto result = std::make_shared<ResultSet>();
    auto sql = request.sql;
    ResultMaterializer rows = materializer;

    RunWithDeadline("query", [result, sql, rows](duckdb::Connection& conn) {
        auto stream = conn.SendQuery(sql);
        *result = rows.Materialize(*stream);
    }, request.submitted_at);

    rows_returned += result->row_count;
    if (result->truncated) {
        queries_truncated++;
    }
    return std::move(*result);
}

void ExecutionCoordinator::RunWithDeadline(const std::string& label, const Work& work,
                                           TimePoint submitted_at) {
    queries_total++;
    TimePoint deadline = submitted_at + config.query_timeout;

    auto session = sessions.CreateSession(deadline);
    if (!session) {
        queries_failed++;
        LOG_WARN("coordinator", label + " rejected: no store connection available");
        throw GatewayException(ErrorKind::EXECUTION,
                               "Store connection unavailable; all connections are busy",
                               "Retry the request shortly");
    }

    uint64_t query_id = session->GetQueryId();
    SessionRegistration registration(sessions, query_id);

    std::future<void> done;
    try {
        done = executor.SubmitWithFuture([session, work]() {
            // Cancelled while queued: the caller has already been answered
            if (!session->TryMarkQueryStart()) {
                throw std::runtime_error("Query was cancelled before it started");
            }
            StoreLogBridge::QueryTag tag(session->GetQueryId());
            try {
                work(session->GetConnection());
            } catch (...) {
                session->MarkQueryEnd();
                throw;
            }
            session->MarkQueryEnd();
        });
    } catch (const std::runtime_error&) {
        queries_failed++;
        throw GatewayException(ErrorKind::EXECUTION, "Gateway is shutting down",
                               "Retry the request once the gateway is back");
    }

    LOG_DEBUG("coordinator", label + " " + std::to_string(query_id) + " submitted");

    if (done.wait_until(deadline) == std::future_status::timeout) {
        session->Cancel(CancelReason::DEADLINE);
        if (!AwaitCancelled(*session, done)) {
            if (session->IsQueryRunning()) {
                LOG_WARN("coordinator", label + " " + std::to_string(query_id) +
                         " still running after cancel grace; its connection will be discarded");
            } else {
                LOG_WARN("coordinator", label + " " + std::to_string(query_id) +
                         " still queued at its deadline; it will not be started");
            }
        }
        ThrowTimeout(query_id, label);
    }

    try {
        done.get();
    } catch (const std::future_error&) {
        // Task dropped by a stopping executor
        queries_failed++;
        throw GatewayException(ErrorKind::EXECUTION, "Gateway is shutting down",
                               "Retry the request once the gateway is back");
    } catch (const std::exception& e) {
        switch (session->GetCancelReason()) {
            case CancelReason::DEADLINE:
                ThrowTimeout(query_id, label);
            case CancelReason::REQUESTED:
                queries_failed++;
                LOG_INFO("coordinator", label + " " + std::to_string(query_id) + " cancelled");
                throw GatewayException(ErrorKind::EXECUTION, "Query was cancelled", "");
            case CancelReason::SHUTDOWN:
                queries_failed++;
                throw GatewayException(ErrorKind::EXECUTION, "Gateway is shutting down",
                                       "Retry the request once the gateway is back");
            default:
                break;
        }
        queries_failed++;
        LOG_INFO("coordinator", label + " " + std::to_string(query_id) + " failed after " +
                 std::to_string(ElapsedMs(submitted_at)) + "ms: " + e.what());
        throw;
    }

    queries_succeeded++;
    LOG_INFO("coordinator", label + " " + std::to_string(query_id) + " completed in " +
             std::to_string(ElapsedMs(submitted_at)) + "ms");
}

bool ExecutionCoordinator::AwaitCancelled(QuerySession& session, std::future<void>& done) {
    TimePoint grace_end = Clock::now() + config.cancel_grace;
    while (Clock::now() < grace_end) {
        TimePoint slice = std::min(grace_end, Clock::now() + REINTERRUPT_INTERVAL);
        if (done.wait_until(slice) == std::future_status::ready) {
            return true;
        }
        session.Reinterrupt();
    }
    return done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

void ExecutionCoordinator::ThrowTimeout(uint64_t query_id, const std::string& label) {
    queries_timed_out++;
    LOG_WARN("coordinator", label + " " + std::to_string(query_id) + " exceeded " +
             std::to_string(config.query_timeout.count()) + "ms deadline");
    throw GatewayException(ErrorKind::TIMEOUT, TimeoutMessage(config.query_timeout),
                           "Simplify filters or aggregate before returning large result sets");
}

bool ExecutionCoordinator::Cancel(uint64_t query_id) {
    return sessions.CancelQuery(query_id, CancelReason::REQUESTED);
}

ExecutionCoordinator::Stats ExecutionCoordinator::GetStats() const {
    Stats stats;
    stats.queries_total = queries_total;
    stats.queries_succeeded = queries_succeeded;
    stats.queries_failed = queries_failed;
    stats.queries_timed_out = queries_timed_out;
    stats.queries_truncated = queries_truncated;
    stats.rows_returned = rows_returned;
    return stats;
}

} // namespace sqlgate
