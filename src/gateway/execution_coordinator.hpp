//===----------------------------------------------------------------------===//
//                         SQLGate
//
// gateway/execution_coordinator.hpp
//
// Runs statements against the store under a wall-clock deadline
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "gateway/gateway_error.hpp"
#include "gateway/result_materializer.hpp"
#include "gateway/result_set.hpp"
#include <future>

namespace sqlgate {

struct QueryRequest {
    std::string sql;
    TimePoint submitted_at = Clock::now();
};

class ExecutionCoordinator {
public:
    struct Config {
        std::chrono::milliseconds query_timeout;
        std::chrono::milliseconds cancel_grace;
        size_t max_rows;

        Config()
            : query_timeout(DEFAULT_QUERY_TIMEOUT_MS)
            , cancel_grace(DEFAULT_CANCEL_GRACE_MS)
            , max_rows(DEFAULT_MAX_ROWS) {}
    };

    struct Stats {
        uint64_t queries_total = 0;
        uint64_t queries_succeeded = 0;
        uint64_t queries_failed = 0;
        uint64_t queries_timed_out = 0;
        uint64_t queries_truncated = 0;
        uint64_t rows_returned = 0;
    };

    // Work runs on an executor thread with a connection it owns exclusively.
    // Anything it captures must stay valid after RunWithDeadline returns, since
    // a statement past its deadline may still be unwinding.
    using Work = std::function<void(duckdb::Connection&)>;

    ExecutionCoordinator(SessionManager& sessions_p, ExecutorPool& executor_p,
                         const Config& config_p = Config{});

    ExecutionCoordinator(const ExecutionCoordinator&) = delete;
    ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

    // Runs an already validated statement. Throws GatewayException with
    // TIMEOUT or EXECUTION, or rethrows engine exceptions for translation.
    ResultSet Execute(const QueryRequest& request);

    void RunWithDeadline(const std::string& label, const Work& work,
                         TimePoint submitted_at = Clock::now());

    bool Cancel(uint64_t query_id);

    Stats GetStats() const;
    const Config& GetConfig() const { return config; }
    const ResultMaterializer& GetMaterializer() const { return materializer; }

    static std::string TimeoutMessage(std::chrono::milliseconds timeout);

private:
    // Waits out the cancel grace, re-interrupting the session. Returns true
    // once the task has finished.
    bool AwaitCancelled(QuerySession& session, std::future<void>& done);
    [[noreturn]] void ThrowTimeout(uint64_t query_id, const std::string& label);

private:
    SessionManager& sessions;
    ExecutorPool& executor;
    Config config;
    ResultMaterializer materializer;

    std::atomic<uint64_t> queries_total{0};
    std::atomic<uint64_t> queries_succeeded{0};
    std::atomic<uint64_t> queries_failed{0};
    std::atomic<uint64_t> queries_timed_out{0};
    std::atomic<uint64_t> queries_truncated{0};
    std::atomic<uint64_t> rows_returned{0};
};

} // namespace sqlgate
