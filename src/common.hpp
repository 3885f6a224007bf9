//===----------------------------------------------------------------------===//
//                         SQLGate
//
// common.hpp
//
// Common definitions and includes for SQLGate
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <unordered_map>

// DuckDB includes
#include "duckdb.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/main/query_result.hpp"

namespace sqlgate {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Forward declarations
class QuerySession;
class SessionManager;
class ExecutorPool;
struct GatewayConfig;
class Logger;

// Shared pointer types
using QuerySessionPtr = std::shared_ptr<QuerySession>;

// Constants
constexpr uint32_t DEFAULT_QUERY_TIMEOUT_MS = 10000;   // 10 seconds
constexpr uint32_t DEFAULT_CANCEL_GRACE_MS = 2000;
constexpr size_t DEFAULT_MAX_ROWS = 1000;
constexpr size_t DEFAULT_SAMPLE_ROWS = 5;
constexpr size_t MIN_SAMPLE_ROWS = 3;
constexpr size_t MAX_SAMPLE_ROWS = 5;
constexpr uint16_t DEFAULT_HTTP_PORT = 8000;
constexpr size_t DEFAULT_EXECUTOR_THREADS = 0;  // 0 = auto (CPU cores)

} // namespace sqlgate
