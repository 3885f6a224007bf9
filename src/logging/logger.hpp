//===----------------------------------------------------------------------===//
//                         SQLGate
//
// logging/logger.hpp
//
// Process log and statement audit trail, both on spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace sqlgate {

struct LogOptions {
    std::string file;                   // empty = stderr only
    std::string level = "info";
    size_t max_file_size = 100 * 1024 * 1024;
    size_t max_files = 3;
    std::string audit_file;             // empty = no audit trail
};

// One execute_sql call as recorded in the audit trail
struct AuditEvent {
    std::string sql;
    std::string outcome;                // "ok" or an error kind name
    std::string message;                // error message, empty on success
    uint64_t row_count = 0;
    bool truncated = false;
    int64_t elapsed_ms = 0;
};

class Logger {
public:
    static void Initialize(const LogOptions& options = LogOptions());
    static void Shutdown();

    // Process logger; initializes with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(const std::string& level);
    static void Flush();

    static bool IsInitialized() { return initialized_; }
    static bool IsAuditEnabled() { return audit_ != nullptr; }

    // Appends one JSON line to the audit file. No-op when auditing is off.
    static void Audit(const AuditEvent& event);
    static std::string FormatAudit(const AuditEvent& event);

    // Unknown names map to info
    static spdlog::level::level_enum ParseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::shared_ptr<spdlog::logger> audit_;
    static bool initialized_;
};

} // namespace sqlgate

// LOG_INFO("component", "message " + std::to_string(x))

#define LOG_TRACE(component, message) \
    do { \
        if (sqlgate::Logger::Get()->should_log(spdlog::level::trace)) \
            sqlgate::Logger::Get()->trace("[{}] {}", component, message); \
    } while(0)

#define LOG_DEBUG(component, message) \
    do { \
        if (sqlgate::Logger::Get()->should_log(spdlog::level::debug)) \
            sqlgate::Logger::Get()->debug("[{}] {}", component, message); \
    } while(0)

#define LOG_INFO(component, message) \
    do { \
        if (sqlgate::Logger::Get()->should_log(spdlog::level::info)) \
            sqlgate::Logger::Get()->info("[{}] {}", component, message); \
    } while(0)

#define LOG_WARN(component, message) \
    do { \
        if (sqlgate::Logger::Get()->should_log(spdlog::level::warn)) \
            sqlgate::Logger::Get()->warn("[{}] {}", component, message); \
    } while(0)

#define LOG_ERROR(component, message) \
    do { \
        if (sqlgate::Logger::Get()->should_log(spdlog::level::err)) \
            sqlgate::Logger::Get()->error("[{}] {}", component, message); \
    } while(0)

#define LOG_FATAL(component, message) \
    do { \
        if (sqlgate::Logger::Get()->should_log(spdlog::level::critical)) \
            sqlgate::Logger::Get()->critical("[{}] {}", component, message); \
    } while(0)
