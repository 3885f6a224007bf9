//===----------------------------------------------------------------------===//
//                         SQLGate
//
// logging/store_log_bridge.cpp
//
// Store engine log bridge implementation
//===----------------------------------------------------------------------===//

#include "logging/store_log_bridge.hpp"
#include <duckdb/main/database.hpp>

namespace sqlgate {

namespace {

thread_local uint64_t current_query_id = 0;

duckdb::LogLevel EngineLevelFor(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return duckdb::LogLevel::LOG_TRACE;
        case spdlog::level::debug: return duckdb::LogLevel::LOG_DEBUG;
        case spdlog::level::info:  return duckdb::LogLevel::LOG_INFO;
        case spdlog::level::warn:  return duckdb::LogLevel::LOG_WARNING;
        default:                   return duckdb::LogLevel::LOG_ERROR;
    }
}

} // anonymous namespace

StoreLogBridge::QueryTag::QueryTag(uint64_t query_id) : previous(current_query_id) {
    current_query_id = query_id;
}

StoreLogBridge::QueryTag::~QueryTag() {
    current_query_id = previous;
}

uint64_t StoreLogBridge::CurrentQueryId() {
    return current_query_id;
}

StoreLogBridge::StoreLogBridge(std::shared_ptr<spdlog::logger> logger_p)
    : logger(std::move(logger_p)) {
}

void StoreLogBridge::WriteLogEntry(duckdb::timestamp_t timestamp, duckdb::LogLevel level,
                                   const std::string& log_type, const std::string& log_message,
                                   const duckdb::RegisteredLoggingContext& context) {
    if (!logger) {
        return;
    }
    auto spd_level = ConvertLevel(level);
    if (!logger->should_log(spd_level)) {
        return;
    }
    forwarded++;
    logger->log(spd_level, FormatEntry(log_type, log_message, current_query_id));
}

void StoreLogBridge::Flush(duckdb::LoggingTargetTable table) {
    FlushAll();
}

void StoreLogBridge::FlushAll() {
    if (logger) {
        logger->flush();
    }
}

std::string StoreLogBridge::FormatEntry(const std::string& log_type, const std::string& message,
                                        uint64_t query_id) {
    std::string line = "[store] ";
    if (query_id != 0) {
        line += "query " + std::to_string(query_id) + " ";
    }
    return line + log_type + ": " + message;
}

spdlog::level::level_enum StoreLogBridge::ConvertLevel(duckdb::LogLevel level) {
    switch (level) {
        case duckdb::LogLevel::LOG_TRACE:   return spdlog::level::trace;
        case duckdb::LogLevel::LOG_DEBUG:   return spdlog::level::debug;
        case duckdb::LogLevel::LOG_INFO:    return spdlog::level::debug;
        case duckdb::LogLevel::LOG_WARNING:
        case duckdb::LogLevel::LOG_ERROR:   return spdlog::level::warn;
        case duckdb::LogLevel::LOG_FATAL:   return spdlog::level::critical;
        default:                            return spdlog::level::debug;
    }
}

bool RegisterStoreLogBridge(duckdb::DatabaseInstance& db, std::shared_ptr<spdlog::logger> logger) {
    auto level = logger ? logger->level() : spdlog::level::off;
    auto bridge = duckdb::make_shared_ptr<StoreLogBridge>(std::move(logger));
    duckdb::shared_ptr<duckdb::LogStorage> storage = bridge;

    auto& manager = db.GetLogManager();
    if (!manager.RegisterLogStorage(StoreLogBridge::STORAGE_NAME, storage)) {
        return false;
    }
    manager.SetLogStorage(db, StoreLogBridge::STORAGE_NAME);
    manager.SetLogLevel(EngineLevelFor(level));
    manager.SetEnableLogging(true);
    return true;
}

} // namespace sqlgate
