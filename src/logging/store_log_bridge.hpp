//===----------------------------------------------------------------------===//
//                         SQLGate
//
// logging/store_log_bridge.hpp
//
// Routes the store engine's internal log into the process log, tagged with
// the gateway query that produced each entry when it is known
//===----------------------------------------------------------------------===//

#pragma once

#include <duckdb/logging/log_storage.hpp>
#include <duckdb/logging/log_manager.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlgate {

class StoreLogBridge : public duckdb::LogStorage {
public:
    static constexpr const char* STORAGE_NAME = "sqlgate";

    // Engine entries written on the owning thread while a tag is alive carry
    // its query id. Tags nest; the previous id comes back on destruction.
    class QueryTag {
    public:
        explicit QueryTag(uint64_t query_id);
        ~QueryTag();

        QueryTag(const QueryTag&) = delete;
        QueryTag& operator=(const QueryTag&) = delete;

    private:
        uint64_t previous;
    };

    // 0 when no statement is being run on this thread
    static uint64_t CurrentQueryId();

    // A null logger drops every entry
    explicit StoreLogBridge(std::shared_ptr<spdlog::logger> logger);

    const std::string GetStorageName() override { return STORAGE_NAME; }

    void WriteLogEntry(duckdb::timestamp_t timestamp, duckdb::LogLevel level,
                       const std::string& log_type, const std::string& log_message,
                       const duckdb::RegisteredLoggingContext& context) override;

    // Buffered entries are not used; WriteLogEntry sees each one
    void WriteLogEntries(duckdb::DataChunk& chunk,
                         const duckdb::RegisteredLoggingContext& context) override {}

    void Flush(duckdb::LoggingTargetTable table) override;
    void FlushAll() override;

    bool IsEnabled(duckdb::LoggingTargetTable table) override {
        return table == duckdb::LoggingTargetTable::ALL_LOGS;
    }

    uint64_t GetForwardedCount() const { return forwarded; }

    // "[store] <type>: <message>" or "[store] query <id> <type>: <message>"
    static std::string FormatEntry(const std::string& log_type, const std::string& message,
                                   uint64_t query_id);

    // Engine errors are warnings to the gateway: the caller already receives
    // them as ExecutionError
    static spdlog::level::level_enum ConvertLevel(duckdb::LogLevel level);

private:
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<uint64_t> forwarded{0};
};

// Installs the bridge as the instance's log storage and enables engine
// logging at the process log's level. Returns false if a bridge is already
// registered on this instance.
bool RegisterStoreLogBridge(duckdb::DatabaseInstance& db, std::shared_ptr<spdlog::logger> logger);

} // namespace sqlgate
