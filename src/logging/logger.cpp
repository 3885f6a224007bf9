//===----------------------------------------------------------------------===//
//                         SQLGate
//
// logging/logger.cpp
//
// Logger implementation
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <vector>

namespace sqlgate {

namespace {

// Statements beyond this are cut in the audit line
constexpr size_t AUDIT_SQL_LIMIT = 4096;

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Logger::logger_;
std::shared_ptr<spdlog::logger> Logger::audit_;
bool Logger::initialized_ = false;

void Logger::Initialize(const LogOptions& options) {
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // stderr keeps stdout free for tool payloads printed by the CLI
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    if (!options.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file, options.max_file_size, options.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [tid %t] %v");
        sinks.push_back(file);
    }

    logger_ = std::make_shared<spdlog::logger>("sqlgate", sinks.begin(), sinks.end());
    logger_->set_level(ParseLevel(options.level));
    logger_->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger_);

    if (!options.audit_file.empty()) {
        auto audit_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.audit_file, options.max_file_size, options.max_files);
        audit_sink->set_pattern("%v");
        audit_ = std::make_shared<spdlog::logger>("sqlgate.audit", audit_sink);
        audit_->set_level(spdlog::level::info);
        audit_->flush_on(spdlog::level::info);
    }

    initialized_ = true;

    if (audit_) {
        logger_->info("[logging] Statement audit trail at {}", options.audit_file);
    }
}

void Logger::Shutdown() {
    Flush();
    spdlog::shutdown();
    logger_.reset();
    audit_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

void Logger::SetLevel(const std::string& level) {
    if (logger_) {
        logger_->set_level(ParseLevel(level));
    }
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
    if (audit_) {
        audit_->flush();
    }
}

std::string Logger::FormatAudit(const AuditEvent& event) {
    auto now = std::chrono::system_clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    std::string sql = event.sql.size() > AUDIT_SQL_LIMIT
        ? event.sql.substr(0, AUDIT_SQL_LIMIT) + "..."
        : event.sql;

    nlohmann::json line = {
        {"ts_ms", epoch_ms},
        {"tool", "execute_sql"},
        {"outcome", event.outcome},
        {"elapsed_ms", event.elapsed_ms},
        {"row_count", event.row_count},
        {"truncated", event.truncated},
        {"sql", sql},
    };
    if (!event.message.empty()) {
        line["message"] = event.message;
    }
    // Statements may carry arbitrary bytes; never throw on bad UTF-8
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::Audit(const AuditEvent& event) {
    if (!audit_) {
        return;
    }
    audit_->info(FormatAudit(event));
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& level) {
    std::string name = Lower(level);

    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "fatal" || name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;

    return spdlog::level::info;
}

} // namespace sqlgate
