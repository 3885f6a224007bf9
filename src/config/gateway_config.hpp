//===----------------------------------------------------------------------===//
//                         SQLGate
//
// config/gateway_config.hpp
//
// Gateway configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include "logging/logger.hpp"
#include <string>
#include <vector>
#include <thread>
#include <iostream>
#include <cstdlib>
#include <algorithm>

namespace sqlgate {

struct GatewayConfig {
    // Store
    std::string database_path;
    uint64_t max_memory = 0;           // 0 = engine default (bytes)
    uint32_t engine_threads = 0;       // 0 = engine default
    bool allow_external_access = false;

    // Network
    std::string host = "0.0.0.0";
    uint16_t http_port = DEFAULT_HTTP_PORT;  // 0 = disabled

    // Logging
    std::string log_file;
    std::string log_level = "info";
    std::string audit_file;  // JSON lines, one per execute_sql call; empty = off

    // Process
    std::string pid_file;
    std::string config_file;
    bool daemon = false;

    // Threading
    uint32_t executor_threads = 0;  // 0 = auto

    // Query limits
    uint32_t query_timeout_ms = DEFAULT_QUERY_TIMEOUT_MS;
    uint32_t cancel_grace_ms = DEFAULT_CANCEL_GRACE_MS;
    uint32_t max_rows = DEFAULT_MAX_ROWS;
    uint32_t sample_rows = DEFAULT_SAMPLE_ROWS;

    // Connection pool settings
    uint32_t pool_min_connections = 2;
    uint32_t pool_max_connections = 16;
    uint32_t pool_idle_timeout_seconds = 300;
    uint32_t pool_acquire_timeout_ms = 2000;

    // Catalog
    std::string catalog_file;  // optional YAML with descriptions and examples
    std::vector<std::string> recency_columns = {"cycle_date"};
    std::vector<std::string> extra_forbidden_keywords;

    LogOptions GetLogOptions() const {
        LogOptions options;
        options.file = log_file;
        options.level = log_level;
        options.audit_file = audit_file;
        return options;
    }

    uint32_t GetExecutorThreadCount() const {
        if (executor_threads == 0) {
            return std::max(1u, std::thread::hardware_concurrency());
        }
        return executor_threads;
    }

    bool Validate(std::string& error) const {
        if (database_path.empty()) {
            error = "Database path is required (--database or SQLGATE_DATABASE)";
            return false;
        }
        if (database_path == ":memory:") {
            error = "An in-memory database cannot be opened read-only";
            return false;
        }
        if (query_timeout_ms == 0) {
            error = "Query timeout must be greater than 0";
            return false;
        }
        if (max_rows == 0) {
            error = "Max rows must be greater than 0";
            return false;
        }
        if (sample_rows < MIN_SAMPLE_ROWS || sample_rows > MAX_SAMPLE_ROWS) {
            error = "Sample rows must be between " + std::to_string(MIN_SAMPLE_ROWS) +
                    " and " + std::to_string(MAX_SAMPLE_ROWS);
            return false;
        }
        if (pool_max_connections == 0) {
            error = "Pool max connections must be greater than 0";
            return false;
        }
        if (pool_min_connections > pool_max_connections) {
            error = "Pool min connections exceeds pool max connections";
            return false;
        }
        return true;
    }

    // Load from config file (auto-detects format by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        }

        if (ext == ".yaml" || ext == ".yml") {
            return LoadFromYaml(path, error);
        }
        return LoadFromIni(path, error);
    }

    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigFile cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        if (cfg.Has("database")) database_path = cfg.GetString("database");
        if (cfg.Has("max_memory")) max_memory = static_cast<uint64_t>(cfg.GetInt("max_memory"));
        if (cfg.Has("engine_threads")) engine_threads = static_cast<uint32_t>(cfg.GetInt("engine_threads"));
        if (cfg.Has("allow_external_access")) allow_external_access = cfg.GetBool("allow_external_access");
        if (cfg.Has("host")) host = cfg.GetString("host");
        if (cfg.Has("http_port")) http_port = static_cast<uint16_t>(cfg.GetInt("http_port"));
        if (cfg.Has("log_file")) log_file = cfg.GetString("log_file");
        if (cfg.Has("log_level")) log_level = cfg.GetString("log_level");
        if (cfg.Has("audit_file")) audit_file = cfg.GetString("audit_file");
        if (cfg.Has("pid_file")) pid_file = cfg.GetString("pid_file");
        if (cfg.Has("daemon")) daemon = cfg.GetBool("daemon");
        if (cfg.Has("executor_threads")) executor_threads = static_cast<uint32_t>(cfg.GetInt("executor_threads"));
        if (cfg.Has("query_timeout_ms")) query_timeout_ms = static_cast<uint32_t>(cfg.GetInt("query_timeout_ms"));
        if (cfg.Has("cancel_grace_ms")) cancel_grace_ms = static_cast<uint32_t>(cfg.GetInt("cancel_grace_ms"));
        if (cfg.Has("max_rows")) max_rows = static_cast<uint32_t>(cfg.GetInt("max_rows"));
        if (cfg.Has("sample_rows")) sample_rows = static_cast<uint32_t>(cfg.GetInt("sample_rows"));
        if (cfg.Has("pool_min_connections")) pool_min_connections = static_cast<uint32_t>(cfg.GetInt("pool_min_connections"));
        if (cfg.Has("pool_max_connections")) pool_max_connections = static_cast<uint32_t>(cfg.GetInt("pool_max_connections"));
        if (cfg.Has("pool_idle_timeout")) pool_idle_timeout_seconds = static_cast<uint32_t>(cfg.GetInt("pool_idle_timeout"));
        if (cfg.Has("pool_acquire_timeout")) pool_acquire_timeout_ms = static_cast<uint32_t>(cfg.GetInt("pool_acquire_timeout"));
        if (cfg.Has("catalog_file")) catalog_file = cfg.GetString("catalog_file");
        if (cfg.Has("recency_columns")) recency_columns = cfg.GetList("recency_columns");
        if (cfg.Has("forbidden_keywords")) extra_forbidden_keywords = cfg.GetList("forbidden_keywords");

        return true;
    }

    bool LoadFromYaml(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        // Store section
        if (cfg.Has("store.path")) database_path = cfg.GetString("store.path");
        if (cfg.Has("store.max_memory")) max_memory = static_cast<uint64_t>(cfg.GetInt("store.max_memory"));
        if (cfg.Has("store.threads")) engine_threads = static_cast<uint32_t>(cfg.GetInt("store.threads"));
        if (cfg.Has("store.allow_external_access")) allow_external_access = cfg.GetBool("store.allow_external_access");

        // Server section
        if (cfg.Has("server.host")) host = cfg.GetString("server.host");
        if (cfg.Has("server.http_port")) http_port = static_cast<uint16_t>(cfg.GetInt("server.http_port"));

        // Logging section
        if (cfg.Has("logging.file")) log_file = cfg.GetString("logging.file");
        if (cfg.Has("logging.level")) log_level = cfg.GetString("logging.level");
        if (cfg.Has("logging.audit_file")) audit_file = cfg.GetString("logging.audit_file");

        // Process section
        if (cfg.Has("process.daemon")) daemon = cfg.GetBool("process.daemon");
        if (cfg.Has("process.pid_file")) pid_file = cfg.GetString("process.pid_file");

        // Threads section
        if (cfg.Has("threads.executor")) executor_threads = static_cast<uint32_t>(cfg.GetInt("threads.executor"));

        // Limits section
        if (cfg.Has("limits.query_timeout_ms")) query_timeout_ms = static_cast<uint32_t>(cfg.GetInt("limits.query_timeout_ms"));
        if (cfg.Has("limits.cancel_grace_ms")) cancel_grace_ms = static_cast<uint32_t>(cfg.GetInt("limits.cancel_grace_ms"));
        if (cfg.Has("limits.max_rows")) max_rows = static_cast<uint32_t>(cfg.GetInt("limits.max_rows"));
        if (cfg.Has("limits.sample_rows")) sample_rows = static_cast<uint32_t>(cfg.GetInt("limits.sample_rows"));

        // Pool section
        if (cfg.Has("pool.min")) pool_min_connections = static_cast<uint32_t>(cfg.GetInt("pool.min"));
        if (cfg.Has("pool.max")) pool_max_connections = static_cast<uint32_t>(cfg.GetInt("pool.max"));
        if (cfg.Has("pool.idle_timeout_seconds")) pool_idle_timeout_seconds = static_cast<uint32_t>(cfg.GetInt("pool.idle_timeout_seconds"));
        if (cfg.Has("pool.acquire_timeout_ms")) pool_acquire_timeout_ms = static_cast<uint32_t>(cfg.GetInt("pool.acquire_timeout_ms"));

        // Catalog section
        if (cfg.Has("catalog.file")) catalog_file = cfg.GetString("catalog.file");
        if (cfg.Has("catalog.recency_columns")) recency_columns = cfg.GetList("catalog.recency_columns");
        if (cfg.Has("validator.forbidden_keywords")) extra_forbidden_keywords = cfg.GetList("validator.forbidden_keywords");

        return true;
    }

    // Environment overrides sit between the config file and the command line
    void ApplyEnvironment() {
        if (const char* db = std::getenv("SQLGATE_DATABASE")) {
            if (*db) database_path = db;
        }
        if (const char* port = std::getenv("PORT")) {
            try {
                http_port = static_cast<uint16_t>(std::stoi(port));
            } catch (const std::exception&) {
                std::cerr << "Ignoring invalid PORT value: " << port << std::endl;
            }
        }
    }
};

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>       Config file path (.conf or .yaml)\n"
              << "  -d, --database <path>     Read-only store path (required)\n"
              << "  -h, --host <host>         Host to bind (default: 0.0.0.0)\n"
              << "  -p, --port <port>         HTTP tool port (default: 8000, 0 = disabled)\n"
              << "  --daemon                  Run as daemon (background)\n"
              << "  --pid-file <path>         PID file path\n"
              << "  --log-file <path>         Log file path\n"
              << "  --log-level <level>       Log level (debug, info, warn, error)\n"
              << "  --audit-file <path>       Statement audit log (JSON lines)\n"
              << "  --executor-threads <n>    Executor thread count (default: auto)\n"
              << "  --query-timeout <ms>      Query deadline in milliseconds (default: 10000)\n"
              << "  --max-rows <n>            Result row cap (default: 1000)\n"
              << "  --sample-rows <n>         Schema sample rows, 3-5 (default: 5)\n"
              << "  --max-memory <bytes>      Engine memory limit (default: engine default)\n"
              << "  --pool-min <n>            Pool minimum connections (default: 2)\n"
              << "  --pool-max <n>            Pool maximum connections (default: 16)\n"
              << "  --catalog <path>          Catalog metadata YAML (descriptions, examples)\n"
              << "  --version                 Show version info\n"
              << "  --help                    Show this help\n";
}

inline GatewayConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    GatewayConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
        config.config_file = config_file_path;
    }

    config.ApplyEnvironment();

    // Second pass: command line overrides config file and environment
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;  // Already processed
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            config.database_path = argv[++i];
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.http_port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--daemon") {
            config.daemon = true;
        } else if (arg == "--pid-file" && i + 1 < argc) {
            config.pid_file = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--audit-file" && i + 1 < argc) {
            config.audit_file = argv[++i];
        } else if (arg == "--executor-threads" && i + 1 < argc) {
            config.executor_threads = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--query-timeout" && i + 1 < argc) {
            config.query_timeout_ms = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-rows" && i + 1 < argc) {
            config.max_rows = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--sample-rows" && i + 1 < argc) {
            config.sample_rows = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-memory" && i + 1 < argc) {
            config.max_memory = static_cast<uint64_t>(std::stoll(argv[++i]));
        } else if (arg == "--pool-min" && i + 1 < argc) {
            config.pool_min_connections = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--pool-max" && i + 1 < argc) {
            config.pool_max_connections = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--catalog" && i + 1 < argc) {
            config.catalog_file = argv[++i];
        }
    }

    return config;
}

} // namespace sqlgate
