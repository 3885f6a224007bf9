//===----------------------------------------------------------------------===//
//                         SQLGate
//
// main.cpp
//
// Gateway daemon entry point
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/gateway_config.hpp"
#include "gateway/query_gateway.hpp"
#include "protocol/tool_handler.hpp"
#include "http/http_server.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <fstream>
#include <unistd.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <execinfo.h>
#include <cxxabi.h>

using namespace sqlgate;

static std::string g_pid_file;
static GatewayConfig g_config;

//===----------------------------------------------------------------------===//
// Version Info
//===----------------------------------------------------------------------===//
void PrintVersion() {
    std::cout << "SQLGate " << SQLGATE_VERSION << "\n"
              << "Git commit: " << SQLGATE_GIT_COMMIT << "\n"
              << "Build type: " << SQLGATE_BUILD_TYPE << "\n"
              << "Build time: " << SQLGATE_BUILD_TIME << "\n"
              << "DuckDB: " << duckdb::DuckDB::LibraryVersion() << "\n";
}

//===----------------------------------------------------------------------===//
// Daemon Mode
//===----------------------------------------------------------------------===//
bool Daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork: " << strerror(errno) << std::endl;
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    if (setsid() < 0) {
        std::cerr << "Failed to create new session: " << strerror(errno) << std::endl;
        return false;
    }

    // Second fork so the daemon can never reacquire a terminal
    pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork (second): " << strerror(errno) << std::endl;
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    umask(0);

    if (chdir("/") < 0) {
        // Non-fatal
    }

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        if (null_fd > STDERR_FILENO) {
            close(null_fd);
        }
    }

    return true;
}

//===----------------------------------------------------------------------===//
// PID File
//===----------------------------------------------------------------------===//
bool WritePidFile(const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Failed to open PID file: " << path << std::endl;
        return false;
    }
    file << getpid();
    file.close();
    return true;
}

void RemovePidFile(const std::string& path) {
    if (!path.empty()) {
        std::remove(path.c_str());
    }
}

//===----------------------------------------------------------------------===//
// Crash Handler
//===----------------------------------------------------------------------===//
void PrintStackTrace() {
    void* array[50];
    int size = backtrace(array, 50);
    char** symbols = backtrace_symbols(array, size);

    std::cerr << "\n=== Stack Trace ===\n";
    for (int i = 0; i < size; i++) {
        std::string symbol(symbols[i]);
        size_t start = symbol.find('_');
        size_t end = symbol.find('+');

        if (start != std::string::npos && end != std::string::npos && end > start) {
            std::string mangled = symbol.substr(start, end - start);
            int status;
            char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
            if (status == 0 && demangled) {
                std::cerr << "  " << i << ": " << demangled << "\n";
                free(demangled);
                continue;
            }
        }
        std::cerr << "  " << i << ": " << symbols[i] << "\n";
    }
    std::cerr << "===================\n";

    free(symbols);
}

void CrashHandler(int signal) {
    const char* signal_name = signal == SIGSEGV ? "SIGSEGV" :
                              signal == SIGABRT ? "SIGABRT" :
                              signal == SIGFPE ? "SIGFPE" :
                              signal == SIGBUS ? "SIGBUS" : "UNKNOWN";

    std::cerr << "\n!!! CRASH: Received signal " << signal_name << " (" << signal << ") !!!\n";

    PrintStackTrace();
    RemovePidFile(g_pid_file);

    std::signal(signal, SIG_DFL);
    raise(signal);
}

// Only the log level changes at runtime, everything else needs a restart
void ReloadConfig() {
    if (g_config.config_file.empty()) {
        LOG_WARN("main", "No config file specified, cannot reload");
        return;
    }

    LOG_INFO("main", "Reloading configuration from: " + g_config.config_file);

    GatewayConfig new_config;
    std::string error;
    if (!new_config.LoadFromFile(g_config.config_file, error)) {
        LOG_ERROR("main", "Failed to reload config: " + error);
        return;
    }

    if (new_config.log_level != g_config.log_level) {
        Logger::SetLevel(new_config.log_level);
        g_config.log_level = new_config.log_level;
        LOG_INFO("main", "Log level changed to: " + new_config.log_level);
    }

    LOG_INFO("main", "Configuration reloaded (some settings require restart)");
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        bool show_version;
        g_config = ParseCommandLine(argc, argv, show_version);

        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!g_config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        if (g_config.daemon) {
            if (!Daemonize()) {
                return 1;
            }
        }

        Logger::Initialize(g_config.GetLogOptions());

        if (!g_config.pid_file.empty()) {
            g_pid_file = g_config.pid_file;
            if (!WritePidFile(g_pid_file)) {
                return 1;
            }
        }

        // Block SIGINT/SIGTERM/SIGHUP so they are handled synchronously via
        // sigwait() in the main loop. Threads created after this inherit the mask.
        sigset_t shutdown_mask;
        sigemptyset(&shutdown_mask);
        sigaddset(&shutdown_mask, SIGINT);
        sigaddset(&shutdown_mask, SIGTERM);
        sigaddset(&shutdown_mask, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &shutdown_mask, nullptr);

        std::signal(SIGPIPE, SIG_IGN);

        std::signal(SIGSEGV, CrashHandler);
        std::signal(SIGABRT, CrashHandler);
        std::signal(SIGFPE, CrashHandler);
        std::signal(SIGBUS, CrashHandler);

        LOG_INFO("main", "Starting SQLGate " + std::string(SQLGATE_VERSION));
        LOG_INFO("main", "Configuration:");
        LOG_INFO("main", "  Store: " + g_config.database_path);
        LOG_INFO("main", "  Host: " + g_config.host);
        LOG_INFO("main", "  HTTP Port: " + std::to_string(g_config.http_port));
        LOG_INFO("main", "  Executor Threads: " + std::to_string(g_config.GetExecutorThreadCount()));
        LOG_INFO("main", "  Query Timeout: " + std::to_string(g_config.query_timeout_ms) + "ms");
        LOG_INFO("main", "  Row Cap: " + std::to_string(g_config.max_rows));
        LOG_INFO("main", "  Schema Samples: " + std::to_string(g_config.sample_rows));
        if (!g_config.catalog_file.empty()) {
            LOG_INFO("main", "  Catalog Metadata: " + g_config.catalog_file);
        }
        if (!g_config.audit_file.empty()) {
            LOG_INFO("main", "  Audit Trail: " + g_config.audit_file);
        }
        LOG_INFO("main", "  Connection Pool: min=" + std::to_string(g_config.pool_min_connections) +
                 ", max=" + std::to_string(g_config.pool_max_connections));

        QueryGateway gateway(g_config);
        gateway.Start();

        ToolHandler tools(gateway);

        std::unique_ptr<HttpServer> http_server;
        if (g_config.http_port > 0) {
            http_server = std::make_unique<HttpServer>(g_config.host, g_config.http_port, tools,
                                                       g_config.GetExecutorThreadCount());
            http_server->SetHealthCallback([&gateway]() { return gateway.RenderHealth(); });
            http_server->SetMetricsCallback([&gateway]() { return gateway.RenderMetrics(); });
            http_server->Start();
        } else {
            LOG_WARN("main", "HTTP endpoint disabled (port 0)");
        }

        LOG_INFO("main", "SQLGate is ready to accept tool calls");

        {
            int sig;
            while (sigwait(&shutdown_mask, &sig) == 0) {
                if (sig == SIGHUP) {
                    LOG_INFO("main", "Reload signal received");
                    ReloadConfig();
                } else {
                    LOG_INFO("main", "Shutdown signal received");
                    break;
                }
            }
        }

        LOG_INFO("main", "Shutting down...");

        // Stop accepting calls before in-flight statements are cancelled
        if (http_server) {
            http_server->Stop();
            http_server.reset();
        }
        gateway.Stop();

        RemovePidFile(g_pid_file);

        LOG_INFO("main", "SQLGate stopped");
        Logger::Shutdown();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        RemovePidFile(g_pid_file);
        return 1;
    }
}
