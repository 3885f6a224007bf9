//===----------------------------------------------------------------------===//
//                         SQLGate CLI
//
// programs/client/main.cpp
//
// Interactive shell over a local read-only store. Every line goes through the
// same tool operations the HTTP endpoint serves and prints their JSON payload.
//
// Usage:
//   sqlgate-cli -d data/cu_data.duckdb
//   sqlgate-cli -c conf/sqlgate.yaml
//===----------------------------------------------------------------------===//

#include "config/gateway_config.hpp"
#include "gateway/query_gateway.hpp"
#include "protocol/tool_handler.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

using namespace sqlgate;

static std::string Trim(const std::string &s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

static void PrintHelp() {
    std::cout <<
        "\nSQLGate CLI\n"
        "\nMeta commands:\n"
        "  .help               Show this message\n"
        "  .quit / .exit       Exit the shell\n"
        "  .schema [NAME]      List tables and views, or describe NAME\n"
        "  .examples [CAT]     Example queries, optionally for one category\n"
        "\nSQL:\n"
        "  Terminate statements with ';'. Only a single SELECT (or WITH ... SELECT)\n"
        "  is accepted; results are capped and statements have a deadline.\n\n";
}

static void PrintResponse(const ToolResponse &response) {
    std::cout << JsonSerializer::Dump(response.body, 2) << "\n";
    if (response.status != 200) {
        std::cout << "(status " << response.status << ")\n";
    }
    std::cout << "\n";
}

// Tool arguments from whatever follows a meta command
static json ArgumentFor(const std::string &line, size_t command_length, const char *key) {
    json arguments = json::object();
    std::string rest = Trim(line.substr(command_length));
    if (!rest.empty()) {
        arguments[key] = rest;
    }
    return arguments;
}

int main(int argc, char *argv[]) {
    bool show_version;
    GatewayConfig config = ParseCommandLine(argc, argv, show_version);
    if (show_version) {
        std::cout << "sqlgate-cli " << SQLGATE_VERSION << "\n";
        return 0;
    }

    std::string error;
    if (!config.Validate(error)) {
        std::cerr << "Configuration error: " << error << "\n";
        return 1;
    }

    // The shell keeps stderr quiet unless a level was chosen explicitly
    LogOptions log_options = config.GetLogOptions();
    if (log_options.level == "info") {
        log_options.level = "warn";
    }
    Logger::Initialize(log_options);

    std::unique_ptr<QueryGateway> gateway;
    try {
        gateway = std::make_unique<QueryGateway>(config);
    } catch (const std::exception &e) {
        std::cerr << "Failed to open store: " << e.what() << "\n";
        return 1;
    }
    gateway->Start();
    ToolHandler tools(*gateway);

    std::cout << "SQLGate CLI " << SQLGATE_VERSION << " - store " << config.database_path << "\n"
                 "Enter SQL followed by ';'  |  .help for commands  |  .quit to exit\n\n";

    using_history();

    std::string buf;
    bool multiline = false;

    while (true) {
        const char *prompt = multiline ? "   ...> " : "sqlgate> ";
        char *raw = readline(prompt);
        if (!raw) { std::cout << "\nBye!\n"; break; }

        std::string line(raw);
        free(raw);

        if (Trim(line).empty()) continue;
        add_history(line.c_str());

        // Meta commands (only at start of a fresh statement)
        if (!multiline) {
            std::string trimmed = Trim(line);
            std::string low = trimmed;
            std::transform(low.begin(), low.end(), low.begin(), ::tolower);

            if (low == ".quit" || low == ".exit" || low == ".q") {
                std::cout << "Bye!\n"; break;
            }
            if (low == ".help" || low == ".h") {
                PrintHelp(); continue;
            }
            if (low.rfind(".schema", 0) == 0) {
                PrintResponse(tools.Handle("get_schema", ArgumentFor(trimmed, 7, "table_name")));
                continue;
            }
            if (low.rfind(".examples", 0) == 0) {
                PrintResponse(tools.Handle("get_example_queries", ArgumentFor(trimmed, 9, "category")));
                continue;
            }
            if (low[0] == '.') {
                std::cerr << "Unknown command: " << trimmed << " (try .help)\n";
                continue;
            }
        }

        buf += (multiline ? "\n" : "") + line;

        if (Trim(buf).back() != ';') { multiline = true; continue; }
        multiline = false;

        PrintResponse(tools.Handle("execute_sql", json{{"query", buf}}));
        buf.clear();
    }

    gateway->Stop();
    Logger::Shutdown();
    return 0;
}
