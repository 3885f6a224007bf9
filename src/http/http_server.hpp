//===----------------------------------------------------------------------===//
//                         SQLGate
//
// http/http_server.hpp
//
// HTTP endpoint for tool calls, health checks and metrics
//===----------------------------------------------------------------------===//

#pragma once

#include <asio.hpp>
#include <string>
#include <memory>
#include <functional>
#include <thread>
#include <atomic>
#include <map>
#include <vector>

namespace sqlgate {

class ToolHandler;

constexpr size_t MAX_REQUEST_BODY = 1024 * 1024;  // 1 MiB
constexpr size_t MAX_REQUEST_HEAD = 16 * 1024;
constexpr size_t HTTP_IO_THREADS = 2;

struct HttpRequest {
    std::string method;
    std::string path;       // without query string
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

class HttpServer {
public:
    using TextCallback = std::function<std::string()>;

    // tool_threads bounds how many tool calls run at once, each holds its
    // thread until the statement finishes or times out. Sockets, health and
    // metrics stay on separate io threads.
    HttpServer(const std::string& host, uint16_t port, ToolHandler& tools_p, size_t tool_threads = 4);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void Start();
    void Stop();

    void SetHealthCallback(TextCallback callback) { health_callback_ = std::move(callback); }
    void SetMetricsCallback(TextCallback callback) { metrics_callback_ = std::move(callback); }

    // Actual bound port, useful when constructed with port 0
    uint16_t GetPort() const;

    uint64_t GetRequestCount() const { return request_count_; }

    HttpResponse Route(const HttpRequest& request);

    // Parses the request line and headers. Returns false on a malformed head.
    static bool ParseHead(const std::string& head, HttpRequest& request,
                          size_t& content_length, std::string& error);

    static std::string BuildResponse(const HttpResponse& response);
    static const char* StatusText(int status);

private:
    struct Connection;

    void DoAccept();
    void HandleConnection(asio::ip::tcp::socket socket);
    void OnHead(std::shared_ptr<Connection> conn, size_t head_bytes);
    void Dispatch(std::shared_ptr<Connection> conn);
    HttpResponse SafeRoute(const HttpRequest& request);
    void WriteResponse(std::shared_ptr<Connection> conn, const HttpResponse& response);

    HttpResponse GetHealthResponse();
    HttpResponse GetMetricsResponse();
    static HttpResponse TextResponse(int status, const std::string& body);

private:
    std::string host_;
    uint16_t port_;
    ToolHandler& tools_;
    size_t tool_threads_;

    asio::io_context io_context_;
    std::unique_ptr<asio::thread_pool> tool_pool_;
    asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> request_count_{0};

    TextCallback health_callback_;
    TextCallback metrics_callback_;
};

} // namespace sqlgate
