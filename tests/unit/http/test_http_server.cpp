//===----------------------------------------------------------------------===//
//                         SQLGate - Unit Tests
//
// tests/unit/http/test_http_server.cpp
//
// Unit tests for HttpServer parsing, routing and the socket round trip
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "protocol/tool_handler.hpp"
#include "gateway/query_gateway.hpp"
#include "common/test_store.hpp"
#include <asio.hpp>
#include <array>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace sqlgate;

//===----------------------------------------------------------------------===//
// Test Fixture
//===----------------------------------------------------------------------===//

class HttpFixture {
public:
    explicit HttpFixture(uint32_t query_timeout_ms = DEFAULT_QUERY_TIMEOUT_MS) {
        GatewayConfig config;
        config.database_path = store_.Path();
        config.executor_threads = 2;
        config.query_timeout_ms = query_timeout_ms;
        gateway_ = std::make_unique<QueryGateway>(store_.OpenReadOnly(), config);
        gateway_->Start();

        tools_ = std::make_unique<ToolHandler>(*gateway_);
        server_ = std::make_unique<HttpServer>("127.0.0.1", 0, *tools_, 2);
    }

    ~HttpFixture() {
        server_.reset();
        tools_.reset();
        gateway_.reset();
    }

    HttpServer& Server() { return *server_; }
    QueryGateway& Gateway() { return *gateway_; }

    // Blocking client: send raw bytes, read until the server closes
    std::string Exchange(const std::string& raw) {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"),
                                               server_->GetPort()));
        asio::write(socket, asio::buffer(raw));

        std::string response;
        std::array<char, 4096> chunk;
        asio::error_code ec;
        for (;;) {
            size_t n = socket.read_some(asio::buffer(chunk), ec);
            response.append(chunk.data(), n);
            if (ec) {
                break;
            }
        }
        assert(ec == asio::error::eof || ec == asio::error::connection_reset);
        return response;
    }

    static std::string Post(const std::string& path, const std::string& body) {
        return "POST " + path + " HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Content-Type: application/json\r\n"
               "Content-Length: " + std::to_string(body.size()) + "\r\n"
               "\r\n" + body;
    }

    static std::string BodyOf(const std::string& response) {
        auto pos = response.find("\r\n\r\n");
        assert(pos != std::string::npos);
        return response.substr(pos + 4);
    }

private:
    testing::TestStore store_;
    std::unique_ptr<QueryGateway> gateway_;
    std::unique_ptr<ToolHandler> tools_;
    std::unique_ptr<HttpServer> server_;
};

static HttpRequest Request(const std::string& method, const std::string& path,
                           const std::string& body = "") {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.body = body;
    return request;
}

//===----------------------------------------------------------------------===//
// Parsing Tests
//===----------------------------------------------------------------------===//

void TestParseHead() {
    std::cout << "  Testing request head parsing..." << std::endl;

    HttpRequest request;
    size_t content_length = 99;
    std::string error;
    bool ok = HttpServer::ParseHead(
        "POST /tools/execute_sql?trace=1 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: application/json\r\n"
        "CONTENT-LENGTH: 17\r\n"
        "\r\n",
        request, content_length, error);

    assert(ok);
    assert(request.method == "POST");
    assert(request.path == "/tools/execute_sql");
    assert(request.headers["host"] == "localhost");
    assert(request.headers["content-type"] == "application/json");
    assert(content_length == 17);

    HttpRequest get;
    ok = HttpServer::ParseHead("GET /health HTTP/1.0\r\n\r\n", get, content_length, error);
    assert(ok);
    assert(content_length == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestParseHeadErrors() {
    std::cout << "  Testing malformed request heads..." << std::endl;

    HttpRequest request;
    size_t content_length = 0;
    std::string error;

    assert(!HttpServer::ParseHead("GARBAGE\r\n\r\n", request, content_length, error));
    assert(error == "Malformed request line");

    HttpRequest missing_version;
    assert(!HttpServer::ParseHead("GET /health\r\n\r\n", missing_version, content_length, error));

    HttpRequest bad_header;
    assert(!HttpServer::ParseHead("GET / HTTP/1.1\r\nno colon here\r\n\r\n",
                                  bad_header, content_length, error));
    assert(error == "Malformed header line");

    HttpRequest bad_length;
    assert(!HttpServer::ParseHead("POST /tools/get_schema HTTP/1.1\r\nContent-Length: -5\r\n\r\n",
                                  bad_length, content_length, error));
    assert(error == "Invalid Content-Length");

    HttpRequest huge_length;
    assert(HttpServer::ParseHead("POST /tools/get_schema HTTP/1.1\r\n"
                                 "Content-Length: 99999999999999999999\r\n\r\n",
                                 huge_length, content_length, error));
    assert(content_length > MAX_REQUEST_BODY);

    std::cout << "    PASSED" << std::endl;
}

void TestBuildResponse() {
    std::cout << "  Testing response serialization..." << std::endl;

    HttpResponse response;
    response.status = 504;
    response.body = "{\"kind\":\"TimeoutError\"}";

    auto raw = HttpServer::BuildResponse(response);
    assert(raw.rfind("HTTP/1.1 504 Gateway Timeout\r\n", 0) == 0);
    assert(raw.find("Content-Type: application/json\r\n") != std::string::npos);
    assert(raw.find("Content-Length: 23\r\n") != std::string::npos);
    assert(raw.find("Connection: close\r\n") != std::string::npos);
    assert(raw.substr(raw.size() - 23) == response.body);

    assert(std::string(HttpServer::StatusText(422)) == "Unprocessable Entity");
    assert(std::string(HttpServer::StatusText(413)) == "Payload Too Large");
    assert(std::string(HttpServer::StatusText(299)) == "Unknown");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Routing Tests
//===----------------------------------------------------------------------===//

void TestRouteTools() {
    std::cout << "  Testing tool routes..." << std::endl;

    HttpFixture fixture;
    auto& server = fixture.Server();

    auto response = server.Route(Request("POST", "/tools/execute_sql", "{\"query\": \"SELECT 1 AS one\"}"));
    assert(response.status == 200);
    assert(response.content_type == "application/json");
    auto body = json::parse(response.body);
    assert(body["rows"][0][0] == 1);

    auto empty_body = server.Route(Request("POST", "/tools/get_example_queries"));
    assert(empty_body.status == 200);
    assert(json::parse(empty_body.body)["category"] == "all");

    auto unknown = server.Route(Request("POST", "/tools/drop_everything", "{}"));
    assert(unknown.status == 404);
    assert(json::parse(unknown.body)["kind"] == "NotFoundError");

    auto wrong_method = server.Route(Request("GET", "/tools/get_schema"));
    assert(wrong_method.status == 405);

    std::cout << "    PASSED" << std::endl;
}

void TestRouteServiceEndpoints() {
    std::cout << "  Testing health, metrics and root routes..." << std::endl;

    HttpFixture fixture;
    auto& server = fixture.Server();

    auto health = server.Route(Request("GET", "/health"));
    assert(health.status == 200);
    assert(json::parse(health.body)["status"] == "healthy");

    // Callback replaces the default body
    server.SetHealthCallback([&fixture]() { return fixture.Gateway().RenderHealth(); });
    auto ready = server.Route(Request("GET", "/ready"));
    auto health_doc = json::parse(ready.body);
    assert(health_doc["status"] == "healthy");
    assert(health_doc.contains("pool_available"));

    server.SetMetricsCallback([&fixture]() { return fixture.Gateway().RenderMetrics(); });
    auto metrics = server.Route(Request("GET", "/metrics"));
    assert(metrics.status == 200);
    assert(metrics.content_type.rfind("text/plain", 0) == 0);
    assert(metrics.body.find("sqlgate_http_requests_total 0") != std::string::npos);
    assert(metrics.body.find("sqlgate_queries_total") != std::string::npos);

    auto root = server.Route(Request("GET", "/"));
    assert(root.status == 200);
    assert(root.body == "SQLGate");

    auto missing = server.Route(Request("GET", "/nope"));
    assert(missing.status == 404);

    auto post_health = server.Route(Request("POST", "/health"));
    assert(post_health.status == 405);

    std::cout << "    PASSED" << std::endl;
}

void TestRouteInvalidUtf8() {
    std::cout << "  Testing non UTF-8 input echoed in error bodies..." << std::endl;

    HttpFixture fixture;
    auto& server = fixture.Server();

    auto unknown = server.Route(Request("POST", "/tools/\xff\xfe", "{}"));
    assert(unknown.status == 404);
    auto body = json::parse(unknown.body);
    assert(body["kind"] == "NotFoundError");
    assert(body["message"].get<std::string>().find("\xEF\xBF\xBD") != std::string::npos);

    // Validator quotes the token after the first statement
    auto stacked = server.Route(Request("POST", "/tools/execute_sql",
                                        "{\"query\": \"SELECT 1; \\u00ff\"}"));
    assert(stacked.status == 400);
    assert(json::parse(stacked.body)["kind"] == "ValidationError");

    auto raw_stacked = ToolHandler(fixture.Gateway()).Handle(
        "execute_sql", json{{"query", "SELECT 1; \xff;"}});
    assert(raw_stacked.status == 400);
    assert(!JsonSerializer::Dump(raw_stacked.body).empty());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Socket Tests
//===----------------------------------------------------------------------===//

void TestRoundTrip() {
    std::cout << "  Testing request over a socket..." << std::endl;

    HttpFixture fixture;
    auto& server = fixture.Server();
    assert(server.GetPort() != 0);
    server.Start();

    auto response = fixture.Exchange(HttpFixture::Post(
        "/tools/get_schema", "{\"table_name\": \"foicu\"}"));
    assert(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    auto body = json::parse(HttpFixture::BodyOf(response));
    assert(body["name"] == "foicu");
    assert(body["row_count"] == 2 * testing::CREDIT_UNIONS);

    auto rejected = fixture.Exchange(HttpFixture::Post(
        "/tools/execute_sql", "{\"query\": \"DELETE FROM foicu\"}"));
    assert(rejected.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
    assert(json::parse(HttpFixture::BodyOf(rejected))["kind"] == "ValidationError");

    auto health = fixture.Exchange("GET /healthz HTTP/1.1\r\nHost: localhost\r\n\r\n");
    assert(health.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);

    assert(server.GetRequestCount() == 3);

    server.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestInvalidUtf8PathOverSocket() {
    std::cout << "  Testing non UTF-8 tool path over a socket..." << std::endl;

    HttpFixture fixture;
    fixture.Server().Start();

    auto response = fixture.Exchange(HttpFixture::Post("/tools/\xff", "{}"));
    assert(response.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    assert(json::parse(HttpFixture::BodyOf(response))["kind"] == "NotFoundError");

    // Server is still serving
    auto health = fixture.Exchange("GET /health HTTP/1.1\r\n\r\n");
    assert(health.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);

    fixture.Server().Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestHealthWhileToolBlocked() {
    std::cout << "  Testing health answers while a tool call is running..." << std::endl;

    HttpFixture fixture(3000);
    fixture.Server().Start();

    std::string slow;
    std::thread caller([&fixture, &slow]() {
        slow = fixture.Exchange(HttpFixture::Post(
            "/tools/execute_sql",
            std::string("{\"query\": \"") + testing::LONG_RUNNING_QUERY + "\"}"));
    });

    auto limit = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fixture.Gateway().GetMetrics().active_sessions == 0) {
        assert(std::chrono::steady_clock::now() < limit);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto start = std::chrono::steady_clock::now();
    auto health = fixture.Exchange("GET /health HTTP/1.1\r\n\r\n");
    auto metrics = fixture.Exchange("GET /metrics HTTP/1.1\r\n\r\n");
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(health.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(metrics.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(elapsed < std::chrono::seconds(1));

    caller.join();
    assert(slow.rfind("HTTP/1.1 504 Gateway Timeout\r\n", 0) == 0);

    fixture.Server().Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestOversizedBody() {
    std::cout << "  Testing oversized body is refused..." << std::endl;

    HttpFixture fixture;
    fixture.Server().Start();

    std::string head = "POST /tools/execute_sql HTTP/1.1\r\n"
                       "Content-Length: " + std::to_string(MAX_REQUEST_BODY + 1) + "\r\n\r\n";
    auto response = fixture.Exchange(head);
    assert(response.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0) == 0);

    auto bad = fixture.Exchange("NONSENSE\r\n\r\n");
    assert(bad.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

    fixture.Server().Stop();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== HttpServer Unit Tests ===" << std::endl;

    std::cout << "\n1. Parsing Tests:" << std::endl;
    TestParseHead();
    TestParseHeadErrors();
    TestBuildResponse();

    std::cout << "\n2. Routing Tests:" << std::endl;
    TestRouteTools();
    TestRouteServiceEndpoints();
    TestRouteInvalidUtf8();

    std::cout << "\n3. Socket Tests:" << std::endl;
    TestRoundTrip();
    TestInvalidUtf8PathOverSocket();
    TestHealthWhileToolBlocked();
    TestOversizedBody();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
