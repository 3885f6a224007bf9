//===----------------------------------------------------------------------===//
//                         SQLGate
//
// http/http_server.cpp
//
// HTTP endpoint implementation
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "protocol/tool_handler.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace sqlgate {

namespace {

constexpr const char* TOOLS_PREFIX = "/tools/";

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

struct HttpServer::Connection {
    explicit Connection(asio::ip::tcp::socket socket_p)
        : socket(std::move(socket_p))
        , buffer(MAX_REQUEST_HEAD + MAX_REQUEST_BODY) {}

    asio::ip::tcp::socket socket;
    asio::streambuf buffer;
    HttpRequest request;
    size_t content_length = 0;
};

HttpServer::HttpServer(const std::string& host, uint16_t port, ToolHandler& tools_p, size_t tool_threads)
    : host_(host)
    , port_(port)
    , tools_(tools_p)
    , tool_threads_(std::max<size_t>(tool_threads, 1))
    , acceptor_(io_context_) {

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(host_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

HttpServer::~HttpServer() {
    Stop();
}

uint16_t HttpServer::GetPort() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void HttpServer::Start() {
    if (running_) return;
    running_ = true;

    tool_pool_ = std::make_unique<asio::thread_pool>(tool_threads_);
    DoAccept();

    for (size_t i = 0; i < HTTP_IO_THREADS; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }

    LOG_INFO("http", "HTTP server listening on " + host_ + ":" + std::to_string(GetPort()) +
             " (" + std::to_string(tool_threads_) + " tool threads)");
}

void HttpServer::Stop() {
    if (!running_) return;
    running_ = false;

    asio::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // Queued tool calls are dropped, running ones finish within their deadline
    if (tool_pool_) {
        tool_pool_->stop();
        tool_pool_->join();
    }

    LOG_INFO("http", "HTTP server stopped");
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        if (!ec && running_) {
            HandleConnection(std::move(socket));
        }
        if (running_ && acceptor_.is_open()) {
            DoAccept();
        }
    });
}

void HttpServer::HandleConnection(asio::ip::tcp::socket socket) {
    auto conn = std::make_shared<Connection>(std::move(socket));

    asio::async_read_until(conn->socket, conn->buffer, "\r\n\r\n",
        [this, conn](std::error_code ec, size_t head_bytes) {
            if (ec == asio::error::not_found) {
                WriteResponse(conn, TextResponse(413, "Request head too large"));
                return;
            }
            if (ec) return;
            OnHead(conn, head_bytes);
        });
}

void HttpServer::OnHead(std::shared_ptr<Connection> conn, size_t head_bytes) {
    auto data = conn->buffer.data();
    std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + head_bytes);
    conn->buffer.consume(head_bytes);

    std::string error;
    if (head.size() > MAX_REQUEST_HEAD) {
        WriteResponse(conn, TextResponse(413, "Request head too large"));
        return;
    }
    if (!ParseHead(head, conn->request, conn->content_length, error)) {
        WriteResponse(conn, TextResponse(400, error));
        return;
    }
    if (conn->content_length > MAX_REQUEST_BODY) {
        WriteResponse(conn, TextResponse(413, "Request body exceeds " +
                                         std::to_string(MAX_REQUEST_BODY) + " bytes"));
        return;
    }

    size_t buffered = conn->buffer.size();
    if (buffered >= conn->content_length) {
        Dispatch(conn);
        return;
    }

    asio::async_read(conn->socket, conn->buffer,
        asio::transfer_exactly(conn->content_length - buffered),
        [this, conn](std::error_code ec, size_t /*bytes_read*/) {
            if (ec) return;
            Dispatch(conn);
        });
}

void HttpServer::Dispatch(std::shared_ptr<Connection> conn) {
    auto data = conn->buffer.data();
    conn->request.body.assign(asio::buffers_begin(data),
                              asio::buffers_begin(data) + conn->content_length);
    conn->buffer.consume(conn->content_length);

    request_count_++;

    if (conn->request.path.rfind(TOOLS_PREFIX, 0) != 0 || !tool_pool_) {
        WriteResponse(conn, SafeRoute(conn->request));
        return;
    }

    // Tool calls may block until their deadline; keep them off the io threads
    asio::post(*tool_pool_, [this, conn]() {
        auto response = std::make_shared<HttpResponse>(SafeRoute(conn->request));
        asio::post(io_context_, [this, conn, response]() {
            WriteResponse(conn, *response);
        });
    });
}

HttpResponse HttpServer::SafeRoute(const HttpRequest& request) {
    try {
        return Route(request);
    } catch (const std::exception& e) {
        LOG_ERROR("http", request.method + " " + JsonSerializer::Dump(request.path) +
                  " failed: " + e.what());
        return TextResponse(500, "Internal Server Error");
    }
}

void HttpServer::WriteResponse(std::shared_ptr<Connection> conn, const HttpResponse& response) {
    auto payload = std::make_shared<std::string>(BuildResponse(response));
    asio::async_write(conn->socket, asio::buffer(*payload),
        [conn, payload](std::error_code /*ec*/, size_t /*bytes_written*/) {
            asio::error_code shutdown_ec;
            conn->socket.shutdown(asio::ip::tcp::socket::shutdown_both, shutdown_ec);
            conn->socket.close(shutdown_ec);
        });
}

bool HttpServer::ParseHead(const std::string& head, HttpRequest& request,
                           size_t& content_length, std::string& error) {
    std::istringstream stream(head);
    std::string request_line;
    if (!std::getline(stream, request_line)) {
        error = "Empty request";
        return false;
    }

    std::istringstream line(Trim(request_line));
    std::string target, version;
    line >> request.method >> target >> version;
    if (request.method.empty() || target.empty() || version.rfind("HTTP/", 0) != 0) {
        error = "Malformed request line";
        return false;
    }
    request.path = target.substr(0, target.find('?'));

    content_length = 0;
    std::string header;
    while (std::getline(stream, header)) {
        header = Trim(header);
        if (header.empty()) {
            break;
        }
        auto colon = header.find(':');
        if (colon == std::string::npos) {
            error = "Malformed header line";
            return false;
        }
        std::string name = ToLower(Trim(header.substr(0, colon)));
        std::string value = Trim(header.substr(colon + 1));
        request.headers[name] = value;

        if (name == "content-length") {
            if (value.empty() || !std::all_of(value.begin(), value.end(),
                                              [](unsigned char c) { return std::isdigit(c); })) {
                error = "Invalid Content-Length";
                return false;
            }
            // Anything too long to parse is certainly over the body limit
            content_length = value.size() > 12 ? MAX_REQUEST_BODY + 1 : std::stoull(value);
        }
    }
    return true;
}

HttpResponse HttpServer::Route(const HttpRequest& request) {
    const std::string& path = request.path;

    if (path.rfind(TOOLS_PREFIX, 0) == 0) {
        if (request.method != "POST") {
            return TextResponse(405, "Method Not Allowed");
        }
        std::string operation = path.substr(std::char_traits<char>::length(TOOLS_PREFIX));
        ToolResponse result = tools_.Handle(operation, request.body);

        HttpResponse response;
        response.status = result.status;
        response.body = JsonSerializer::Dump(result.body);
        return response;
    }

    if (request.method != "GET") {
        return TextResponse(405, "Method Not Allowed");
    }

    if (path == "/health" || path == "/healthz" || path == "/ready") {
        return GetHealthResponse();
    } else if (path == "/metrics") {
        return GetMetricsResponse();
    } else if (path == "/") {
        return TextResponse(200, "SQLGate");
    }

    return TextResponse(404, "Not Found");
}

const char* HttpServer::StatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

std::string HttpServer::BuildResponse(const HttpResponse& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << StatusText(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    return oss.str();
}

HttpResponse HttpServer::TextResponse(int status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.content_type = "text/plain";
    response.body = body;
    return response;
}

HttpResponse HttpServer::GetHealthResponse() {
    HttpResponse response;
    response.body = health_callback_ ? health_callback_() : "{\"status\":\"healthy\"}";
    return response;
}

HttpResponse HttpServer::GetMetricsResponse() {
    std::ostringstream metrics;
    metrics << "# HELP sqlgate_http_requests_total HTTP requests with a complete body\n"
            << "# TYPE sqlgate_http_requests_total counter\n"
            << "sqlgate_http_requests_total " << request_count_.load() << "\n";

    if (metrics_callback_) {
        metrics << "\n" << metrics_callback_();
    }

    HttpResponse response;
    response.content_type = "text/plain; version=0.0.4";
    response.body = metrics.str();
    return response;
}

} // namespace sqlgate
