/*
 * execd C++ - HTTP Server Implementation
 */
#include <execd/gateway/http_server.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace execd {

namespace {

const int kAcceptPollMs = 200;

std::vector<std::string> path_segments(const std::string& path) {
    std::vector<std::string> out;
    std::vector<std::string> parts = split(path, '/');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!parts[i].empty()) out.push_back(parts[i]);
    }
    return out;
}

void set_socket_timeouts(int fd, int timeout_ms) {
    if (timeout_ms <= 0) return;
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool send_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

void parse_query(const std::string& text, std::map<std::string, std::string>& out) {
    std::vector<std::string> pairs = split(text, '&');
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (pairs[i].empty()) continue;
        size_t eq = pairs[i].find('=');
        if (eq == std::string::npos) {
            out[url_decode(pairs[i])] = "";
        } else {
            out[url_decode(pairs[i].substr(0, eq))] = url_decode(pairs[i].substr(eq + 1));
        }
    }
}

HttpReply error_reply(int status, const std::string& code, const std::string& message) {
    Json body;
    body["code"] = code;
    body["message"] = message;
    return HttpReply::json(status, body);
}

} // anonymous namespace

// ============================================================================
// Request / reply helpers
// ============================================================================

std::string HttpRequest::header(const std::string& name) const {
    std::map<std::string, std::string>::const_iterator it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : std::string();
}

std::string HttpRequest::param(const std::string& name) const {
    std::map<std::string, std::string>::const_iterator it = params.find(name);
    return it != params.end() ? it->second : std::string();
}

bool HttpRequest::has_query(const std::string& name) const {
    return query.find(name) != query.end();
}

std::string HttpRequest::query_param(const std::string& name, const std::string& default_val) const {
    std::map<std::string, std::string>::const_iterator it = query.find(name);
    return it != query.end() ? it->second : default_val;
}

ResponseStream::ResponseStream(int fd, const std::atomic<bool>& running)
    : fd_(fd), running_(running), failed_(false) {}

bool ResponseStream::write(const std::string& data) {
    if (failed_) return false;
    if (!send_all(fd_, data)) {
        failed_ = true;
    }
    return !failed_;
}

bool ResponseStream::open() const {
    return !failed_ && running_.load();
}

HttpReply HttpReply::json(int status, const Json& body) {
    HttpReply reply;
    reply.status = status;
    reply.content_type = "application/json";
    reply.body = json_dump(body);
    return reply;
}

HttpReply HttpReply::text(int status, const std::string& body) {
    HttpReply reply;
    reply.status = status;
    reply.content_type = "text/plain; charset=utf-8";
    reply.body = body;
    return reply;
}

HttpReply HttpReply::event_stream(const std::function<void(ResponseStream&)>& writer) {
    HttpReply reply;
    reply.status = 200;
    reply.content_type = "text/event-stream";
    reply.headers["Cache-Control"] = "no-cache";
    reply.headers["X-Accel-Buffering"] = "no";
    reply.stream = writer;
    return reply;
}

const char* http_status_text(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
    }
    return "Unknown";
}

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(const HttpServerOptions& options)
    : options_(options)
    , listen_fd_(-1)
    , bound_port_(0)
    , running_(false)
    , active_connections_(0)
{
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& pattern, const HttpHandler& handler) {
    Route r;
    r.method = method;
    r.segments = path_segments(pattern);
    r.handler = handler;
    routes_.push_back(r);
}

bool HttpServer::match(const Route& route, const std::vector<std::string>& segments,
                       std::map<std::string, std::string>& params) {
    if (route.segments.size() != segments.size()) return false;
    std::map<std::string, std::string> captured;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& pat = route.segments[i];
        if (pat.size() > 2 && pat[0] == '{' && pat[pat.size() - 1] == '}') {
            captured[pat.substr(1, pat.size() - 2)] = segments[i];
        } else if (pat != segments[i]) {
            return false;
        }
    }
    params.swap(captured);
    return true;
}

HttpReply HttpServer::dispatch(HttpRequest& request) const {
    std::vector<std::string> raw = path_segments(request.path);
    bool path_known = false;
    for (size_t i = 0; i < routes_.size(); ++i) {
        std::map<std::string, std::string> params;
        if (!match(routes_[i], raw, params)) continue;
        path_known = true;
        if (routes_[i].method != request.method) continue;
        request.params = params;
        return routes_[i].handler(request);
    }
    if (path_known) {
        return error_reply(405, "ValidationError", request.method + " not allowed on " + request.path);
    }
    return error_reply(404, "NotFound", "no route for " + request.path);
}

bool HttpServer::start(std::string& error) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("socket: ") + strerror(errno);
        return false;
    }
    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(options_.port));
    if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
        error = "invalid listen address: " + options_.host;
        close(fd);
        return false;
    }
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        error = "bind " + options_.host + ":" + std::to_string(options_.port) + ": " + strerror(errno);
        close(fd);
        return false;
    }
    if (listen(fd, 128) != 0) {
        error = std::string("listen: ") + strerror(errno);
        close(fd);
        return false;
    }

    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = options_.port;
    }

    listen_fd_ = fd;
    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);

    LOG_INFO("[HTTP] Listening on %s:%d", options_.host.c_str(), bound_port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }

    std::unique_lock<std::mutex> lock(conn_mutex_);
    while (active_connections_ > 0) {
        conn_cv_.wait(lock);
    }
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::accept_loop() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, kAcceptPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[HTTP] poll failed: %s", strerror(errno));
            break;
        }
        if (rc == 0) continue;

        int client = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            LOG_ERROR("[HTTP] accept failed: %s", strerror(errno));
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            active_connections_++;
        }
        std::thread(&HttpServer::handle_connection, this, client).detach();
    }
}

void HttpServer::handle_connection(int fd) {
    set_socket_timeouts(fd, options_.io_timeout_ms);

    HttpRequest request;
    HttpReply reply;
    if (read_request(fd, request, reply)) {
        LOG_DEBUG("[HTTP] %s %s", request.method.c_str(), request.path.c_str());
        reply = dispatch(request);
    }
    send_reply(fd, reply);

    shutdown(fd, SHUT_RDWR);
    close(fd);

    std::lock_guard<std::mutex> lock(conn_mutex_);
    active_connections_--;
    conn_cv_.notify_all();
}

bool HttpServer::read_request(int fd, HttpRequest& request, HttpReply& error) {
    std::string buffer;
    size_t header_end = std::string::npos;
    char chunk[8192];

    while (header_end == std::string::npos) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            error = error_reply(400, "ValidationError", "incomplete request");
            return false;
        }
        buffer.append(chunk, static_cast<size_t>(n));
        header_end = buffer.find("\r\n\r\n");
        if (header_end == std::string::npos && buffer.size() > options_.max_header_bytes) {
            error = error_reply(431, "ValidationError", "request headers too large");
            return false;
        }
    }

    std::string head = buffer.substr(0, header_end);
    std::vector<std::string> lines = split(head, '\n');
    if (lines.empty()) {
        error = error_reply(400, "ValidationError", "empty request");
        return false;
    }

    // Request line
    std::vector<std::string> parts = split(trim(lines[0]), ' ');
    if (parts.size() != 3 || !starts_with(parts[2], "HTTP/1.")) {
        error = error_reply(400, "ValidationError", "malformed request line");
        return false;
    }
    request.method = parts[0];
    std::string target = parts[1];
    size_t qmark = target.find('?');
    if (qmark != std::string::npos) {
        parse_query(target.substr(qmark + 1), request.query);
        target = target.substr(0, qmark);
    }
    request.path = url_decode(target);

    for (size_t i = 1; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty()) continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            error = error_reply(400, "ValidationError", "malformed header line");
            return false;
        }
        request.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    if (!request.header("transfer-encoding").empty()) {
        error = error_reply(411, "ValidationError", "chunked request bodies are not supported");
        return false;
    }

    size_t content_length = 0;
    std::string cl = request.header("content-length");
    if (!cl.empty()) {
        int64_t parsed = 0;
        if (!parse_int64(cl, parsed) || parsed < 0) {
            error = error_reply(400, "ValidationError", "invalid Content-Length");
            return false;
        }
        if (static_cast<uint64_t>(parsed) > options_.max_body_bytes) {
            error = error_reply(413, "ValidationError",
                                "request body exceeds " + std::to_string(options_.max_body_bytes) + " bytes");
            return false;
        }
        content_length = static_cast<size_t>(parsed);
    }

    request.body = buffer.substr(header_end + 4);
    if (request.body.size() < content_length &&
        to_lower(request.header("expect")) == "100-continue") {
        send_all(fd, "HTTP/1.1 100 Continue\r\n\r\n");
    }
    while (request.body.size() < content_length) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            error = error_reply(400, "ValidationError", "incomplete request body");
            return false;
        }
        request.body.append(chunk, static_cast<size_t>(n));
    }
    if (request.body.size() > content_length) {
        request.body.resize(content_length);
    }
    return true;
}

void HttpServer::send_reply(int fd, const HttpReply& reply) {
    std::string head = "HTTP/1.1 " + std::to_string(reply.status) + " " + http_status_text(reply.status) + "\r\n";
    head += "Content-Type: " + reply.content_type + "\r\n";
    for (std::map<std::string, std::string>::const_iterator it = reply.headers.begin();
         it != reply.headers.end(); ++it) {
        head += it->first + ": " + it->second + "\r\n";
    }
    head += "Connection: close\r\n";

    if (!reply.stream) {
        head += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n\r\n";
        if (!send_all(fd, head + reply.body)) {
            LOG_DEBUG("[HTTP] Client went away before the reply was sent");
        }
        return;
    }

    head += "\r\n";
    ResponseStream stream(fd, running_);
    if (stream.write(head)) {
        reply.stream(stream);
    }
}

} // namespace execd
