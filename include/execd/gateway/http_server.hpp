/*
 * execd C++ - HTTP Server
 *
 * Minimal HTTP/1.1 server over POSIX sockets: one thread per connection,
 * one request per connection (`Connection: close`). Routes are patterns
 * whose `{name}` segments are captured into HttpRequest::params.
 *
 * A handler either fills a complete reply or attaches a stream callback;
 * streamed bodies are delimited by closing the connection.
 */
#ifndef execd_GATEWAY_HTTP_SERVER_HPP
#define execd_GATEWAY_HTTP_SERVER_HPP

#include <execd/core/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <condition_variable>

namespace execd {

struct HttpRequest {
    std::string method;
    std::string path;                               // decoded, without query
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;     // lower-cased names
    std::map<std::string, std::string> params;      // route captures
    std::string body;

    std::string header(const std::string& name) const;
    std::string param(const std::string& name) const;
    bool has_query(const std::string& name) const;
    std::string query_param(const std::string& name, const std::string& default_val = "") const;
};

// Write side of a streamed body. Every write is all-or-nothing; after the
// first failure (peer gone, send timeout, server stopping) open() is false.
class ResponseStream {
public:
    ResponseStream(int fd, const std::atomic<bool>& running);

    bool write(const std::string& data);
    bool open() const;

private:
    int fd_;
    const std::atomic<bool>& running_;
    bool failed_;
};

struct HttpReply {
    int status;
    std::string content_type;
    std::string body;
    std::map<std::string, std::string> headers;
    std::function<void(ResponseStream&)> stream;    // set for streamed bodies

    HttpReply() : status(200), content_type("application/json") {}

    static HttpReply json(int status, const Json& body);
    static HttpReply text(int status, const std::string& body);
    static HttpReply event_stream(const std::function<void(ResponseStream&)>& writer);
};

typedef std::function<HttpReply(const HttpRequest&)> HttpHandler;

struct HttpServerOptions {
    std::string host;
    int port;                   // 0 = ephemeral
    size_t max_body_bytes;
    size_t max_header_bytes;
    int io_timeout_ms;          // per-socket read/write timeout

    HttpServerOptions()
        : host("0.0.0.0"), port(44772)
        , max_body_bytes(64 * 1024 * 1024)
        , max_header_bytes(64 * 1024)
        , io_timeout_ms(30000) {}
};

const char* http_status_text(int status);

class HttpServer {
public:
    explicit HttpServer(const HttpServerOptions& options);
    ~HttpServer();

    // Register a handler. Pattern segments like "{id}" match one path segment.
    void route(const std::string& method, const std::string& pattern, const HttpHandler& handler);

    // Bind, listen and start accepting in the background
    bool start(std::string& error);

    // Stop accepting, ask streams to end and wait for open connections
    void stop();

    bool running() const { return running_; }

    // Actual bound port (resolved after start when configured as 0)
    int port() const { return bound_port_; }

    // Route lookup, exposed for tests. Returns 404/405 replies when nothing matches.
    HttpReply dispatch(HttpRequest& request) const;

private:
    struct Route {
        std::string method;
        std::vector<std::string> segments;
        HttpHandler handler;
    };

    HttpServer(const HttpServer&);
    HttpServer& operator=(const HttpServer&);

    void accept_loop();
    void handle_connection(int fd);
    bool read_request(int fd, HttpRequest& request, HttpReply& error_reply);
    void send_reply(int fd, const HttpReply& reply);

    static bool match(const Route& route, const std::vector<std::string>& segments,
                      std::map<std::string, std::string>& params);

    HttpServerOptions options_;
    std::vector<Route> routes_;

    int listen_fd_;
    int bound_port_;
    std::atomic<bool> running_;
    std::thread accept_thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    size_t active_connections_;
};

} // namespace execd

#endif // execd_GATEWAY_HTTP_SERVER_HPP
