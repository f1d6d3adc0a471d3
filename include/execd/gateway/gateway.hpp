/*
 * execd C++ - Protocol Gateway
 *
 * Maps the HTTP wire contract onto the runner, the file service, the
 * session manager and the registry. Requests are validated before anything
 * is started; once an execution exists its failures are reported through
 * its status, never through a broken connection.
 *
 * Log streams are Server-Sent Events read from the registry with a cursor.
 * A client that disconnects stops only its own stream.
 */
#ifndef execd_GATEWAY_GATEWAY_HPP
#define execd_GATEWAY_GATEWAY_HPP

#include "http_server.hpp"
#include "auth.hpp"
#include <execd/exec/registry.hpp>
#include <execd/exec/process_runner.hpp>
#include <execd/exec/file_service.hpp>
#include <execd/kernel/session_manager.hpp>
#include <string>
#include <mutex>

namespace execd {

struct SandboxInfo {
    std::string id;
    std::string state;          // Running, Expired, Stopping, ...
    std::string image;
    std::string entrypoint;
    int64_t created_at;         // unix seconds
    int64_t expires_at;         // unix seconds, 0 = never

    SandboxInfo() : state("Running"), created_at(0), expires_at(0) {}

    Json to_json() const;
};

struct GatewayOptions {
    HttpServerOptions http;
    std::string sandbox_id;     // empty: any id is accepted
    std::string api_key;        // empty: authentication disabled
    int heartbeat_ms;

    GatewayOptions() : heartbeat_ms(15000) {}
};

class Gateway {
public:
    Gateway(const GatewayOptions& options, ExecutionRegistry& registry, ProcessRunner& runner,
            FileService& files, SessionManager& sessions, const SandboxInfo& sandbox);
    ~Gateway();

    bool start(std::string& error);
    void stop();

    int port() const { return server_.port(); }

    void set_sandbox_state(const std::string& state);
    SandboxInfo sandbox() const;

    // Wire error body {"code","message"} with the matching HTTP status
    static HttpReply error_reply(ErrorCode code, const std::string& message);

private:
    typedef HttpReply (Gateway::*Handler)(const HttpRequest&);

    Gateway(const Gateway&);
    Gateway& operator=(const Gateway&);

    void register_routes();
    void add(const std::string& method, const std::string& pattern, Handler handler, bool authenticated = true);
    OpStatus check_sandbox(const HttpRequest& request) const;

    HttpReply handle_health(const HttpRequest& request);
    HttpReply handle_sandbox(const HttpRequest& request);

    // Commands
    HttpReply handle_run_command(const HttpRequest& request);
    HttpReply handle_get_command(const HttpRequest& request);
    HttpReply handle_command_logs(const HttpRequest& request);
    HttpReply handle_cancel_command(const HttpRequest& request);

    // Files
    HttpReply handle_write_files(const HttpRequest& request);
    HttpReply handle_read_file(const HttpRequest& request);
    HttpReply handle_delete_file(const HttpRequest& request);
    HttpReply handle_list_files(const HttpRequest& request);
    HttpReply handle_file_info(const HttpRequest& request);
    HttpReply handle_make_dirs(const HttpRequest& request);
    HttpReply handle_move_file(const HttpRequest& request);

    // Contexts and code
    HttpReply handle_create_context(const HttpRequest& request);
    HttpReply handle_list_contexts(const HttpRequest& request);
    HttpReply handle_get_context(const HttpRequest& request);
    HttpReply handle_close_context(const HttpRequest& request);
    HttpReply handle_submit_code(const HttpRequest& request);
    HttpReply handle_run_code(const HttpRequest& request);
    HttpReply handle_get_code(const HttpRequest& request);
    HttpReply handle_code_logs(const HttpRequest& request);
    HttpReply handle_cancel_code(const HttpRequest& request);

    HttpReply get_execution(const HttpRequest& request, ExecutionKind kind);
    HttpReply cancel_execution(const HttpRequest& request, ExecutionKind kind);
    HttpReply stream_logs(const HttpRequest& request, ExecutionKind kind);
    void write_log_stream(ResponseStream& out, const std::string& id, ExecutionKind kind, int64_t cursor);

    GatewayOptions options_;
    ExecutionRegistry& registry_;
    ProcessRunner& runner_;
    FileService& files_;
    SessionManager& sessions_;
    Authenticator auth_;
    HttpServer server_;

    mutable std::mutex sandbox_mutex_;
    SandboxInfo sandbox_;
};

} // namespace execd

#endif // execd_GATEWAY_GATEWAY_HPP
