/*
 * execd C++ - Protocol Gateway Implementation
 */
#include <execd/gateway/gateway.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

#include <algorithm>

namespace execd {

namespace {

const int kMaxStreamSliceMs = 1000;

// ============================================================================
// Request parsing
// ============================================================================

bool parse_body(const HttpRequest& request, Json& out, std::string& error) {
    if (trim(request.body).empty()) {
        error = "request body is required";
        return false;
    }
    try {
        out = Json::parse(request.body);
    } catch (const Json::parse_error& e) {
        error = std::string("malformed JSON body: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        error = "request body must be a JSON object";
        return false;
    }
    return true;
}

bool read_string(const Json& body, const char* key, bool required, std::string& out, std::string& error) {
    if (!body.contains(key) || body[key].is_null()) {
        if (required) {
            error = std::string("'") + key + "' is required";
            return false;
        }
        return true;
    }
    if (!body[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = body[key].get<std::string>();
    return true;
}

bool read_timeout(const Json& body, double& out, std::string& error) {
    if (!body.contains("timeout") || body["timeout"].is_null()) {
        return true;
    }
    if (!body["timeout"].is_number()) {
        error = "'timeout' must be a number of seconds";
        return false;
    }
    out = body["timeout"].get<double>();
    if (!is_valid_timeout(out)) {
        error = "'timeout' must be between 0 and " + std::to_string(static_cast<int64_t>(kMaxTimeoutSeconds)) +
                " seconds";
        return false;
    }
    return true;
}

bool read_envs(const Json& body, std::map<std::string, std::string>& out, std::string& error) {
    if (!body.contains("envs") || body["envs"].is_null()) {
        return true;
    }
    const Json& envs = body["envs"];
    if (!envs.is_object()) {
        error = "'envs' must be an object of strings";
        return false;
    }
    for (Json::const_iterator it = envs.begin(); it != envs.end(); ++it) {
        if (!it.value().is_string()) {
            error = "'envs." + it.key() + "' must be a string";
            return false;
        }
        out[it.key()] = it.value().get<std::string>();
    }
    return true;
}

// 644, "644" or "0644"
bool read_mode(const Json& body, std::string& out, std::string& error) {
    if (!body.contains("mode") || body["mode"].is_null()) {
        return true;
    }
    const Json& mode = body["mode"];
    if (mode.is_number_integer()) {
        out = std::to_string(mode.get<int64_t>());
        return true;
    }
    if (mode.is_string()) {
        out = mode.get<std::string>();
        return true;
    }
    error = "'mode' must be an octal number or string";
    return false;
}

bool query_flag(const HttpRequest& request, const std::string& name) {
    std::string value = to_lower(request.query_param(name));
    return value == "true" || value == "1" || value == "yes";
}

// ============================================================================
// Server-Sent Events
// ============================================================================

std::string sse_frame(const std::string& event, const Json& data, int64_t id = -1) {
    std::string frame;
    if (id >= 0) {
        frame += "id: " + std::to_string(id) + "\n";
    }
    frame += "event: " + event + "\n";
    frame += "data: " + json_dump(data) + "\n\n";
    return frame;
}

std::string chunk_frame(const LogChunk& chunk) {
    return sse_frame(stream_kind_name(chunk.stream), chunk.to_json(), chunk.seq);
}

std::string terminal_frame(const ExecutionSnapshot& snap) {
    Json data;
    data["status"] = execution_status_name(snap.status);

    if (snap.kind == ExecutionKind::Command) {
        data["exit_code"] = snap.has_exit_code ? Json(snap.exit_code) : Json();
        data["truncated"] = snap.truncated;
        if (!snap.error.empty()) {
            data["error"] = snap.error.to_json();
        }
        return sse_frame("status", data);
    }

    data["execution_count"] = snap.execution_count;
    if (snap.status == ExecutionStatus::Completed) {
        data["result"] = snap.result;
        return sse_frame("result", data);
    }
    Json err = snap.error.to_json();
    data["code"] = err["code"];
    data["ename"] = err["ename"];
    data["evalue"] = err["evalue"];
    data["traceback"] = err["traceback"];
    return sse_frame("error", data);
}

} // anonymous namespace

Json SandboxInfo::to_json() const {
    Json j;
    j["id"] = id;
    j["state"] = state;
    j["image"] = image;
    j["entrypoint"] = entrypoint;
    j["created_at"] = created_at;
    j["expires_at"] = expires_at ? Json(expires_at) : Json();
    return j;
}

// ============================================================================
// Gateway
// ============================================================================

Gateway::Gateway(const GatewayOptions& options, ExecutionRegistry& registry, ProcessRunner& runner,
                 FileService& files, SessionManager& sessions, const SandboxInfo& sandbox)
    : options_(options)
    , registry_(registry)
    , runner_(runner)
    , files_(files)
    , sessions_(sessions)
    , auth_(options.api_key)
    , server_(options.http)
    , sandbox_(sandbox)
{
    register_routes();
}

Gateway::~Gateway() {
    stop();
}

bool Gateway::start(std::string& error) {
    if (!auth_.enabled()) {
        LOG_WARN("[Gateway] No API key configured, authentication is disabled");
    }
    return server_.start(error);
}

void Gateway::stop() {
    server_.stop();
}

void Gateway::set_sandbox_state(const std::string& state) {
    std::lock_guard<std::mutex> lock(sandbox_mutex_);
    sandbox_.state = state;
}

SandboxInfo Gateway::sandbox() const {
    std::lock_guard<std::mutex> lock(sandbox_mutex_);
    return sandbox_;
}

HttpReply Gateway::error_reply(ErrorCode code, const std::string& message) {
    Json body;
    body["code"] = error_code_name(code);
    body["message"] = message;
    return HttpReply::json(error_code_http_status(code), body);
}

void Gateway::add(const std::string& method, const std::string& pattern, Handler handler, bool authenticated) {
    server_.route(method, pattern, [this, handler, authenticated](const HttpRequest& request) -> HttpReply {
        if (authenticated) {
            OpStatus auth = auth_.check(request);
            if (!auth.success) {
                LOG_DEBUG("[Gateway] %s %s rejected: %s",
                          request.method.c_str(), request.path.c_str(), auth.error.c_str());
                return error_reply(auth.code, auth.error);
            }
        }
        try {
            return (this->*handler)(request);
        } catch (const std::exception& e) {
            LOG_ERROR("[Gateway] %s %s failed: %s", request.method.c_str(), request.path.c_str(), e.what());
            return error_reply(ErrorCode::InternalError, e.what());
        }
    });
}

void Gateway::register_routes() {
    add("GET", "/health", &Gateway::handle_health, false);
    add("GET", "/sandboxes/{id}", &Gateway::handle_sandbox);

    add("POST", "/sandboxes/{id}/commands", &Gateway::handle_run_command);
    add("GET", "/commands/{eid}", &Gateway::handle_get_command);
    add("GET", "/commands/{eid}/logs", &Gateway::handle_command_logs);
    add("POST", "/commands/{eid}/cancel", &Gateway::handle_cancel_command);

    add("POST", "/sandboxes/{id}/files", &Gateway::handle_write_files);
    add("GET", "/sandboxes/{id}/files", &Gateway::handle_read_file);
    add("DELETE", "/sandboxes/{id}/files", &Gateway::handle_delete_file);
    add("GET", "/sandboxes/{id}/files/list", &Gateway::handle_list_files);
    add("GET", "/sandboxes/{id}/files/info", &Gateway::handle_file_info);
    add("POST", "/sandboxes/{id}/files/mkdir", &Gateway::handle_make_dirs);
    add("POST", "/sandboxes/{id}/files/move", &Gateway::handle_move_file);

    add("POST", "/sandboxes/{id}/contexts", &Gateway::handle_create_context);
    add("GET", "/sandboxes/{id}/contexts", &Gateway::handle_list_contexts);
    add("GET", "/contexts/{cid}", &Gateway::handle_get_context);
    add("DELETE", "/contexts/{cid}", &Gateway::handle_close_context);
    add("POST", "/contexts/{cid}/codes", &Gateway::handle_submit_code);
    add("POST", "/sandboxes/{id}/codes", &Gateway::handle_run_code);
    add("GET", "/codes/{eid}", &Gateway::handle_get_code);
    add("GET", "/codes/{eid}/logs", &Gateway::handle_code_logs);
    add("POST", "/codes/{eid}/cancel", &Gateway::handle_cancel_code);
}

OpStatus Gateway::check_sandbox(const HttpRequest& request) const {
    std::string id = request.param("id");
    if (id.empty()) {
        return OpStatus::fail(ErrorCode::ValidationError, "sandbox id is required");
    }
    if (!options_.sandbox_id.empty() && id != options_.sandbox_id) {
        return OpStatus::fail(ErrorCode::NotFound, "sandbox not found: " + id);
    }
    return OpStatus::ok();
}

HttpReply Gateway::handle_health(const HttpRequest&) {
    Json body;
    body["status"] = "ok";
    return HttpReply::json(200, body);
}

HttpReply Gateway::handle_sandbox(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    SandboxInfo info = sandbox();
    if (info.id.empty()) {
        info.id = request.param("id");
    }
    return HttpReply::json(200, info.to_json());
}

// ============================================================================
// Commands
// ============================================================================

HttpReply Gateway::handle_run_command(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    Json body;
    std::string error;
    CommandRequest cmd;
    if (!parse_body(request, body, error) ||
        !read_string(body, "command", true, cmd.command, error) ||
        !read_string(body, "cwd", false, cmd.cwd, error) ||
        !read_envs(body, cmd.envs, error) ||
        !read_timeout(body, cmd.timeout_seconds, error)) {
        return error_reply(ErrorCode::ValidationError, error);
    }
    cmd.sandbox_id = request.param("id");

    OpResult<std::string> started = runner_.run(cmd);
    if (!started.success) {
        return error_reply(started.code, started.error);
    }

    Json reply;
    reply["execution_id"] = started.value;
    OpResult<ExecutionSnapshot> snap = registry_.get(started.value);
    reply["status"] = snap.success ? execution_status_name(snap.value.status) : "Running";
    return HttpReply::json(202, reply);
}

HttpReply Gateway::handle_get_command(const HttpRequest& request) {
    return get_execution(request, ExecutionKind::Command);
}

HttpReply Gateway::handle_command_logs(const HttpRequest& request) {
    return stream_logs(request, ExecutionKind::Command);
}

HttpReply Gateway::handle_cancel_command(const HttpRequest& request) {
    return cancel_execution(request, ExecutionKind::Command);
}

HttpReply Gateway::get_execution(const HttpRequest& request, ExecutionKind kind) {
    std::string id = request.param("eid");
    OpResult<ExecutionSnapshot> snap = registry_.get(id, query_flag(request, "logs"));
    if (!snap.success || snap.value.kind != kind) {
        return error_reply(ErrorCode::NotFound, "execution not found: " + id);
    }
    return HttpReply::json(200, snap.value.to_json(query_flag(request, "logs")));
}

HttpReply Gateway::cancel_execution(const HttpRequest& request, ExecutionKind kind) {
    std::string id = request.param("eid");
    Json reply;
    reply["execution_id"] = id;

    OpResult<ExecutionSnapshot> snap = registry_.get(id);
    if (!snap.success || snap.value.kind != kind) {
        // Unknown ids are a successful no-op
        reply["status"] = Json();
        return HttpReply::json(200, reply);
    }

    if (!snap.value.terminal()) {
        OpStatus cancelled = (kind == ExecutionKind::Command) ? runner_.cancel(id) : sessions_.cancel(id);
        if (!cancelled.success) {
            return error_reply(cancelled.code, cancelled.error);
        }
        LOG_DEBUG("[Gateway] Cancel requested for %s", id.c_str());
        snap = registry_.get(id);
    }
    reply["status"] = snap.success ? Json(execution_status_name(snap.value.status)) : Json();
    return HttpReply::json(200, reply);
}

HttpReply Gateway::stream_logs(const HttpRequest& request, ExecutionKind kind) {
    std::string id = request.param("eid");
    OpResult<ExecutionSnapshot> snap = registry_.get(id);
    if (!snap.success || snap.value.kind != kind) {
        return error_reply(ErrorCode::NotFound, "execution not found: " + id);
    }

    // `offset` is the first seq wanted; Last-Event-ID the last one received
    int64_t cursor = 0;
    if (request.has_query("offset")) {
        if (!parse_int64(request.query_param("offset"), cursor) || cursor < 0) {
            return error_reply(ErrorCode::ValidationError, "'offset' must be a non-negative integer");
        }
    } else if (!request.header("last-event-id").empty()) {
        int64_t last = 0;
        if (!parse_int64(request.header("last-event-id"), last) || last < 0) {
            return error_reply(ErrorCode::ValidationError, "Last-Event-ID must be a non-negative integer");
        }
        cursor = last + 1;
    }

    return HttpReply::event_stream([this, id, kind, cursor](ResponseStream& out) {
        write_log_stream(out, id, kind, cursor);
    });
}

void Gateway::write_log_stream(ResponseStream& out, const std::string& id, ExecutionKind kind, int64_t cursor) {
    int heartbeat = options_.heartbeat_ms > 0 ? options_.heartbeat_ms : kMaxStreamSliceMs;
    int slice = std::min(heartbeat, kMaxStreamSliceMs);
    int64_t last_write = monotonic_ms();

    while (out.open()) {
        LogBatch batch = registry_.wait_logs(id, cursor, slice);
        if (!batch.found) {
            // Evicted while streaming: finish from the archive if possible
            OpResult<ExecutionSnapshot> snap = registry_.get(id);
            if (snap.success && snap.value.terminal() && snap.value.kind == kind) {
                out.write(terminal_frame(snap.value));
            }
            return;
        }

        for (size_t i = 0; i < batch.chunks.size(); ++i) {
            if (!out.write(chunk_frame(batch.chunks[i]))) {
                LOG_DEBUG("[Gateway] Log stream for %s closed by client", id.c_str());
                return;
            }
        }
        if (!batch.chunks.empty()) {
            cursor = batch.next_seq;
            last_write = monotonic_ms();
        }

        if (batch.finished) {
            OpResult<ExecutionSnapshot> snap = registry_.get(id);
            if (snap.success) {
                out.write(terminal_frame(snap.value));
            }
            return;
        }

        if (batch.chunks.empty() && monotonic_ms() - last_write >= heartbeat) {
            if (!out.write(": keep-alive\n\n")) return;
            last_write = monotonic_ms();
        }
    }
}

// ============================================================================
// Files
// ============================================================================

HttpReply Gateway::handle_write_files(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    Json body;
    std::string error;
    if (!parse_body(request, body, error)) {
        return error_reply(ErrorCode::ValidationError, error);
    }
    if (!body.contains("entries") || !body["entries"].is_array()) {
        return error_reply(ErrorCode::ValidationError, "'entries' must be an array");
    }

    std::vector<FileWriteEntry> entries;
    const Json& list = body["entries"];
    for (size_t i = 0; i < list.size(); ++i) {
        const Json& item = list[i];
        if (!item.is_object()) {
            return error_reply(ErrorCode::ValidationError, "entries[" + std::to_string(i) + "] must be an object");
        }
        FileWriteEntry entry;
        if (!read_string(item, "path", true, entry.path, error) ||
            !read_string(item, "data", false, entry.data, error) ||
            !read_string(item, "encoding", false, entry.encoding, error) ||
            !read_mode(item, entry.mode, error)) {
            return error_reply(ErrorCode::ValidationError, "entries[" + std::to_string(i) + "]: " + error);
        }
        entries.push_back(entry);
    }

    std::vector<FileWriteResult> results = files_.write_files(entries);
    Json reply;
    reply["results"] = Json::array();
    for (size_t i = 0; i < results.size(); ++i) {
        reply["results"].push_back(results[i].to_json());
    }
    return HttpReply::json(200, reply);
}

HttpReply Gateway::handle_read_file(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);
    if (!request.has_query("path")) {
        return error_reply(ErrorCode::ValidationError, "'path' is required");
    }

    OpResult<FileContent> content = files_.read_file(request.query_param("path"),
                                                     request.query_param("encoding", "utf-8"));
    if (!content.success) {
        return error_reply(content.code, content.error);
    }
    return HttpReply::json(200, content.value.to_json());
}

HttpReply Gateway::handle_delete_file(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);
    if (!request.has_query("path")) {
        return error_reply(ErrorCode::ValidationError, "'path' is required");
    }

    std::string path = request.query_param("path");
    OpStatus removed = files_.remove(path, query_flag(request, "recursive"));
    if (!removed.success) {
        return error_reply(removed.code, removed.error);
    }
    Json reply;
    reply["path"] = path;
    reply["deleted"] = true;
    return HttpReply::json(200, reply);
}

HttpReply Gateway::handle_list_files(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    std::string path = request.query_param("path", "/");
    OpResult<std::vector<FileEntryInfo> > listing = files_.list(path);
    if (!listing.success) {
        return error_reply(listing.code, listing.error);
    }
    Json reply;
    reply["path"] = path;
    reply["entries"] = Json::array();
    for (size_t i = 0; i < listing.value.size(); ++i) {
        reply["entries"].push_back(listing.value[i].to_json());
    }
    return HttpReply::json(200, reply);
}

HttpReply Gateway::handle_file_info(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);
    if (!request.has_query("path")) {
        return error_reply(ErrorCode::ValidationError, "'path' is required");
    }

    OpResult<FileEntryInfo> info = files_.stat(request.query_param("path"));
    if (!info.success) {
        return error_reply(info.code, info.error);
    }
    return HttpReply::json(200, info.value.to_json());
}

HttpReply Gateway::handle_make_dirs(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    Json body;
    std::string error;
    std::string path;
    std::string mode;
    if (!parse_body(request, body, error) ||
        !read_string(body, "path", true, path, error) ||
        !read_mode(body, mode, error)) {
        return error_reply(ErrorCode::ValidationError, error);
    }

    OpResult<FileEntryInfo> info = files_.make_dirs(path, mode);
    if (!info.success) {
        return error_reply(info.code, info.error);
    }
    return HttpReply::json(200, info.value.to_json());
}

HttpReply Gateway::handle_move_file(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    Json body;
    std::string error;
    std::string source;
    std::string destination;
    if (!parse_body(request, body, error) ||
        !read_string(body, "source", true, source, error) ||
        !read_string(body, "destination", true, destination, error)) {
        return error_reply(ErrorCode::ValidationError, error);
    }

    OpStatus moved = files_.move(source, destination);
    if (!moved.success) {
        return error_reply(moved.code, moved.error);
    }
    Json reply;
    reply["source"] = source;
    reply["destination"] = destination;
    return HttpReply::json(200, reply);
}

// ============================================================================
// Contexts and code
// ============================================================================

HttpReply Gateway::handle_create_context(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    Json body;
    std::string error;
    ContextOptions options;
    if (!parse_body(request, body, error) ||
        !read_string(body, "language", true, options.language, error) ||
        !read_string(body, "cwd", false, options.cwd, error) ||
        !read_string(body, "session_id", false, options.session_id, error) ||
        !read_envs(body, options.envs, error)) {
        return error_reply(ErrorCode::ValidationError, error);
    }
    options.sandbox_id = request.param("id");

    OpResult<ContextInfo> created = sessions_.create_context(options);
    if (!created.success) {
        return error_reply(created.code, created.error);
    }
    return HttpReply::json(201, created.value.to_json());
}

HttpReply Gateway::handle_list_contexts(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    std::string sandbox_id = request.param("id");
    std::vector<ContextInfo> contexts = sessions_.list_contexts();
    Json reply;
    reply["contexts"] = Json::array();
    for (size_t i = 0; i < contexts.size(); ++i) {
        if (contexts[i].sandbox_id != sandbox_id) continue;
        reply["contexts"].push_back(contexts[i].to_json());
    }
    return HttpReply::json(200, reply);
}

HttpReply Gateway::handle_get_context(const HttpRequest& request) {
    OpResult<ContextInfo> info = sessions_.get_context(request.param("cid"));
    if (!info.success) {
        return error_reply(info.code, info.error);
    }
    return HttpReply::json(200, info.value.to_json());
}

HttpReply Gateway::handle_close_context(const HttpRequest& request) {
    std::string id = request.param("cid");
    OpStatus closed = sessions_.close_context(id);
    if (!closed.success) {
        return error_reply(closed.code, closed.error);
    }
    Json reply;
    reply["context_id"] = id;
    reply["closed"] = true;
    return HttpReply::json(200, reply);
}

HttpReply Gateway::handle_submit_code(const HttpRequest& request) {
    std::string context_id = request.param("cid");

    Json body;
    std::string error;
    std::string code;
    double timeout = 0;
    if (!parse_body(request, body, error) ||
        !read_string(body, "code", true, code, error) ||
        !read_timeout(body, timeout, error)) {
        return error_reply(ErrorCode::ValidationError, error);
    }

    OpResult<std::string> submitted = sessions_.submit_code(context_id, code, timeout);
    if (!submitted.success) {
        return error_reply(submitted.code, submitted.error);
    }
    Json reply;
    reply["execution_id"] = submitted.value;
    reply["context_id"] = context_id;
    return HttpReply::json(202, reply);
}

HttpReply Gateway::handle_run_code(const HttpRequest& request) {
    OpStatus sb = check_sandbox(request);
    if (!sb.success) return error_reply(sb.code, sb.error);

    Json body;
    std::string error;
    std::string code;
    std::string language;
    std::string context_id;
    double timeout = 0;
    if (!parse_body(request, body, error) ||
        !read_string(body, "code", true, code, error) ||
        !read_string(body, "language", false, language, error) ||
        !read_string(body, "context_id", false, context_id, error) ||
        !read_timeout(body, timeout, error)) {
        return error_reply(ErrorCode::ValidationError, error);
    }

    Json reply;
    if (!context_id.empty()) {
        OpResult<ContextInfo> info = sessions_.get_context(context_id);
        if (!info.success) {
            return error_reply(info.code, info.error);
        }
        std::string canonical;
        if (!language.empty() && (!normalize_language(language, canonical) || canonical != info.value.language)) {
            return error_reply(ErrorCode::ValidationError,
                               "context " + context_id + " runs " + info.value.language + ", not " + language);
        }
        OpResult<std::string> submitted = sessions_.submit_code(context_id, code, timeout);
        if (!submitted.success) {
            return error_reply(submitted.code, submitted.error);
        }
        reply["execution_id"] = submitted.value;
        reply["context_id"] = context_id;
        return HttpReply::json(202, reply);
    }

    if (language.empty()) {
        return error_reply(ErrorCode::ValidationError, "'language' or 'context_id' is required");
    }
    OpResult<CodeSubmission> submitted = sessions_.submit_default(request.param("id"), language, code, timeout);
    if (!submitted.success) {
        return error_reply(submitted.code, submitted.error);
    }
    reply["execution_id"] = submitted.value.execution_id;
    reply["context_id"] = submitted.value.context_id;
    return HttpReply::json(202, reply);
}

HttpReply Gateway::handle_get_code(const HttpRequest& request) {
    return get_execution(request, ExecutionKind::Code);
}

HttpReply Gateway::handle_code_logs(const HttpRequest& request) {
    return stream_logs(request, ExecutionKind::Code);
}

HttpReply Gateway::handle_cancel_code(const HttpRequest& request) {
    return cancel_execution(request, ExecutionKind::Code);
}

} // namespace execd
