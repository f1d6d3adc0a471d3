/*
 * execd C++ - Execution records
 *
 * One submitted command or code cell with its status, ordered log and
 * terminal outcome. Records live in the ExecutionRegistry; everything else
 * works on ExecutionSnapshot copies.
 */
#ifndef execd_EXEC_EXECUTION_HPP
#define execd_EXEC_EXECUTION_HPP

#include <execd/core/errors.hpp>
#include <execd/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace execd {

enum class ExecutionKind {
    Command,
    Code
};

enum class ExecutionStatus {
    Queued,
    Running,
    Completed,
    Failed,
    Cancelled,
    TimedOut,
    KernelCrashed
};

enum class StreamKind {
    Stdout,
    Stderr
};

const char* execution_kind_name(ExecutionKind kind);
const char* execution_status_name(ExecutionStatus status);
const char* stream_kind_name(StreamKind stream);

bool parse_execution_kind(const std::string& name, ExecutionKind& out);
bool parse_execution_status(const std::string& name, ExecutionStatus& out);

bool is_terminal(ExecutionStatus status);

// Queued->Running, Queued->terminal, Running->terminal
bool is_valid_transition(ExecutionStatus from, ExecutionStatus to);

// Longest timeout a command or cell may ask for (7 days)
const double kMaxTimeoutSeconds = 604800.0;

// 0 means no timeout; negative, NaN and anything above the maximum are invalid
bool is_valid_timeout(double seconds);

struct LogChunk {
    int64_t seq;        // 0-based index, the stream cursor
    StreamKind stream;
    std::string text;
    int64_t ts;         // unix ms

    LogChunk() : seq(0), stream(StreamKind::Stdout), ts(0) {}

    Json to_json() const;
};

// Structured failure payload of an execution (spawn failure, code exception,
// kernel crash). `ename` is the language-level exception name when known.
struct ExecutionError {
    ErrorCode code;
    std::string ename;
    std::string evalue;
    std::vector<std::string> traceback;

    ExecutionError() : code(ErrorCode::None) {}
    ExecutionError(ErrorCode c, const std::string& name, const std::string& value)
        : code(c), ename(name), evalue(value) {}

    bool empty() const { return code == ErrorCode::None && ename.empty() && evalue.empty(); }
    Json to_json() const;
};

// Terminal data handed to ExecutionRegistry::set_status()
struct ExecutionOutcome {
    bool has_exit_code;
    int exit_code;
    Json result;            // null when there is no result value
    ExecutionError error;

    ExecutionOutcome() : has_exit_code(false), exit_code(0) {}

    static ExecutionOutcome exited(int code) {
        ExecutionOutcome o;
        o.has_exit_code = true;
        o.exit_code = code;
        return o;
    }

    static ExecutionOutcome with_result(const Json& value) {
        ExecutionOutcome o;
        o.result = value;
        return o;
    }

    static ExecutionOutcome failed(const ExecutionError& err) {
        ExecutionOutcome o;
        o.error = err;
        return o;
    }
};

struct ExecutionSnapshot {
    std::string id;
    std::string sandbox_id;
    std::string context_id;     // Code only
    ExecutionKind kind;
    ExecutionStatus status;
    std::string payload;        // command line or code

    bool has_exit_code;
    int exit_code;
    Json result;
    ExecutionError error;
    int64_t execution_count;    // Code only, 0 until dispatched

    int64_t created_at;
    int64_t started_at;
    int64_t finished_at;

    int64_t log_count;
    int64_t stdout_bytes;
    int64_t stderr_bytes;
    bool truncated;
    bool archived;              // answered from the history store, no logs

    std::vector<LogChunk> logs;

    ExecutionSnapshot()
        : kind(ExecutionKind::Command), status(ExecutionStatus::Queued)
        , has_exit_code(false), exit_code(0), execution_count(0)
        , created_at(0), started_at(0), finished_at(0)
        , log_count(0), stdout_bytes(0), stderr_bytes(0)
        , truncated(false), archived(false) {}

    bool terminal() const { return is_terminal(status); }

    // Wire form. Logs are included only when asked for.
    Json to_json(bool include_logs = false) const;
};

} // namespace execd

#endif // execd_EXEC_EXECUTION_HPP
