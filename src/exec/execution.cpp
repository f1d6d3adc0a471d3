#include <execd/exec/execution.hpp>

namespace execd {

const char* execution_kind_name(ExecutionKind kind) {
    switch (kind) {
        case ExecutionKind::Command: return "command";
        case ExecutionKind::Code: return "code";
    }
    return "command";
}

const char* execution_status_name(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Queued: return "Queued";
        case ExecutionStatus::Running: return "Running";
        case ExecutionStatus::Completed: return "Completed";
        case ExecutionStatus::Failed: return "Failed";
        case ExecutionStatus::Cancelled: return "Cancelled";
        case ExecutionStatus::TimedOut: return "TimedOut";
        case ExecutionStatus::KernelCrashed: return "KernelCrashed";
    }
    return "Failed";
}

const char* stream_kind_name(StreamKind stream) {
    return stream == StreamKind::Stderr ? "stderr" : "stdout";
}

bool parse_execution_kind(const std::string& name, ExecutionKind& out) {
    if (name == "command") { out = ExecutionKind::Command; return true; }
    if (name == "code") { out = ExecutionKind::Code; return true; }
    return false;
}

bool parse_execution_status(const std::string& name, ExecutionStatus& out) {
    static const ExecutionStatus all[] = {
        ExecutionStatus::Queued, ExecutionStatus::Running, ExecutionStatus::Completed,
        ExecutionStatus::Failed, ExecutionStatus::Cancelled, ExecutionStatus::TimedOut,
        ExecutionStatus::KernelCrashed
    };
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (name == execution_status_name(all[i])) {
            out = all[i];
            return true;
        }
    }
    return false;
}

bool is_terminal(ExecutionStatus status) {
    return status != ExecutionStatus::Queued && status != ExecutionStatus::Running;
}

bool is_valid_transition(ExecutionStatus from, ExecutionStatus to) {
    if (from == ExecutionStatus::Queued) {
        return to != ExecutionStatus::Queued;
    }
    if (from == ExecutionStatus::Running) {
        return is_terminal(to);
    }
    return false;
}

bool is_valid_timeout(double seconds) {
    return seconds >= 0 && seconds <= kMaxTimeoutSeconds;
}

Json LogChunk::to_json() const {
    Json j;
    j["seq"] = seq;
    j["stream"] = stream_kind_name(stream);
    j["text"] = text;
    j["ts"] = ts;
    return j;
}

Json ExecutionError::to_json() const {
    Json j;
    j["code"] = error_code_name(code);
    j["ename"] = ename;
    j["evalue"] = evalue;
    Json tb = Json::array();
    for (size_t i = 0; i < traceback.size(); ++i) {
        tb.push_back(traceback[i]);
    }
    j["traceback"] = tb;
    return j;
}

Json ExecutionSnapshot::to_json(bool include_logs) const {
    Json j;
    j["id"] = id;
    j["sandbox_id"] = sandbox_id;
    j["kind"] = execution_kind_name(kind);
    j["status"] = execution_status_name(status);
    j["exit_code"] = has_exit_code ? Json(exit_code) : Json();
    j["created_at"] = created_at;
    j["started_at"] = started_at ? Json(started_at) : Json();
    j["finished_at"] = finished_at ? Json(finished_at) : Json();
    j["log_count"] = log_count;
    j["stdout_bytes"] = stdout_bytes;
    j["stderr_bytes"] = stderr_bytes;
    j["truncated"] = truncated;
    j["archived"] = archived;

    if (kind == ExecutionKind::Code) {
        j["context_id"] = context_id;
        j["execution_count"] = execution_count;
        j["result"] = result;
    }
    if (!error.empty()) {
        j["error"] = error.to_json();
    }
    if (include_logs) {
        Json arr = Json::array();
        for (size_t i = 0; i < logs.size(); ++i) {
            arr.push_back(logs[i].to_json());
        }
        j["logs"] = arr;
    }
    return j;
}

} // namespace execd
