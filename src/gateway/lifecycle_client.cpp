#include <execd/gateway/lifecycle_client.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

namespace execd {

const char* sandbox_state_name(SandboxState state) {
    switch (state) {
        case SandboxState::Pending: return "Pending";
        case SandboxState::Running: return "Running";
        case SandboxState::Paused: return "Paused";
        case SandboxState::Stopping: return "Stopping";
        case SandboxState::Stopped: return "Stopped";
        case SandboxState::Expired: return "Expired";
        case SandboxState::Failed: return "Failed";
        case SandboxState::Unknown: return "Unknown";
    }
    return "Unknown";
}

SandboxState parse_sandbox_state(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower == "pending" || lower == "creating") return SandboxState::Pending;
    if (lower == "running") return SandboxState::Running;
    if (lower == "paused") return SandboxState::Paused;
    if (lower == "stopping" || lower == "terminating") return SandboxState::Stopping;
    if (lower == "stopped" || lower == "terminated" || lower == "deleted") return SandboxState::Stopped;
    if (lower == "expired") return SandboxState::Expired;
    if (lower == "failed" || lower == "error") return SandboxState::Failed;
    return SandboxState::Unknown;
}

bool is_final_sandbox_state(SandboxState state) {
    return state == SandboxState::Stopped || state == SandboxState::Expired || state == SandboxState::Failed;
}

LifecycleClient::LifecycleClient(const std::string& base_url, const std::string& api_key)
    : base_url_(base_url)
    , api_key_(api_key)
{
    while (!base_url_.empty() && base_url_[base_url_.size() - 1] == '/') {
        base_url_.erase(base_url_.size() - 1);
    }
    http_.set_timeout(15);
    http_.set_connect_timeout(5);
}

std::map<std::string, std::string> LifecycleClient::headers() const {
    std::map<std::string, std::string> h;
    h["Accept"] = "application/json";
    if (!api_key_.empty()) {
        h["Authorization"] = "Bearer " + api_key_;
    }
    return h;
}

std::string LifecycleClient::sandbox_url(const std::string& sandbox_id) const {
    return base_url_ + "/sandboxes/" + sandbox_id;
}

ErrorCode LifecycleClient::code_for_status(long status) {
    if (status == 400 || status == 422) return ErrorCode::ValidationError;
    if (status == 401) return ErrorCode::Unauthorized;
    if (status == 403) return ErrorCode::PermissionDenied;
    if (status == 404) return ErrorCode::NotFound;
    if (status == 409) return ErrorCode::Conflict;
    if (status == 504 || status == 408) return ErrorCode::Timeout;
    return ErrorCode::InternalError;
}

std::string LifecycleClient::describe_failure(const HttpResponse& response) {
    if (!response.error.empty()) {
        return response.error;
    }
    Json body = response.json();
    if (body.is_object() && body.contains("message") && body["message"].is_string()) {
        return "HTTP " + std::to_string(response.status_code) + ": " + body["message"].get<std::string>();
    }
    return "HTTP " + std::to_string(response.status_code);
}

OpResult<std::string> LifecycleClient::create(const SandboxSpec& spec) {
    if (!configured()) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "lifecycle url is not configured");
    }
    if (spec.image.empty()) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "image is required");
    }

    Json body;
    body["image"] = spec.image;
    if (!spec.entrypoint.empty()) {
        body["entrypoint"] = spec.entrypoint;
    }
    body["env"] = Json::object();
    for (std::map<std::string, std::string>::const_iterator it = spec.env.begin(); it != spec.env.end(); ++it) {
        body["env"][it->first] = it->second;
    }
    if (spec.timeout_seconds > 0) {
        body["timeout"] = spec.timeout_seconds;
    }

    HttpResponse response = http_.post_json(base_url_ + "/sandboxes", body, headers());
    if (!response.ok()) {
        LOG_WARN("[Lifecycle] create failed: %s", describe_failure(response).c_str());
        ErrorCode code = response.error.empty() ? code_for_status(response.status_code) : ErrorCode::InternalError;
        return OpResult<std::string>::fail(code, describe_failure(response));
    }

    Json reply = response.json();
    if (reply.is_object() && reply.contains("id") && reply["id"].is_string()) {
        return OpResult<std::string>::ok(reply["id"].get<std::string>());
    }
    return OpResult<std::string>::fail(ErrorCode::InternalError, "lifecycle create reply has no id");
}

OpStatus LifecycleClient::kill(const std::string& sandbox_id) {
    if (!configured()) {
        return OpStatus::fail(ErrorCode::ValidationError, "lifecycle url is not configured");
    }
    HttpResponse response = http_.del(sandbox_url(sandbox_id), headers());
    if (!response.ok()) {
        ErrorCode code = response.error.empty() ? code_for_status(response.status_code) : ErrorCode::InternalError;
        return OpStatus::fail(code, describe_failure(response));
    }
    LOG_INFO("[Lifecycle] Sandbox %s killed", sandbox_id.c_str());
    return OpStatus::ok();
}

OpResult<SandboxState> LifecycleClient::status(const std::string& sandbox_id) {
    if (!configured()) {
        return OpResult<SandboxState>::fail(ErrorCode::ValidationError, "lifecycle url is not configured");
    }
    HttpResponse response = http_.get(sandbox_url(sandbox_id), headers());
    if (!response.ok()) {
        ErrorCode code = response.error.empty() ? code_for_status(response.status_code) : ErrorCode::InternalError;
        return OpResult<SandboxState>::fail(code, describe_failure(response));
    }

    // Either {"state": "..."} or {"status": {"state": "..."}}
    Json reply = response.json();
    std::string state;
    if (reply.is_object()) {
        if (reply.contains("state") && reply["state"].is_string()) {
            state = reply["state"].get<std::string>();
        } else if (reply.contains("status") && reply["status"].is_object() &&
                   reply["status"].contains("state") && reply["status"]["state"].is_string()) {
            state = reply["status"]["state"].get<std::string>();
        }
    }
    if (state.empty()) {
        return OpResult<SandboxState>::fail(ErrorCode::InternalError, "lifecycle status reply has no state");
    }
    return OpResult<SandboxState>::ok(parse_sandbox_state(state));
}

} // namespace execd
