/*
 * execd C++ - Sandbox lifecycle client
 *
 * Thin libcurl client for the orchestration API that provisions sandboxes.
 * The daemon never provisions anything itself; it uses this client to learn
 * when its own sandbox is stopping so it can tear down in time.
 */
#ifndef execd_GATEWAY_LIFECYCLE_CLIENT_HPP
#define execd_GATEWAY_LIFECYCLE_CLIENT_HPP

#include <execd/core/errors.hpp>
#include <execd/core/http_client.hpp>
#include <string>
#include <map>

namespace execd {

enum class SandboxState {
    Pending,
    Running,
    Paused,
    Stopping,
    Stopped,
    Expired,
    Failed,
    Unknown
};

const char* sandbox_state_name(SandboxState state);
SandboxState parse_sandbox_state(const std::string& name);

// Stopped, Expired and Failed end the daemon
bool is_final_sandbox_state(SandboxState state);

struct SandboxSpec {
    std::string image;
    std::string entrypoint;
    std::map<std::string, std::string> env;
    int64_t timeout_seconds;

    SandboxSpec() : timeout_seconds(0) {}
};

class LifecycleClient {
public:
    LifecycleClient(const std::string& base_url, const std::string& api_key);

    bool configured() const { return !base_url_.empty(); }

    // POST {url}/sandboxes -> sandbox id
    OpResult<std::string> create(const SandboxSpec& spec);

    // DELETE {url}/sandboxes/{id}
    OpStatus kill(const std::string& sandbox_id);

    // GET {url}/sandboxes/{id} -> state
    OpResult<SandboxState> status(const std::string& sandbox_id);

    HttpClient& http() { return http_; }

private:
    std::map<std::string, std::string> headers() const;
    std::string sandbox_url(const std::string& sandbox_id) const;
    static ErrorCode code_for_status(long status);
    static std::string describe_failure(const HttpResponse& response);

    std::string base_url_;
    std::string api_key_;
    HttpClient http_;
};

} // namespace execd

#endif // execd_GATEWAY_LIFECYCLE_CLIENT_HPP
