/*
 * execd C++ - Application
 *
 * Process entry: argument parsing, configuration, logging setup and the
 * main poll loop. Every component is owned by one explicit DaemonState,
 * built on start and torn down in dependency order on stop.
 */
#ifndef execd_CORE_APPLICATION_HPP
#define execd_CORE_APPLICATION_HPP

#include "config.hpp"
#include "workspace.hpp"
#include <execd/exec/history_store.hpp>
#include <execd/exec/registry.hpp>
#include <execd/exec/process_runner.hpp>
#include <execd/exec/file_service.hpp>
#include <execd/kernel/session_manager.hpp>
#include <execd/gateway/gateway.hpp>
#include <execd/gateway/lifecycle_client.hpp>
#include <string>
#include <memory>
#include <atomic>

namespace execd {

struct AppInfo {
    static constexpr const char* NAME = "execd";
    static constexpr const char* VERSION = "0.3.0";
    static constexpr const char* DEFAULT_CONFIG = "execd.json";
};

// Everything the daemon runs, in construction order
struct DaemonState {
    std::unique_ptr<Workspace> workspace;
    std::unique_ptr<HistoryStore> history;
    std::unique_ptr<ExecutionRegistry> registry;
    std::unique_ptr<ProcessRunner> runner;
    std::unique_ptr<FileService> files;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<LifecycleClient> lifecycle;
    std::unique_ptr<Gateway> gateway;

    SandboxInfo sandbox;
    int64_t history_retention_seconds;
    int64_t lifecycle_poll_seconds;

    DaemonState() : history_retention_seconds(86400), lifecycle_poll_seconds(30) {}
};

// Component options from config (defaults are the documented contract)
RegistryOptions registry_options_from(const Config& config);
RunnerOptions runner_options_from(const Config& config);
SessionOptions session_options_from(const Config& config);
GatewayOptions gateway_options_from(const Config& config);
std::map<std::string, std::string> kernel_binaries_from(const Config& config);

// Build every component and start the gateway. On failure the state is
// torn down again and `error` says why.
bool build_daemon_state(const Config& config, DaemonState& state, std::string& error);

// Gateway, then sessions, then the runner, then the history store
void teardown_daemon_state(DaemonState& state);

class Application {
public:
    static Application& instance();

    // false: exit right away with exit_code() (help, version, fatal error)
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }
    int exit_code() const { return exit_code_; }

    Config& config() { return config_; }
    DaemonState& state() { return state_; }

    // One maintenance pass: eviction, pruning, idle reclamation and the
    // sandbox lifetime checks. Returns false once the sandbox is gone.
    bool maintenance(int64_t now_ms);

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool check_sandbox_lifetime(int64_t now_ms);

    std::atomic<bool> running_;
    int exit_code_;
    std::string config_file_;
    int port_override_;
    Config config_;
    DaemonState state_;
    int64_t last_lifecycle_poll_;
};

} // namespace execd

#endif // execd_CORE_APPLICATION_HPP
