/*
 * execd C++ - Application Implementation
 *
 * Owns the daemon lifecycle: config, logging, the explicit DaemonState and
 * the main poll loop with its maintenance tick.
 */
#include <execd/core/application.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/http_client.hpp>
#include <execd/core/utils.hpp>
#include <execd/kernel/kernel_factory.hpp>

#include <algorithm>
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>

namespace execd {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

const int kPollIntervalMs = 100;
const int kMaintenanceTicks = 10;   // ~1 s

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - in-sandbox execution daemon\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n"
              << "  --config <path>      Config file (default: " << AppInfo::DEFAULT_CONFIG << ")\n"
              << "  --port <n>           Override gateway.port\n\n"
              << "Environment:\n"
              << "  EXECD_SANDBOX_ID, EXECD_API_KEY, EXECD_PORT, EXECD_WORKSPACE,\n"
              << "  EXECD_LOG_LEVEL, EXECD_EXPIRES_AT, EXECD_LIFECYCLE_URL\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

} // anonymous namespace

// ============================================================================
// Component options
// ============================================================================

RegistryOptions registry_options_from(const Config& config) {
    RegistryOptions options;
    options.retention_seconds = config.get_int("registry.retention_seconds", options.retention_seconds);
    options.max_retained = static_cast<size_t>(
        std::max<int64_t>(0, config.get_int("registry.max_retained", static_cast<int64_t>(options.max_retained))));
    options.max_log_bytes = static_cast<size_t>(
        std::max<int64_t>(1, config.get_int("registry.max_log_bytes", static_cast<int64_t>(options.max_log_bytes))));
    return options;
}

RunnerOptions runner_options_from(const Config& config) {
    RunnerOptions options;
    options.shell = config.get_string("commands.shell", options.shell);
    options.kill_grace_ms = static_cast<int>(config.get_int("commands.kill_grace_ms", options.kill_grace_ms));
    options.default_timeout_seconds = config.get_double("commands.default_timeout_seconds",
                                                        options.default_timeout_seconds);
    return options;
}

SessionOptions session_options_from(const Config& config) {
    SessionOptions options;
    options.idle_timeout_seconds = config.get_int("sessions.idle_timeout_seconds", options.idle_timeout_seconds);
    options.start_timeout_ms = static_cast<int>(config.get_int("sessions.start_timeout_ms", options.start_timeout_ms));
    options.interrupt_grace_ms = static_cast<int>(
        config.get_int("sessions.interrupt_grace_ms", options.interrupt_grace_ms));
    options.dead_retention_seconds = config.get_int("sessions.dead_retention_seconds",
                                                    options.dead_retention_seconds);
    return options;
}

GatewayOptions gateway_options_from(const Config& config) {
    GatewayOptions options;
    options.http.host = config.get_string("gateway.host", options.http.host);
    options.http.port = static_cast<int>(config.get_int("gateway.port", options.http.port));
    options.http.max_body_bytes = static_cast<size_t>(
        std::max<int64_t>(0, config.get_int("gateway.max_body_bytes", static_cast<int64_t>(options.http.max_body_bytes))));
    options.sandbox_id = config.get_string("sandbox.id", "");
    options.api_key = config.get_string("gateway.api_key", "");
    options.heartbeat_ms = static_cast<int>(config.get_int("gateway.heartbeat_ms", options.heartbeat_ms));
    return options;
}

std::map<std::string, std::string> kernel_binaries_from(const Config& config) {
    std::map<std::string, std::string> binaries;
    binaries["python"] = config.get_string("kernels.python", "python3");
    binaries["javascript"] = config.get_string("kernels.node", "node");
    binaries["bash"] = config.get_string("kernels.bash", "/bin/bash");
    return binaries;
}

// ============================================================================
// DaemonState
// ============================================================================

bool build_daemon_state(const Config& config, DaemonState& state, std::string& error) {
    state.workspace.reset(new Workspace(config.get_string("workspace_dir", "/workspace")));
    if (!state.workspace->init(error)) {
        error = "workspace: " + error;
        teardown_daemon_state(state);
        return false;
    }
    LOG_INFO("[App] Workspace: %s", state.workspace->root().c_str());

    if (config.get_bool("history.enabled", true)) {
        std::string data_dir = config.get_string("data_dir", "/var/lib/execd");
        std::string db_path = config.get_string("history.db_path", join_path(data_dir, "history.db"));
        state.history.reset(new HistoryStore());
        if (db_path != ":memory:") {
            create_parent_directory(db_path);
        }
        if (!state.history->open(db_path)) {
            // The archive is optional; executions still work from memory
            LOG_WARN("[App] History store unavailable (%s): %s",
                     db_path.c_str(), state.history->last_error().c_str());
            state.history.reset();
        } else {
            LOG_INFO("[App] History store: %s", db_path.c_str());
        }
        state.history_retention_seconds = config.get_int("history.retention_seconds", 86400);
    }

    state.registry.reset(new ExecutionRegistry(registry_options_from(config), state.history.get()));
    state.runner.reset(new ProcessRunner(*state.registry, *state.workspace, runner_options_from(config)));
    state.files.reset(new FileService(*state.workspace));
    state.sessions.reset(new SessionManager(*state.registry, *state.workspace, session_options_from(config),
                                            make_process_kernel_factory(kernel_binaries_from(config))));

    state.lifecycle_poll_seconds = std::max<int64_t>(1, config.get_int("lifecycle.poll_seconds", 30));
    std::string lifecycle_url = config.get_string("lifecycle.url", "");
    if (!lifecycle_url.empty()) {
        state.lifecycle.reset(new LifecycleClient(lifecycle_url, config.get_string("lifecycle.api_key", "")));
        LOG_INFO("[App] Lifecycle API: %s", lifecycle_url.c_str());
    }

    state.sandbox.id = config.get_string("sandbox.id", "");
    state.sandbox.image = config.get_string("sandbox.image", "");
    state.sandbox.entrypoint = config.get_string("sandbox.entrypoint", "");
    state.sandbox.created_at = current_timestamp();
    state.sandbox.expires_at = config.get_int("sandbox.expires_at", 0);
    state.sandbox.state = "Running";

    state.gateway.reset(new Gateway(gateway_options_from(config), *state.registry, *state.runner,
                                    *state.files, *state.sessions, state.sandbox));
    if (!state.gateway->start(error)) {
        error = "gateway: " + error;
        teardown_daemon_state(state);
        return false;
    }
    return true;
}

void teardown_daemon_state(DaemonState& state) {
    if (state.gateway) {
        state.gateway->stop();
        state.gateway.reset();
    }
    if (state.sessions) {
        state.sessions->shutdown();
        state.sessions.reset();
    }
    if (state.runner) {
        state.runner->shutdown();
        state.runner.reset();
    }
    state.files.reset();
    state.lifecycle.reset();
    state.registry.reset();
    if (state.history) {
        state.history->close();
        state.history.reset();
    }
    state.workspace.reset();
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , exit_code_(0)
    , config_file_(AppInfo::DEFAULT_CONFIG)
    , port_override_(-1)
    , last_lifecycle_poll_(0)
{
}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            int64_t port = 0;
            if (!parse_int64(argv[++i], port) || port < 0 || port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                exit_code_ = 2;
                return false;
            }
            port_override_ = static_cast<int>(port);
            continue;
        }
        std::cerr << "Unknown argument: " << argv[i] << "\n";
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));

    std::string log_file = config_.get_string("log_file", "");
    if (!log_file.empty() && !Logger::instance().set_file(log_file)) {
        LOG_WARN("[App] Cannot open log file %s", log_file.c_str());
    }
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    if (!config_.load_file(config_file_)) {
        // Defaults apply; the environment usually carries the rest
        if (!config_.last_error().empty()) {
            std::cerr << "[Config] " << config_.last_error() << " - using defaults\n";
        }
    }
    config_.apply_env_overrides();
    if (port_override_ >= 0) {
        config_.set_int("gateway.port", port_override_);
    }

    setup_logging();
    LOG_INFO("%s v%s starting", AppInfo::NAME, AppInfo::VERSION);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    // Peers and kernels may vanish mid-write
    signal(SIGPIPE, SIG_IGN);

    HttpClient::global_init();

    std::string error;
    if (!build_daemon_state(config_, state_, error)) {
        LOG_ERROR("[App] Startup failed: %s", error.c_str());
        HttpClient::global_cleanup();
        exit_code_ = 1;
        return false;
    }

    const SandboxInfo& sandbox = state_.sandbox;
    LOG_INFO("[App] Serving sandbox %s on port %d",
             sandbox.id.empty() ? "(any)" : sandbox.id.c_str(), state_.gateway->port());
    if (sandbox.expires_at > 0) {
        LOG_INFO("[App] Sandbox expires at %s", format_timestamp(sandbox.expires_at).c_str());
    }
    return true;
}

int Application::run() {
    LOG_INFO("Entering main loop (poll interval: %dms)", kPollIntervalMs);

    int ticks = 0;
    while (running_.load()) {
        sleep_ms(kPollIntervalMs);

        if (++ticks >= kMaintenanceTicks) {
            ticks = 0;
            if (!maintenance(current_timestamp_ms())) {
                break;
            }
        }
    }

    LOG_INFO("Received shutdown signal");
    return exit_code_;
}

bool Application::maintenance(int64_t now_ms) {
    DaemonState& s = state_;

    if (s.registry) {
        size_t evicted = s.registry->evict(now_ms);
        if (evicted > 0) {
            LOG_DEBUG("[App] Evicted %zu execution(s)", evicted);
        }
    }
    if (s.history && s.history_retention_seconds > 0) {
        int pruned = s.history->prune(now_ms - s.history_retention_seconds * 1000);
        if (pruned > 0) {
            LOG_DEBUG("[App] Pruned %d archived execution(s)", pruned);
        }
    }
    if (s.sessions) {
        s.sessions->reap_idle(now_ms);
        s.sessions->purge_dead(now_ms);
    }

    if (!check_sandbox_lifetime(now_ms)) {
        running_ = false;
        return false;
    }
    return true;
}

bool Application::check_sandbox_lifetime(int64_t now_ms) {
    DaemonState& s = state_;

    if (s.sandbox.expires_at > 0 && now_ms / 1000 >= s.sandbox.expires_at) {
        LOG_WARN("[App] Sandbox expired at %s, shutting down", format_timestamp(s.sandbox.expires_at).c_str());
        if (s.gateway) s.gateway->set_sandbox_state(sandbox_state_name(SandboxState::Expired));
        return false;
    }

    if (s.lifecycle && !s.sandbox.id.empty() &&
        now_ms - last_lifecycle_poll_ >= s.lifecycle_poll_seconds * 1000) {
        last_lifecycle_poll_ = now_ms;
        OpResult<SandboxState> status = s.lifecycle->status(s.sandbox.id);
        if (!status.success) {
            LOG_WARN("[App] Lifecycle status poll failed: %s", status.error.c_str());
            return true;
        }
        if (s.gateway) s.gateway->set_sandbox_state(sandbox_state_name(status.value));
        if (is_final_sandbox_state(status.value)) {
            LOG_WARN("[App] Sandbox %s is %s, shutting down",
                     s.sandbox.id.c_str(), sandbox_state_name(status.value));
            return false;
        }
    }
    return true;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    teardown_daemon_state(state_);
    HttpClient::global_cleanup();

    LOG_INFO("Goodbye!");
}

} // namespace execd
