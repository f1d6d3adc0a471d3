#include <execd/core/application.hpp>
#include <execd/core/utils.hpp>
#include <execd/gateway/http_server.hpp>
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace execd;

TEST(ComponentOptionsTest, DefaultsWithoutConfig) {
    Config config;
    RegistryOptions registry = registry_options_from(config);
    EXPECT_EQ(900, registry.retention_seconds);
    EXPECT_EQ(1000u, registry.max_retained);

    SessionOptions sessions = session_options_from(config);
    EXPECT_EQ(1800, sessions.idle_timeout_seconds);
    EXPECT_EQ(300, sessions.dead_retention_seconds);

    GatewayOptions gateway = gateway_options_from(config);
    EXPECT_EQ(44772, gateway.http.port);
    EXPECT_TRUE(gateway.api_key.empty());
    EXPECT_TRUE(gateway.sandbox_id.empty());

    std::map<std::string, std::string> binaries = kernel_binaries_from(config);
    EXPECT_EQ("python3", binaries["python"]);
    EXPECT_EQ("node", binaries["javascript"]);
    EXPECT_EQ("/bin/bash", binaries["bash"]);
}

TEST(ComponentOptionsTest, ReadsConfiguredValues) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({
        "sandbox": {"id": "sb-7"},
        "gateway": {"host": "127.0.0.1", "port": 9000, "api_key": "k", "max_body_bytes": 1024},
        "registry": {"retention_seconds": 60, "max_retained": 5, "max_log_bytes": 2048},
        "commands": {"shell": "/bin/sh", "kill_grace_ms": 100, "default_timeout_seconds": 2.5},
        "sessions": {"idle_timeout_seconds": 10, "interrupt_grace_ms": 50},
        "kernels": {"python": "/opt/py/bin/python3"}
    })"));

    RegistryOptions registry = registry_options_from(config);
    EXPECT_EQ(60, registry.retention_seconds);
    EXPECT_EQ(5u, registry.max_retained);
    EXPECT_EQ(2048u, registry.max_log_bytes);

    RunnerOptions runner = runner_options_from(config);
    EXPECT_EQ("/bin/sh", runner.shell);
    EXPECT_EQ(100, runner.kill_grace_ms);
    EXPECT_DOUBLE_EQ(2.5, runner.default_timeout_seconds);

    SessionOptions sessions = session_options_from(config);
    EXPECT_EQ(10, sessions.idle_timeout_seconds);
    EXPECT_EQ(50, sessions.interrupt_grace_ms);

    GatewayOptions gateway = gateway_options_from(config);
    EXPECT_EQ("127.0.0.1", gateway.http.host);
    EXPECT_EQ(9000, gateway.http.port);
    EXPECT_EQ(1024u, gateway.http.max_body_bytes);
    EXPECT_EQ("sb-7", gateway.sandbox_id);
    EXPECT_EQ("k", gateway.api_key);

    EXPECT_EQ("/opt/py/bin/python3", kernel_binaries_from(config)["python"]);
}

class DaemonStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.set_string("workspace_dir", tmp_.file("ws"));
        config_.set_string("history.db_path", ":memory:");
        config_.set_string("gateway.host", "127.0.0.1");
        config_.set_int("gateway.port", 0);
        config_.set_string("sandbox.id", "sb-1");
        config_.set_string("commands.shell", "/bin/sh");
    }

    void TearDown() override {
        teardown_daemon_state(state_);
    }

    test::TempDir tmp_;
    Config config_;
    DaemonState state_;
};

TEST_F(DaemonStateTest, BuildsEveryComponent) {
    std::string error;
    ASSERT_TRUE(build_daemon_state(config_, state_, error)) << error;
    ASSERT_TRUE(state_.workspace);
    ASSERT_TRUE(state_.history);
    ASSERT_TRUE(state_.registry);
    ASSERT_TRUE(state_.runner);
    ASSERT_TRUE(state_.files);
    ASSERT_TRUE(state_.sessions);
    ASSERT_TRUE(state_.gateway);
    EXPECT_FALSE(state_.lifecycle);

    EXPECT_TRUE(test::path_exists(tmp_.file("ws")));
    EXPECT_GT(state_.gateway->port(), 0);
    EXPECT_EQ("sb-1", state_.sandbox.id);
    EXPECT_EQ("Running", state_.gateway->sandbox().state);

    HttpClient client;
    HttpResponse health = client.get("http://127.0.0.1:" + std::to_string(state_.gateway->port()) + "/health");
    EXPECT_EQ(200, health.status_code);

    teardown_daemon_state(state_);
    EXPECT_FALSE(state_.gateway);
    EXPECT_FALSE(state_.registry);
    EXPECT_FALSE(state_.workspace);
}

TEST_F(DaemonStateTest, HistoryCanBeDisabled) {
    config_.set_bool("history.enabled", false);
    std::string error;
    ASSERT_TRUE(build_daemon_state(config_, state_, error)) << error;
    EXPECT_FALSE(state_.history);
    EXPECT_TRUE(state_.registry);
}

TEST_F(DaemonStateTest, UnusableHistoryPathOnlyWarns) {
    test::write_text(tmp_.file("blocker"), "not a directory");
    config_.set_string("history.db_path", tmp_.file("blocker") + "/history.db");
    std::string error;
    ASSERT_TRUE(build_daemon_state(config_, state_, error)) << error;
    EXPECT_FALSE(state_.history);
}

TEST_F(DaemonStateTest, GatewayBindFailureTearsDown) {
    HttpServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    HttpServer holder(options);
    std::string error;
    ASSERT_TRUE(holder.start(error)) << error;

    config_.set_int("gateway.port", holder.port());
    EXPECT_FALSE(build_daemon_state(config_, state_, error));
    EXPECT_NE(std::string::npos, error.find("gateway"));
    EXPECT_FALSE(state_.registry);
    EXPECT_FALSE(state_.workspace);
    holder.stop();
}

TEST_F(DaemonStateTest, UnusableWorkspaceFails) {
    test::write_text(tmp_.file("file"), "x");
    config_.set_string("workspace_dir", tmp_.file("file"));
    std::string error;
    EXPECT_FALSE(build_daemon_state(config_, state_, error));
    EXPECT_NE(std::string::npos, error.find("workspace"));
}

// Application is a process-wide singleton; each test drives its state
// directly and tears it down again.
class MaintenanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Application& app = Application::instance();
        Config& config = app.config();
        config.set_string("workspace_dir", tmp_.file("ws"));
        config.set_string("history.db_path", ":memory:");
        config.set_string("gateway.host", "127.0.0.1");
        config.set_int("gateway.port", 0);
        config.set_string("sandbox.id", "sb-1");
        config.set_string("commands.shell", "/bin/sh");
        config.set_int("sandbox.expires_at", 0);
        config.set_string("lifecycle.url", "");
    }

    void TearDown() override {
        teardown_daemon_state(Application::instance().state());
    }

    bool build() {
        std::string error;
        bool ok = build_daemon_state(Application::instance().config(), Application::instance().state(), error);
        EXPECT_TRUE(ok) << error;
        return ok;
    }

    test::TempDir tmp_;
};

TEST_F(MaintenanceTest, KeepsRunningBeforeExpiry) {
    Application& app = Application::instance();
    app.config().set_int("sandbox.expires_at", current_timestamp() + 3600);
    ASSERT_TRUE(build());
    EXPECT_TRUE(app.maintenance(current_timestamp_ms()));
    EXPECT_EQ("Running", app.state().gateway->sandbox().state);
}

TEST_F(MaintenanceTest, StopsAtExpiry) {
    Application& app = Application::instance();
    app.config().set_int("sandbox.expires_at", current_timestamp() - 1);
    ASSERT_TRUE(build());
    EXPECT_FALSE(app.maintenance(current_timestamp_ms()));
    EXPECT_EQ("Expired", app.state().gateway->sandbox().state);
}

TEST_F(MaintenanceTest, EvictsExpiredExecutions) {
    Application& app = Application::instance();
    ASSERT_TRUE(build());

    CommandRequest req;
    req.command = "true";
    OpResult<std::string> id = app.state().runner->run(req);
    ASSERT_TRUE(id.success) << id.error;
    ASSERT_TRUE(app.state().registry->wait_terminal(id.value, 10000));

    // Far past the registry retention; the record survives in the archive
    EXPECT_TRUE(app.maintenance(current_timestamp_ms() + 3600 * 1000));
    ExecutionRegistry& registry = *app.state().registry;
    std::string eid = id.value;
    EXPECT_TRUE(test::wait_for([&]() {
        OpResult<ExecutionSnapshot> snap = registry.get(eid);
        return snap.success && snap.value.archived;
    }, 2000));
}

TEST_F(MaintenanceTest, StopsWhenLifecycleReportsTermination) {
    HttpServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    HttpServer orchestrator(options);
    orchestrator.route("GET", "/sandboxes/{id}", [](const HttpRequest&) {
        Json reply;
        reply["status"]["state"] = "Terminated";
        return HttpReply::json(200, reply);
    });
    std::string error;
    ASSERT_TRUE(orchestrator.start(error)) << error;

    Application& app = Application::instance();
    app.config().set_string("lifecycle.url", "http://127.0.0.1:" + std::to_string(orchestrator.port()));
    ASSERT_TRUE(build());
    ASSERT_TRUE(app.state().lifecycle);

    // Well after any earlier poll in this process
    EXPECT_FALSE(app.maintenance(current_timestamp_ms() + 24LL * 3600 * 1000));
    EXPECT_EQ("Stopped", app.state().gateway->sandbox().state);
    orchestrator.stop();
}
