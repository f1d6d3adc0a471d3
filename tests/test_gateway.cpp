#include <execd/gateway/gateway.hpp>
#include <execd/core/http_client.hpp>
#include <execd/core/utils.hpp>
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>

using namespace execd;

namespace {

const char* kApiKey = "secret-key";

// print:X echoes X; raise fails the cell; block waits for cancel
class ScriptKernel : public Kernel {
public:
    explicit ScriptKernel(const std::string& language) : language_(language) {}

    std::string language() const override { return language_; }
    OpStatus start(const KernelStartOptions&) override { return OpStatus::ok(); }

    KernelReply submit(const KernelRequest& request, const OutputCallback& on_output) override {
        KernelReply reply;
        if (starts_with(request.code, "print:")) {
            std::string text = request.code.substr(6);
            on_output(StreamKind::Stdout, text + "\n");
            reply.result = Json::object();
            reply.result["text/plain"] = text;
        } else if (request.code == "raise") {
            reply.outcome = KernelOutcome::Error;
            reply.error = ExecutionError(ErrorCode::ExecutionFailed, "RuntimeError", "boom");
        } else if (request.code == "block") {
            while (!(request.cancel && request.cancel->load())) {
                sleep_ms(10);
            }
            reply.outcome = KernelOutcome::Cancelled;
        }
        return reply;
    }

    void interrupt() override {}
    void kill() override {}
    void shutdown() override {}
    bool is_healthy() override { return true; }

private:
    std::string language_;
};

} // anonymous namespace

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        workspace_.reset(new Workspace(tmp_.file("ws")));
        std::string error;
        ASSERT_TRUE(workspace_->init(error)) << error;

        RunnerOptions runner_options;
        runner_options.shell = "/bin/sh";
        runner_options.kill_grace_ms = 300;
        runner_.reset(new ProcessRunner(registry_, *workspace_, runner_options));
        files_.reset(new FileService(*workspace_));

        KernelFactory factory = [](const std::string& language) -> std::unique_ptr<Kernel> {
            return std::unique_ptr<Kernel>(new ScriptKernel(language));
        };
        sessions_.reset(new SessionManager(registry_, *workspace_, SessionOptions(), factory));

        GatewayOptions options;
        options.http.host = "127.0.0.1";
        options.http.port = 0;
        options.sandbox_id = "sb-1";
        options.api_key = kApiKey;
        options.heartbeat_ms = 200;

        SandboxInfo info;
        info.id = "sb-1";
        info.image = "python:3.12";
        info.created_at = 1700000000;

        gateway_.reset(new Gateway(options, registry_, *runner_, *files_, *sessions_, info));
        ASSERT_TRUE(gateway_->start(error)) << error;
        base_ = "http://127.0.0.1:" + std::to_string(gateway_->port());
        client_.set_timeout(20);
    }

    void TearDown() override {
        if (gateway_) gateway_->stop();
        if (sessions_) sessions_->shutdown();
        if (runner_) runner_->shutdown();
    }

    std::map<std::string, std::string> auth() const {
        std::map<std::string, std::string> h;
        h["Authorization"] = std::string("Bearer ") + kApiKey;
        return h;
    }

    HttpResponse get(const std::string& path) { return client_.get(base_ + path, auth()); }
    HttpResponse post(const std::string& path, const Json& body) { return client_.post_json(base_ + path, body, auth()); }
    HttpResponse del(const std::string& path) { return client_.del(base_ + path, auth()); }

    // Poll until the execution reports a terminal status
    Json wait_done(const std::string& path) {
        Json last;
        test::wait_for([&]() {
            HttpResponse r = get(path);
            if (r.status_code != 200) return false;
            last = r.json();
            std::string status = last["status"].get<std::string>();
            return status != "Queued" && status != "Running";
        }, 15000);
        return last;
    }

    test::TempDir tmp_;
    std::unique_ptr<Workspace> workspace_;
    ExecutionRegistry registry_;
    std::unique_ptr<ProcessRunner> runner_;
    std::unique_ptr<FileService> files_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<Gateway> gateway_;
    HttpClient client_;
    std::string base_;
};

TEST_F(GatewayTest, HealthNeedsNoToken) {
    HttpResponse r = client_.get(base_ + "/health");
    ASSERT_TRUE(r.error.empty()) << r.error;
    EXPECT_EQ(200, r.status_code);
    EXPECT_EQ("ok", r.json()["status"]);
}

TEST_F(GatewayTest, RejectsMissingOrWrongToken) {
    HttpResponse none = client_.get(base_ + "/sandboxes/sb-1");
    EXPECT_EQ(401, none.status_code);
    EXPECT_EQ("Unauthorized", none.json()["code"]);

    std::map<std::string, std::string> wrong;
    wrong["Authorization"] = "Bearer not-the-key";
    EXPECT_EQ(401, client_.get(base_ + "/sandboxes/sb-1", wrong).status_code);

    std::map<std::string, std::string> lower;
    lower["Authorization"] = std::string("bearer ") + kApiKey;
    EXPECT_EQ(200, client_.get(base_ + "/sandboxes/sb-1", lower).status_code);
}

TEST_F(GatewayTest, DescribesOwnSandboxOnly) {
    HttpResponse r = get("/sandboxes/sb-1");
    ASSERT_EQ(200, r.status_code);
    Json body = r.json();
    EXPECT_EQ("sb-1", body["id"]);
    EXPECT_EQ("Running", body["state"]);
    EXPECT_EQ("python:3.12", body["image"]);
    EXPECT_TRUE(body["expires_at"].is_null());

    gateway_->set_sandbox_state("Stopping");
    EXPECT_EQ("Stopping", get("/sandboxes/sb-1").json()["state"]);

    HttpResponse other = get("/sandboxes/sb-2");
    EXPECT_EQ(404, other.status_code);
    EXPECT_EQ("NotFound", other.json()["code"]);
}

TEST_F(GatewayTest, RunsCommandAndReportsStatus) {
    Json req;
    req["command"] = "echo hello; echo oops 1>&2; exit 3";
    HttpResponse started = post("/sandboxes/sb-1/commands", req);
    ASSERT_EQ(202, started.status_code) << started.body;
    std::string id = started.json()["execution_id"].get<std::string>();
    ASSERT_FALSE(id.empty());

    Json done = wait_done("/commands/" + id);
    EXPECT_EQ("Completed", done["status"]);
    EXPECT_EQ(3, done["exit_code"]);
    EXPECT_EQ("command", done["kind"]);

    Json with_logs = get("/commands/" + id + "?logs=true").json();
    ASSERT_TRUE(with_logs["logs"].is_array());
    std::string out;
    for (size_t i = 0; i < with_logs["logs"].size(); ++i) {
        if (with_logs["logs"][i]["stream"] == "stdout") {
            out += with_logs["logs"][i]["text"].get<std::string>();
        }
    }
    EXPECT_EQ("hello\n", out);

    // Command ids are not code ids
    EXPECT_EQ(404, get("/codes/" + id).status_code);
}

TEST_F(GatewayTest, StreamsCommandLogs) {
    Json req;
    req["command"] = "echo one; sleep 0.2; echo two";
    HttpResponse started = post("/sandboxes/sb-1/commands", req);
    ASSERT_EQ(202, started.status_code);
    std::string id = started.json()["execution_id"].get<std::string>();

    HttpResponse stream = get("/commands/" + id + "/logs");
    ASSERT_EQ(200, stream.status_code) << stream.error;
    EXPECT_NE(std::string::npos, stream.headers["content-type"].find("text/event-stream"));
    EXPECT_NE(std::string::npos, stream.body.find("event: stdout"));
    EXPECT_NE(std::string::npos, stream.body.find("\"text\":\"one\\n\""));
    EXPECT_NE(std::string::npos, stream.body.find("\"text\":\"two\\n\""));
    EXPECT_NE(std::string::npos, stream.body.find("event: status"));
    EXPECT_NE(std::string::npos, stream.body.find("\"status\":\"Completed\""));

    // Resuming past everything yields only the terminal frame
    Json done = get("/commands/" + id).json();
    int64_t count = done["log_count"].get<int64_t>();
    HttpResponse resumed = get("/commands/" + id + "/logs?offset=" + std::to_string(count));
    EXPECT_EQ(std::string::npos, resumed.body.find("event: stdout"));
    EXPECT_NE(std::string::npos, resumed.body.find("event: status"));

    EXPECT_EQ(400, get("/commands/" + id + "/logs?offset=-4").status_code);
    EXPECT_EQ(404, get("/commands/missing/logs").status_code);
}

TEST_F(GatewayTest, LogReaderHangupLeavesCommandRunning) {
    Json req;
    req["command"] = "for i in 1 2 3 4 5 6 7 8 9 10; do echo line$i; sleep 0.1; done";
    HttpResponse started = post("/sandboxes/sb-1/commands", req);
    ASSERT_EQ(202, started.status_code);
    std::string id = started.json()["execution_id"].get<std::string>();

    std::string request = "GET /commands/" + id + "/logs HTTP/1.1\r\n"
                          "Host: 127.0.0.1\r\n"
                          "Authorization: Bearer " + std::string(kApiKey) + "\r\n"
                          "Accept: text/event-stream\r\n\r\n";
    std::string partial = test::raw_http_until(gateway_->port(), request, "line2");
    EXPECT_EQ(200, test::raw_status(partial));
    EXPECT_NE(std::string::npos, partial.find("line2"));
    EXPECT_EQ(std::string::npos, partial.find("event: status"));

    Json done = wait_done("/commands/" + id);
    EXPECT_EQ("Completed", done["status"]);
    EXPECT_EQ(0, done["exit_code"]);

    Json with_logs = get("/commands/" + id + "?logs=true").json();
    std::string out;
    for (size_t i = 0; i < with_logs["logs"].size(); ++i) {
        if (with_logs["logs"][i]["stream"] == "stdout") {
            out += with_logs["logs"][i]["text"].get<std::string>();
        }
    }
    std::string expected;
    for (int i = 1; i <= 10; ++i) expected += "line" + std::to_string(i) + "\n";
    EXPECT_EQ(expected, out);

    // The server keeps serving after the dropped stream
    EXPECT_EQ(200, get("/sandboxes/sb-1").status_code);
}

TEST_F(GatewayTest, CancelsRunningCommand) {
    Json req;
    req["command"] = "sleep 30";
    HttpResponse started = post("/sandboxes/sb-1/commands", req);
    ASSERT_EQ(202, started.status_code);
    std::string id = started.json()["execution_id"].get<std::string>();

    HttpResponse cancel = post("/commands/" + id + "/cancel", Json::object());
    EXPECT_EQ(200, cancel.status_code);
    EXPECT_EQ(id, cancel.json()["execution_id"]);

    Json done = wait_done("/commands/" + id);
    EXPECT_EQ("Cancelled", done["status"]);
}

TEST_F(GatewayTest, CancelOfUnknownIdIsNoOp) {
    HttpResponse r = post("/commands/nope/cancel", Json::object());
    EXPECT_EQ(200, r.status_code);
    EXPECT_TRUE(r.json()["status"].is_null());
}

TEST_F(GatewayTest, ValidatesCommandRequests) {
    HttpResponse malformed = client_.request("POST", base_ + "/sandboxes/sb-1/commands", "{not json", auth());
    EXPECT_EQ(400, malformed.status_code);
    EXPECT_EQ("ValidationError", malformed.json()["code"]);

    Json missing = Json::object();
    EXPECT_EQ(400, post("/sandboxes/sb-1/commands", missing).status_code);

    Json bad_timeout;
    bad_timeout["command"] = "true";
    bad_timeout["timeout"] = "soon";
    EXPECT_EQ(400, post("/sandboxes/sb-1/commands", bad_timeout).status_code);
    bad_timeout["timeout"] = 1e9;
    EXPECT_EQ(400, post("/sandboxes/sb-1/commands", bad_timeout).status_code);
    bad_timeout["timeout"] = -1;
    EXPECT_EQ(400, post("/sandboxes/sb-1/commands", bad_timeout).status_code);

    Json bad_env;
    bad_env["command"] = "true";
    bad_env["envs"]["N"] = 5;
    EXPECT_EQ(400, post("/sandboxes/sb-1/commands", bad_env).status_code);

    Json escape;
    escape["command"] = "true";
    escape["cwd"] = "../..";
    EXPECT_EQ(403, post("/sandboxes/sb-1/commands", escape).status_code);

    Json other;
    other["command"] = "true";
    EXPECT_EQ(404, post("/sandboxes/sb-9/commands", other).status_code);
}

TEST_F(GatewayTest, FileRoundTrip) {
    Json req;
    Json entry;
    entry["path"] = "notes/a.txt";
    entry["data"] = "hello files";
    req["entries"].push_back(entry);
    Json bad;
    bad["path"] = "../outside.txt";
    bad["data"] = "x";
    req["entries"].push_back(bad);

    HttpResponse written = post("/sandboxes/sb-1/files", req);
    ASSERT_EQ(200, written.status_code) << written.body;
    Json results = written.json()["results"];
    ASSERT_EQ(2u, results.size());
    EXPECT_TRUE(results[0]["ok"].get<bool>());
    EXPECT_FALSE(results[1]["ok"].get<bool>());
    EXPECT_EQ("PermissionDenied", results[1]["error"]["code"]);

    HttpResponse read = get("/sandboxes/sb-1/files?path=notes/a.txt");
    ASSERT_EQ(200, read.status_code) << read.body;
    EXPECT_EQ("hello files", read.json()["data"]);
    EXPECT_EQ(11, read.json()["size"]);

    HttpResponse listing = get("/sandboxes/sb-1/files/list?path=notes");
    ASSERT_EQ(200, listing.status_code);
    ASSERT_EQ(1u, listing.json()["entries"].size());
    EXPECT_EQ("a.txt", listing.json()["entries"][0]["name"]);

    HttpResponse info = get("/sandboxes/sb-1/files/info?path=notes/a.txt");
    EXPECT_EQ(200, info.status_code);
    EXPECT_EQ("file", info.json()["type"]);

    Json move;
    move["source"] = "notes/a.txt";
    move["destination"] = "notes/b.txt";
    EXPECT_EQ(200, post("/sandboxes/sb-1/files/move", move).status_code);

    HttpResponse removed = del("/sandboxes/sb-1/files?path=notes/b.txt");
    EXPECT_EQ(200, removed.status_code);
    EXPECT_TRUE(removed.json()["deleted"].get<bool>());

    EXPECT_EQ(404, get("/sandboxes/sb-1/files?path=notes/b.txt").status_code);
    EXPECT_EQ(400, get("/sandboxes/sb-1/files").status_code);
}

TEST_F(GatewayTest, MakesDirectories) {
    Json req;
    req["path"] = "deep/er/dir";
    req["mode"] = 755;
    HttpResponse made = post("/sandboxes/sb-1/files/mkdir", req);
    ASSERT_EQ(200, made.status_code) << made.body;
    EXPECT_EQ("directory", made.json()["type"]);
    EXPECT_TRUE(test::path_exists(workspace_->root() + "/deep/er/dir"));
}

TEST_F(GatewayTest, RunsCodeInContext) {
    Json create;
    create["language"] = "python";
    HttpResponse created = post("/sandboxes/sb-1/contexts", create);
    ASSERT_EQ(201, created.status_code) << created.body;
    std::string cid = created.json()["id"].get<std::string>();

    Json cell;
    cell["code"] = "print:42";
    HttpResponse submitted = post("/contexts/" + cid + "/codes", cell);
    ASSERT_EQ(202, submitted.status_code) << submitted.body;
    std::string eid = submitted.json()["execution_id"].get<std::string>();

    Json done = wait_done("/codes/" + eid);
    EXPECT_EQ("Completed", done["status"]);
    EXPECT_EQ("42", done["result"]["text/plain"]);
    EXPECT_EQ(cid, done["context_id"]);

    HttpResponse stream = get("/codes/" + eid + "/logs");
    EXPECT_NE(std::string::npos, stream.body.find("event: stdout"));
    EXPECT_NE(std::string::npos, stream.body.find("event: result"));

    HttpResponse contexts = get("/sandboxes/sb-1/contexts");
    ASSERT_EQ(200, contexts.status_code);
    EXPECT_EQ(1u, contexts.json()["contexts"].size());

    EXPECT_EQ(200, del("/contexts/" + cid).status_code);
    EXPECT_EQ(404, get("/contexts/" + cid).status_code);
}

TEST_F(GatewayTest, ReportsCodeErrors) {
    Json cell;
    cell["language"] = "python";
    cell["code"] = "raise";
    HttpResponse submitted = post("/sandboxes/sb-1/codes", cell);
    ASSERT_EQ(202, submitted.status_code) << submitted.body;
    std::string eid = submitted.json()["execution_id"].get<std::string>();
    EXPECT_FALSE(submitted.json()["context_id"].get<std::string>().empty());

    Json done = wait_done("/codes/" + eid);
    EXPECT_EQ("Failed", done["status"]);
    EXPECT_EQ("RuntimeError", done["error"]["ename"]);

    HttpResponse stream = get("/codes/" + eid + "/logs");
    EXPECT_NE(std::string::npos, stream.body.find("event: error"));
}

TEST_F(GatewayTest, CancelsRunningCell) {
    Json cell;
    cell["language"] = "bash";
    cell["code"] = "block";
    HttpResponse submitted = post("/sandboxes/sb-1/codes", cell);
    ASSERT_EQ(202, submitted.status_code);
    std::string eid = submitted.json()["execution_id"].get<std::string>();

    test::wait_for([&]() { return get("/codes/" + eid).json()["status"] == "Running"; }, 5000);
    EXPECT_EQ(200, post("/codes/" + eid + "/cancel", Json::object()).status_code);
    EXPECT_EQ("Cancelled", wait_done("/codes/" + eid)["status"]);
}

TEST_F(GatewayTest, ValidatesCodeRequests) {
    Json no_language;
    no_language["code"] = "print:1";
    EXPECT_EQ(400, post("/sandboxes/sb-1/codes", no_language).status_code);

    Json unknown;
    unknown["language"] = "cobol";
    unknown["code"] = "x";
    EXPECT_EQ(400, post("/sandboxes/sb-1/codes", unknown).status_code);

    Json missing_ctx;
    missing_ctx["context_id"] = "ctx-missing";
    missing_ctx["code"] = "x";
    EXPECT_EQ(404, post("/sandboxes/sb-1/codes", missing_ctx).status_code);

    Json create;
    create["language"] = "python";
    std::string cid = post("/sandboxes/sb-1/contexts", create).json()["id"].get<std::string>();
    Json mismatch;
    mismatch["context_id"] = cid;
    mismatch["language"] = "javascript";
    mismatch["code"] = "x";
    EXPECT_EQ(400, post("/sandboxes/sb-1/codes", mismatch).status_code);
}

TEST(GatewayErrorTest, MapsCodesToStatuses) {
    EXPECT_EQ(400, Gateway::error_reply(ErrorCode::ValidationError, "x").status);
    EXPECT_EQ(403, Gateway::error_reply(ErrorCode::PermissionDenied, "x").status);
    EXPECT_EQ(409, Gateway::error_reply(ErrorCode::Conflict, "x").status);
    HttpReply reply = Gateway::error_reply(ErrorCode::NotFound, "gone");
    EXPECT_EQ(404, reply.status);
    Json body = Json::parse(reply.body);
    EXPECT_EQ("NotFound", body["code"]);
    EXPECT_EQ("gone", body["message"]);
}
