#include <execd/exec/registry.hpp>
#include <execd/exec/history_store.hpp>
#include <execd/core/utils.hpp>
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace execd;

TEST(ExecutionTest, TransitionTable) {
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Queued, ExecutionStatus::Running));
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Queued, ExecutionStatus::Cancelled));
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Running, ExecutionStatus::Completed));
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Running, ExecutionStatus::KernelCrashed));
    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Queued, ExecutionStatus::Queued));
    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Running, ExecutionStatus::Queued));
    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Completed, ExecutionStatus::Running));
    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Cancelled, ExecutionStatus::Completed));
}

TEST(ExecutionTest, WireFormOmitsCodeFieldsForCommands) {
    ExecutionSnapshot snap;
    snap.id = "x";
    snap.kind = ExecutionKind::Command;
    snap.status = ExecutionStatus::Completed;
    snap.has_exit_code = true;
    snap.exit_code = 3;
    Json j = snap.to_json();
    EXPECT_EQ("Completed", j["status"]);
    EXPECT_EQ(3, j["exit_code"]);
    EXPECT_TRUE(j["started_at"].is_null());
    EXPECT_FALSE(j.contains("context_id"));
    EXPECT_FALSE(j.contains("logs"));

    snap.kind = ExecutionKind::Code;
    snap.execution_count = 4;
    j = snap.to_json(true);
    EXPECT_EQ(4, j["execution_count"]);
    EXPECT_TRUE(j["logs"].is_array());
}

TEST(RegistryTest, CreateStartsQueued) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Command, "sb-1", "echo hi");

    OpResult<ExecutionSnapshot> r = registry.get(id);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(ExecutionStatus::Queued, r.value.status);
    EXPECT_EQ("sb-1", r.value.sandbox_id);
    EXPECT_EQ("echo hi", r.value.payload);
    EXPECT_GT(r.value.created_at, 0);
    EXPECT_EQ(0, r.value.started_at);
    EXPECT_TRUE(registry.exists(id));
    EXPECT_EQ(1u, registry.size());
}

TEST(RegistryTest, UnknownIdIsNotFound) {
    ExecutionRegistry registry;
    OpResult<ExecutionSnapshot> r = registry.get("missing");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::NotFound, r.code);
    EXPECT_FALSE(registry.append_log("missing", StreamKind::Stdout, "x"));
    EXPECT_FALSE(registry.set_status("missing", ExecutionStatus::Running));
    EXPECT_FALSE(registry.read_logs("missing", 0).found);
    EXPECT_FALSE(registry.wait_terminal("missing", 10));
}

TEST(RegistryTest, StatusMovesForwardOnly) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Command, "", "true");

    ASSERT_TRUE(registry.set_status(id, ExecutionStatus::Running));
    EXPECT_FALSE(registry.set_status(id, ExecutionStatus::Queued));
    ASSERT_TRUE(registry.set_status(id, ExecutionStatus::Completed, ExecutionOutcome::exited(0)));
    EXPECT_FALSE(registry.set_status(id, ExecutionStatus::Failed, ExecutionOutcome::exited(1)));

    OpResult<ExecutionSnapshot> r = registry.get(id);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(ExecutionStatus::Completed, r.value.status);
    EXPECT_TRUE(r.value.has_exit_code);
    EXPECT_EQ(0, r.value.exit_code);
    EXPECT_GT(r.value.started_at, 0);
    EXPECT_GE(r.value.finished_at, r.value.started_at);
}

TEST(RegistryTest, CancelledBeforeStartHasNoStartTime) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Code, "", "1", "ctx");
    ASSERT_TRUE(registry.set_status(id, ExecutionStatus::Cancelled));

    OpResult<ExecutionSnapshot> r = registry.get(id);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(0, r.value.started_at);
    EXPECT_GT(r.value.finished_at, 0);
    EXPECT_EQ("ctx", r.value.context_id);
}

TEST(RegistryTest, LogsAreOrderedAndClosedAfterTerminal) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Command, "", "x");
    ASSERT_TRUE(registry.set_status(id, ExecutionStatus::Running));

    EXPECT_TRUE(registry.append_log(id, StreamKind::Stdout, "one\n"));
    EXPECT_TRUE(registry.append_log(id, StreamKind::Stderr, "two\n"));
    EXPECT_TRUE(registry.append_log(id, StreamKind::Stdout, ""));
    EXPECT_TRUE(registry.append_log(id, StreamKind::Stdout, "three\n"));
    ASSERT_TRUE(registry.set_status(id, ExecutionStatus::Failed, ExecutionOutcome::exited(2)));
    EXPECT_FALSE(registry.append_log(id, StreamKind::Stdout, "late\n"));

    OpResult<ExecutionSnapshot> r = registry.get(id, true);
    ASSERT_TRUE(r.success);
    ASSERT_EQ(3u, r.value.logs.size());
    for (size_t i = 0; i < r.value.logs.size(); ++i) {
        EXPECT_EQ(static_cast<int64_t>(i), r.value.logs[i].seq);
    }
    EXPECT_EQ("one\nthree\n", test::stream_text(r.value, StreamKind::Stdout));
    EXPECT_EQ("two\n", test::stream_text(r.value, StreamKind::Stderr));
    EXPECT_EQ(10, r.value.stdout_bytes);
    EXPECT_EQ(4, r.value.stderr_bytes);
    EXPECT_EQ(3, r.value.log_count);

    // Without logs the snapshot still carries the counters
    r = registry.get(id);
    EXPECT_TRUE(r.value.logs.empty());
    EXPECT_EQ(3, r.value.log_count);
}

TEST(RegistryTest, CursorReadsResume) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Command, "", "x");
    registry.set_status(id, ExecutionStatus::Running);
    registry.append_log(id, StreamKind::Stdout, "a");
    registry.append_log(id, StreamKind::Stdout, "b");

    LogBatch batch = registry.read_logs(id, 0);
    ASSERT_TRUE(batch.found);
    ASSERT_EQ(2u, batch.chunks.size());
    EXPECT_EQ(2, batch.next_seq);
    EXPECT_FALSE(batch.finished);

    registry.append_log(id, StreamKind::Stdout, "c");
    batch = registry.read_logs(id, batch.next_seq);
    ASSERT_EQ(1u, batch.chunks.size());
    EXPECT_EQ("c", batch.chunks[0].text);
    EXPECT_EQ(2, batch.chunks[0].seq);

    // A cursor past the end is clamped
    batch = registry.read_logs(id, 99);
    EXPECT_TRUE(batch.chunks.empty());
    EXPECT_EQ(3, batch.next_seq);

    registry.set_status(id, ExecutionStatus::Completed, ExecutionOutcome::exited(0));
    batch = registry.read_logs(id, 3);
    EXPECT_TRUE(batch.finished);
    EXPECT_EQ(ExecutionStatus::Completed, batch.status);
}

TEST(RegistryTest, WaitLogsWakesOnAppend) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Command, "", "x");
    registry.set_status(id, ExecutionStatus::Running);

    std::thread producer([&]() {
        sleep_ms(50);
        registry.append_log(id, StreamKind::Stdout, "tick");
    });
    LogBatch batch = registry.wait_logs(id, 0, 5000);
    producer.join();

    ASSERT_EQ(1u, batch.chunks.size());
    EXPECT_EQ("tick", batch.chunks[0].text);
    EXPECT_FALSE(batch.finished);
}

TEST(RegistryTest, WaitLogsTimesOutQuietly) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Command, "", "x");
    int64_t start = monotonic_ms();
    LogBatch batch = registry.wait_logs(id, 0, 50);
    EXPECT_TRUE(batch.found);
    EXPECT_TRUE(batch.chunks.empty());
    EXPECT_GE(monotonic_ms() - start, 40);
}

TEST(RegistryTest, WaitTerminalWakesOnStatus) {
    ExecutionRegistry registry;
    std::string id = registry.create(ExecutionKind::Command, "", "x");

    EXPECT_FALSE(registry.wait_terminal(id, 20));
    std::thread finisher([&]() {
        sleep_ms(50);
        registry.set_status(id, ExecutionStatus::Running);
        registry.set_status(id, ExecutionStatus::TimedOut);
    });
    EXPECT_TRUE(registry.wait_terminal(id, 5000));
    finisher.join();
}

TEST(RegistryTest, TruncatesAtLogCap) {
    RegistryOptions options;
    options.max_log_bytes = 10;
    ExecutionRegistry registry(options);
    std::string id = registry.create(ExecutionKind::Command, "", "yes");
    registry.set_status(id, ExecutionStatus::Running);

    EXPECT_TRUE(registry.append_log(id, StreamKind::Stdout, "12345678"));
    EXPECT_TRUE(registry.append_log(id, StreamKind::Stdout, "abcdef"));
    EXPECT_TRUE(registry.append_log(id, StreamKind::Stdout, "dropped"));

    OpResult<ExecutionSnapshot> r = registry.get(id, true);
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.value.truncated);
    ASSERT_EQ(3u, r.value.logs.size());
    EXPECT_EQ("ab", r.value.logs[1].text);
    EXPECT_EQ(StreamKind::Stderr, r.value.logs[2].stream);
    EXPECT_EQ("[execd] output truncated\n", r.value.logs[2].text);
    EXPECT_EQ(10, r.value.stdout_bytes);
}

TEST(RegistryTest, TruncationKeepsUtf8Whole) {
    RegistryOptions options;
    options.max_log_bytes = 4;
    ExecutionRegistry registry(options);
    std::string id = registry.create(ExecutionKind::Command, "", "x");
    registry.set_status(id, ExecutionStatus::Running);

    // "ab" + U+20AC (3 bytes) does not fit in 4: the euro sign is dropped whole
    registry.append_log(id, StreamKind::Stdout, "ab\xE2\x82\xAC");
    OpResult<ExecutionSnapshot> r = registry.get(id, true);
    ASSERT_EQ(2u, r.value.logs.size());
    EXPECT_EQ("ab", r.value.logs[0].text);
}

TEST(RegistryTest, EvictsByRetentionWindow) {
    RegistryOptions options;
    options.retention_seconds = 60;
    ExecutionRegistry registry(options);

    std::string done = registry.create(ExecutionKind::Command, "", "x");
    registry.set_status(done, ExecutionStatus::Completed, ExecutionOutcome::exited(0));
    std::string live = registry.create(ExecutionKind::Command, "", "y");
    registry.set_status(live, ExecutionStatus::Running);

    EXPECT_EQ(0u, registry.evict(current_timestamp_ms()));
    EXPECT_EQ(1u, registry.evict(current_timestamp_ms() + 61 * 1000));
    EXPECT_FALSE(registry.exists(done));
    EXPECT_TRUE(registry.exists(live));
}

TEST(RegistryTest, EvictsOldestOverCap) {
    RegistryOptions options;
    options.max_retained = 2;
    ExecutionRegistry registry(options);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(registry.create(ExecutionKind::Command, "", "x"));
        registry.set_status(ids.back(), ExecutionStatus::Completed, ExecutionOutcome::exited(0));
        sleep_ms(5);
    }

    EXPECT_EQ(1u, registry.evict(current_timestamp_ms()));
    EXPECT_FALSE(registry.exists(ids[0]));
    EXPECT_TRUE(registry.exists(ids[1]));
    EXPECT_TRUE(registry.exists(ids[2]));
}

TEST(RegistryTest, EvictedRecordsAnswerFromHistory) {
    HistoryStore history;
    ASSERT_TRUE(history.open(":memory:"));

    RegistryOptions options;
    options.max_retained = 0;
    ExecutionRegistry registry(options, &history);

    std::string id = registry.create(ExecutionKind::Code, "sb", "1/0", "ctx-1");
    registry.set_status(id, ExecutionStatus::Running);
    registry.append_log(id, StreamKind::Stderr, "boom\n");
    ExecutionError err(ErrorCode::ExecutionFailed, "ZeroDivisionError", "division by zero");
    err.traceback.push_back("line 1");
    registry.set_status(id, ExecutionStatus::Failed, ExecutionOutcome::failed(err));

    EXPECT_EQ(1u, registry.evict(current_timestamp_ms()));
    EXPECT_FALSE(registry.exists(id));

    OpResult<ExecutionSnapshot> r = registry.get(id, true);
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.value.archived);
    EXPECT_EQ(ExecutionStatus::Failed, r.value.status);
    EXPECT_EQ("ZeroDivisionError", r.value.error.ename);
    EXPECT_EQ(ErrorCode::ExecutionFailed, r.value.error.code);
    ASSERT_EQ(1u, r.value.error.traceback.size());
    EXPECT_EQ(5, r.value.stderr_bytes);
    EXPECT_TRUE(r.value.logs.empty());
}

TEST(RegistryTest, FinishedRecordStaysReadableWhileEvicting) {
    HistoryStore history;
    ASSERT_TRUE(history.open(":memory:"));

    RegistryOptions options;
    options.max_retained = 0;
    ExecutionRegistry registry(options, &history);

    std::atomic<bool> done(false);
    std::thread evictor([&]() {
        while (!done) registry.evict(current_timestamp_ms());
    });

    for (int i = 0; i < 100; ++i) {
        std::string id = registry.create(ExecutionKind::Command, "sb", "true");
        registry.set_status(id, ExecutionStatus::Running);

        OpResult<ExecutionSnapshot> seen;
        std::thread waiter([&]() {
            registry.wait_terminal(id, 5000);
            seen = registry.get(id);
        });
        registry.set_status(id, ExecutionStatus::Completed, ExecutionOutcome::exited(0));
        waiter.join();

        ASSERT_TRUE(seen.success) << "iteration " << i << ": " << seen.error;
        EXPECT_EQ(ExecutionStatus::Completed, seen.value.status);
    }

    done = true;
    evictor.join();
    EXPECT_EQ(100, history.count());
}
