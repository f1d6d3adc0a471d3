/*
 * execd C++ - Execution Registry
 *
 * Single source of truth for every execution. Producers (the process runner
 * and the session manager) append log chunks and move the status forward;
 * any number of readers hold a `seq` cursor into the append-only log and
 * block in wait_logs() until new chunks or the terminal status arrive.
 *
 * Locking: one registry mutex guards the id -> record map, each record has
 * its own mutex and condition variable so busy executions do not contend.
 */
#ifndef execd_EXEC_REGISTRY_HPP
#define execd_EXEC_REGISTRY_HPP

#include "execution.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>

namespace execd {

class HistoryStore;

struct RegistryOptions {
    int64_t retention_seconds;
    size_t max_retained;
    size_t max_log_bytes;

    RegistryOptions()
        : retention_seconds(900)
        , max_retained(1000)
        , max_log_bytes(8 * 1024 * 1024) {}
};

// Result of a cursor read
struct LogBatch {
    bool found;
    std::vector<LogChunk> chunks;   // chunks with seq >= requested cursor
    int64_t next_seq;               // cursor for the following read
    ExecutionStatus status;
    bool finished;                  // terminal and every chunk delivered

    LogBatch() : found(false), next_seq(0), status(ExecutionStatus::Queued), finished(false) {}
};

class ExecutionRegistry {
public:
    explicit ExecutionRegistry(const RegistryOptions& options = RegistryOptions(),
                               HistoryStore* history = nullptr);

    // Register a new Queued execution and return its id
    std::string create(ExecutionKind kind, const std::string& sandbox_id,
                       const std::string& payload, const std::string& context_id = "");

    bool exists(const std::string& id) const;

    // Snapshot of a live record, or of an archived one when it was evicted
    OpResult<ExecutionSnapshot> get(const std::string& id, bool include_logs = false) const;

    // Append output. Returns false for unknown or terminal executions.
    bool append_log(const std::string& id, StreamKind stream, const std::string& text);

    // Move the status forward. Terminal statuses carry the outcome; an
    // invalid transition is rejected and leaves the record untouched.
    bool set_status(const std::string& id, ExecutionStatus status,
                    const ExecutionOutcome& outcome = ExecutionOutcome());

    // Counter of the context cell, set when the cell is dispatched
    bool set_execution_count(const std::string& id, int64_t count);

    // Non-blocking cursor read
    LogBatch read_logs(const std::string& id, int64_t from_seq) const;

    // Blocking cursor read: returns when chunks at or beyond `from_seq`
    // exist, the execution is terminal, or `timeout_ms` elapsed
    LogBatch wait_logs(const std::string& id, int64_t from_seq, int timeout_ms) const;

    // Block until the execution is terminal. Returns false on timeout or unknown id.
    bool wait_terminal(const std::string& id, int timeout_ms) const;

    // Drop terminal records past the retention window or over the cap.
    // Returns the number of records evicted.
    size_t evict(int64_t now_ms);

    size_t size() const;
    std::vector<std::string> ids() const;

    const RegistryOptions& options() const { return options_; }

private:
    struct Record {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        ExecutionSnapshot data;
        size_t log_bytes;
        // Terminal but not yet written to the history store; not evictable
        bool archive_pending;

        Record() : log_bytes(0), archive_pending(false) {}
    };
    typedef std::shared_ptr<Record> RecordPtr;

    RecordPtr find(const std::string& id) const;
    static void fill_batch(const Record& rec, int64_t from_seq, LogBatch& batch);

    RegistryOptions options_;
    HistoryStore* history_;

    mutable std::mutex mutex_;
    std::map<std::string, RecordPtr> records_;
};

} // namespace execd

#endif // execd_EXEC_REGISTRY_HPP
