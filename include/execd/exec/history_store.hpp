/*
 * execd C++ - Execution History Store
 *
 * SQLite archive of terminal executions. Keeps status, exit code, error,
 * result and byte counts so that `get` keeps answering after the in-memory
 * record has been evicted. Log content is never stored.
 */
#ifndef execd_EXEC_HISTORY_STORE_HPP
#define execd_EXEC_HISTORY_STORE_HPP

#include "execution.hpp"
#include <string>
#include <mutex>
#include <sqlite3.h>

namespace execd {

class HistoryStore {
public:
    HistoryStore();
    ~HistoryStore();

    // Open (or create) the database. ":memory:" is accepted.
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Insert or replace the terminal record of an execution
    bool record(const ExecutionSnapshot& snapshot);

    // Look up an archived execution; the snapshot comes back with archived=true
    bool lookup(const std::string& id, ExecutionSnapshot& out);

    // Delete records that finished before `cutoff_ms`; returns rows deleted
    int prune(int64_t cutoff_ms);

    int count();

    std::string last_error() const;

private:
    sqlite3* db_;
    mutable std::mutex mutex_;
    std::string last_error_;

    HistoryStore(const HistoryStore&);
    HistoryStore& operator=(const HistoryStore&);

    bool exec_sql(const std::string& sql);
    bool init_tables();
};

} // namespace execd

#endif // execd_EXEC_HISTORY_STORE_HPP
