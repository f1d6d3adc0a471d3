/*
 * execd C++ - Execution Registry Implementation
 */
#include <execd/exec/registry.hpp>
#include <execd/exec/history_store.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

#include <algorithm>
#include <chrono>

namespace execd {

namespace {

const char* kTruncationMarker = "[execd] output truncated\n";

} // anonymous namespace

ExecutionRegistry::ExecutionRegistry(const RegistryOptions& options, HistoryStore* history)
    : options_(options)
    , history_(history)
{
}

ExecutionRegistry::RecordPtr ExecutionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, RecordPtr>::const_iterator it = records_.find(id);
    if (it == records_.end()) return RecordPtr();
    return it->second;
}

std::string ExecutionRegistry::create(ExecutionKind kind, const std::string& sandbox_id,
                                      const std::string& payload, const std::string& context_id) {
    RecordPtr rec = std::make_shared<Record>();
    rec->data.id = generate_uuid();
    rec->data.kind = kind;
    rec->data.sandbox_id = sandbox_id;
    rec->data.payload = payload;
    rec->data.context_id = context_id;
    rec->data.status = ExecutionStatus::Queued;
    rec->data.created_at = current_timestamp_ms();

    std::string id = rec->data.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[id] = rec;
    }
    LOG_DEBUG("[Registry] Created %s execution %s", execution_kind_name(kind), id.c_str());
    return id;
}

bool ExecutionRegistry::exists(const std::string& id) const {
    return find(id) != nullptr;
}

OpResult<ExecutionSnapshot> ExecutionRegistry::get(const std::string& id, bool include_logs) const {
    RecordPtr rec = find(id);
    if (rec) {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (include_logs) {
            return OpResult<ExecutionSnapshot>::ok(rec->data);
        }
        ExecutionSnapshot snap = rec->data;
        snap.logs.clear();
        return OpResult<ExecutionSnapshot>::ok(snap);
    }

    if (history_) {
        ExecutionSnapshot archived;
        if (history_->lookup(id, archived)) {
            return OpResult<ExecutionSnapshot>::ok(archived);
        }
    }
    return OpResult<ExecutionSnapshot>::fail(ErrorCode::NotFound, "execution not found: " + id);
}

bool ExecutionRegistry::append_log(const std::string& id, StreamKind stream, const std::string& text) {
    if (text.empty()) return true;

    RecordPtr rec = find(id);
    if (!rec) return false;

    std::lock_guard<std::mutex> lock(rec->mutex);
    ExecutionSnapshot& d = rec->data;
    if (d.terminal()) return false;
    if (d.truncated) return true;  // over the cap: drop silently

    std::string accepted = text;
    bool overflow = false;
    if (rec->log_bytes + accepted.size() > options_.max_log_bytes) {
        size_t room = options_.max_log_bytes > rec->log_bytes ? options_.max_log_bytes - rec->log_bytes : 0;
        accepted = accepted.substr(0, room);
        accepted.resize(utf8_complete_prefix(accepted));
        overflow = true;
    }

    int64_t now = current_timestamp_ms();
    if (!accepted.empty()) {
        LogChunk chunk;
        chunk.seq = static_cast<int64_t>(d.logs.size());
        chunk.stream = stream;
        chunk.text = accepted;
        chunk.ts = now;
        d.logs.push_back(chunk);
        rec->log_bytes += accepted.size();
        if (stream == StreamKind::Stdout) d.stdout_bytes += static_cast<int64_t>(accepted.size());
        else d.stderr_bytes += static_cast<int64_t>(accepted.size());
    }
    if (overflow) {
        LogChunk marker;
        marker.seq = static_cast<int64_t>(d.logs.size());
        marker.stream = StreamKind::Stderr;
        marker.text = kTruncationMarker;
        marker.ts = now;
        d.logs.push_back(marker);
        d.truncated = true;
        LOG_WARN("[Registry] Execution %s exceeded %zu log bytes, output truncated",
                 id.c_str(), options_.max_log_bytes);
    }
    d.log_count = static_cast<int64_t>(d.logs.size());

    rec->cv.notify_all();
    return true;
}

bool ExecutionRegistry::set_status(const std::string& id, ExecutionStatus status,
                                   const ExecutionOutcome& outcome) {
    RecordPtr rec = find(id);
    if (!rec) return false;

    ExecutionSnapshot archived;
    bool archive = false;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        ExecutionSnapshot& d = rec->data;
        if (!is_valid_transition(d.status, status)) {
            LOG_DEBUG("[Registry] Rejected transition %s -> %s for %s",
                      execution_status_name(d.status), execution_status_name(status), id.c_str());
            return false;
        }

        int64_t now = current_timestamp_ms();
        d.status = status;
        if (status == ExecutionStatus::Running) {
            d.started_at = now;
        } else {
            if (d.started_at == 0 && status != ExecutionStatus::Cancelled) {
                d.started_at = now;
            }
            d.finished_at = now;
            if (outcome.has_exit_code) {
                d.has_exit_code = true;
                d.exit_code = outcome.exit_code;
            }
            if (!outcome.result.is_null()) {
                d.result = outcome.result;
            }
            if (!outcome.error.empty()) {
                d.error = outcome.error;
            }
            if (history_) {
                archived = d;
                archived.logs.clear();
                archive = true;
                rec->archive_pending = true;
            }
        }
        rec->cv.notify_all();
    }

    LOG_DEBUG("[Registry] %s -> %s", id.c_str(), execution_status_name(status));

    if (archive) {
        if (!history_->record(archived)) {
            LOG_WARN("[Registry] Failed to archive execution %s", id.c_str());
        }
        std::lock_guard<std::mutex> lock(rec->mutex);
        rec->archive_pending = false;
    }
    return true;
}

bool ExecutionRegistry::set_execution_count(const std::string& id, int64_t count) {
    RecordPtr rec = find(id);
    if (!rec) return false;
    std::lock_guard<std::mutex> lock(rec->mutex);
    rec->data.execution_count = count;
    return true;
}

void ExecutionRegistry::fill_batch(const Record& rec, int64_t from_seq, LogBatch& batch) {
    const ExecutionSnapshot& d = rec.data;
    int64_t total = static_cast<int64_t>(d.logs.size());
    int64_t start = std::max<int64_t>(0, std::min(from_seq, total));

    batch.found = true;
    batch.chunks.assign(d.logs.begin() + start, d.logs.end());
    batch.next_seq = total;
    batch.status = d.status;
    batch.finished = d.terminal();
}

LogBatch ExecutionRegistry::read_logs(const std::string& id, int64_t from_seq) const {
    LogBatch batch;
    RecordPtr rec = find(id);
    if (!rec) return batch;
    std::lock_guard<std::mutex> lock(rec->mutex);
    fill_batch(*rec, from_seq, batch);
    return batch;
}

LogBatch ExecutionRegistry::wait_logs(const std::string& id, int64_t from_seq, int timeout_ms) const {
    LogBatch batch;
    RecordPtr rec = find(id);
    if (!rec) return batch;

    std::unique_lock<std::mutex> lock(rec->mutex);
    rec->cv.wait_for(lock, std::chrono::milliseconds(std::max(0, timeout_ms)), [&]() {
        return static_cast<int64_t>(rec->data.logs.size()) > from_seq || rec->data.terminal();
    });
    fill_batch(*rec, from_seq, batch);
    return batch;
}

bool ExecutionRegistry::wait_terminal(const std::string& id, int timeout_ms) const {
    RecordPtr rec = find(id);
    if (!rec) return false;

    std::unique_lock<std::mutex> lock(rec->mutex);
    return rec->cv.wait_for(lock, std::chrono::milliseconds(std::max(0, timeout_ms)), [&]() {
        return rec->data.terminal();
    });
}

size_t ExecutionRegistry::evict(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    // (finished_at, id) of every terminal record whose archive is written
    std::vector<std::pair<int64_t, std::string> > terminal;
    for (std::map<std::string, RecordPtr>::const_iterator it = records_.begin();
         it != records_.end(); ++it) {
        std::lock_guard<std::mutex> rlock(it->second->mutex);
        if (it->second->data.terminal() && !it->second->archive_pending) {
            terminal.push_back(std::make_pair(it->second->data.finished_at, it->first));
        }
    }
    std::sort(terminal.begin(), terminal.end());

    int64_t cutoff = now_ms - options_.retention_seconds * 1000;
    size_t over_cap = terminal.size() > options_.max_retained ? terminal.size() - options_.max_retained : 0;

    size_t evicted = 0;
    for (size_t i = 0; i < terminal.size(); ++i) {
        if (i < over_cap || terminal[i].first < cutoff) {
            records_.erase(terminal[i].second);
            ++evicted;
        }
    }

    if (evicted > 0) {
        LOG_DEBUG("[Registry] Evicted %zu terminal executions (%zu remaining)", evicted, records_.size());
    }
    return evicted;
}

size_t ExecutionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<std::string> ExecutionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (std::map<std::string, RecordPtr>::const_iterator it = records_.begin();
         it != records_.end(); ++it) {
        out.push_back(it->first);
    }
    return out;
}

} // namespace execd
