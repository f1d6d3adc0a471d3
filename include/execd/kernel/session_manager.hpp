/*
 * execd C++ - Kernel Session Manager
 *
 * Owns the code contexts. Each context is one kernel plus one worker thread
 * draining a FIFO of submitted cells, so cells within a context run strictly
 * in order while different contexts run in parallel.
 *
 * Context states:
 *   Initializing -> Ready <-> Busy
 *   any          -> Dead   (kernel crash, failed handshake, close)
 * A Dead context turns every new submission into a KernelCrashed execution.
 */
#ifndef execd_KERNEL_SESSION_MANAGER_HPP
#define execd_KERNEL_SESSION_MANAGER_HPP

#include "kernel.hpp"
#include "kernel_factory.hpp"
#include <execd/core/workspace.hpp>
#include <execd/exec/registry.hpp>
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

namespace execd {

enum class ContextState {
    Initializing,
    Ready,
    Busy,
    Dead
};

const char* context_state_name(ContextState state);

struct ContextOptions {
    std::string language;
    std::string cwd;                            // sandbox path, empty = root
    std::map<std::string, std::string> envs;
    std::string session_id;                     // reuse key, optional
    std::string sandbox_id;
};

struct ContextInfo {
    std::string id;
    std::string language;
    std::string session_id;
    std::string sandbox_id;
    ContextState state;
    int64_t execution_count;
    size_t queue_depth;
    std::string current_execution;
    int64_t created_at;
    int64_t last_activity;

    ContextInfo()
        : state(ContextState::Initializing), execution_count(0), queue_depth(0)
        , created_at(0), last_activity(0) {}

    Json to_json() const;
};

struct CodeSubmission {
    std::string execution_id;
    std::string context_id;
};

struct SessionOptions {
    int64_t idle_timeout_seconds;
    int start_timeout_ms;
    int interrupt_grace_ms;
    int64_t dead_retention_seconds;

    SessionOptions()
        : idle_timeout_seconds(1800)
        , start_timeout_ms(30000)
        , interrupt_grace_ms(3000)
        , dead_retention_seconds(300) {}
};

class SessionManager {
public:
    SessionManager(ExecutionRegistry& registry, const Workspace& workspace,
                   const SessionOptions& options, const KernelFactory& factory);
    ~SessionManager();

    // Spawn a kernel and wait for its handshake. With a session id, an
    // existing live context of the same language and session is returned.
    OpResult<ContextInfo> create_context(const ContextOptions& options);

    // Queue a cell on a context. Unknown context -> NotFound.
    OpResult<std::string> submit_code(const std::string& context_id, const std::string& code,
                                      double timeout_seconds = 0);

    // Queue a cell on the per-language default context, creating it on first use
    OpResult<CodeSubmission> submit_default(const std::string& sandbox_id, const std::string& language,
                                            const std::string& code, double timeout_seconds = 0);

    // Stop the kernel and forget the context; queued and running cells end Cancelled
    OpStatus close_context(const std::string& context_id);

    // Queued cell: removed with status Cancelled. Running cell: kernel
    // interrupted. Unknown or terminal: no-op.
    OpStatus cancel(const std::string& execution_id);

    OpResult<ContextInfo> get_context(const std::string& context_id) const;
    std::vector<ContextInfo> list_contexts() const;

    // Close idle Ready contexts; returns how many were reclaimed
    size_t reap_idle(int64_t now_ms);

    // Forget Dead contexts past their retention; returns how many were removed
    size_t purge_dead(int64_t now_ms);

    void shutdown();

    const SessionOptions& options() const { return options_; }

private:
    struct Cell {
        std::string execution_id;
        std::string code;
        int64_t timeout_ms;
        std::atomic<bool> cancel;

        Cell() : timeout_ms(0), cancel(false) {}
    };
    typedef std::shared_ptr<Cell> CellPtr;

    struct Context {
        std::string id;
        std::string language;
        std::string session_id;
        std::string sandbox_id;
        std::unique_ptr<Kernel> kernel;

        mutable std::mutex mutex;
        std::condition_variable cv;
        ContextState state;
        std::deque<CellPtr> queue;
        CellPtr current;
        int64_t execution_count;
        int64_t created_at;
        int64_t last_activity;
        int64_t dead_since;
        bool stopping;      // worker must exit
        bool closed;        // removed from the manager
        std::thread worker;

        Context()
            : state(ContextState::Initializing), execution_count(0)
            , created_at(0), last_activity(0), dead_since(0)
            , stopping(false), closed(false) {}
    };
    typedef std::shared_ptr<Context> ContextPtr;

    SessionManager(const SessionManager&);
    SessionManager& operator=(const SessionManager&);

    ContextPtr find(const std::string& id) const;
    std::vector<ContextPtr> snapshot_contexts() const;
    static ContextInfo describe(const Context& ctx);

    void worker_loop(ContextPtr ctx);
    void mark_dead(Context& ctx, std::vector<CellPtr>& orphans);
    void stop_context(const ContextPtr& ctx, ExecutionStatus orphan_status);
    void forget_default(const std::string& context_id);
    // Ready, nothing queued or running, and quiet for the idle timeout (ctx.mutex held)
    bool idle_expired(const Context& ctx, int64_t now_ms) const;
    void fail_cells(const std::vector<CellPtr>& cells, ExecutionStatus status, const ExecutionError& error);

    ExecutionRegistry& registry_;
    const Workspace& workspace_;
    SessionOptions options_;
    KernelFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, ContextPtr> contexts_;
    std::map<std::string, std::string> default_contexts_;   // language -> context id
    std::mutex default_mutex_;
    bool shutting_down_;
};

} // namespace execd

#endif // execd_KERNEL_SESSION_MANAGER_HPP
