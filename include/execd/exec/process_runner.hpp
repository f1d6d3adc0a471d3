/*
 * execd C++ - Process Runner
 *
 * Runs shell commands as `<shell> -c <command>` in their own process group
 * and streams stdout/stderr into the execution registry as it arrives.
 * Each command gets a detached supervisor thread that owns the pipes, the
 * deadline and the SIGTERM -> SIGKILL escalation.
 */
#ifndef execd_EXEC_PROCESS_RUNNER_HPP
#define execd_EXEC_PROCESS_RUNNER_HPP

#include "registry.hpp"
#include <execd/core/workspace.hpp>
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <sys/types.h>

namespace execd {

struct CommandRequest {
    std::string command;
    std::string cwd;                            // sandbox path, empty = root
    std::map<std::string, std::string> envs;    // merged over the daemon env
    double timeout_seconds;                     // <= 0: runner default
    std::string sandbox_id;

    CommandRequest() : timeout_seconds(0) {}
};

struct RunnerOptions {
    std::string shell;
    int kill_grace_ms;
    double default_timeout_seconds;     // <= 0: no timeout

    RunnerOptions()
        : shell("/bin/bash")
        , kill_grace_ms(2000)
        , default_timeout_seconds(0) {}
};

class ProcessRunner {
public:
    ProcessRunner(ExecutionRegistry& registry, const Workspace& workspace,
                  const RunnerOptions& options = RunnerOptions());
    ~ProcessRunner();

    // Start a command. Validation errors fail before any execution exists;
    // otherwise the returned id names a Running (or already Failed) execution.
    OpResult<std::string> run(const CommandRequest& request);

    // Terminate a running command (status Cancelled). Unknown or already
    // terminal ids are a successful no-op.
    OpStatus cancel(const std::string& execution_id);

    // Cancel every running command and wait for the supervisors to finish
    void shutdown();

    size_t active_count() const;

private:
    enum StopReason {
        STOP_NONE = 0,
        STOP_TIMEOUT = 1,
        STOP_CANCEL = 2
    };

    struct Job {
        std::string id;
        pid_t pid;
        std::atomic<int> stop_reason;
        int64_t deadline_ms;    // monotonic, 0 = none

        Job() : pid(-1), stop_reason(STOP_NONE), deadline_ms(0) {}
    };
    typedef std::shared_ptr<Job> JobPtr;

    ProcessRunner(const ProcessRunner&);
    ProcessRunner& operator=(const ProcessRunner&);

    void supervise(JobPtr job, int out_fd, int err_fd);
    void finish(const JobPtr& job, ExecutionStatus status, const ExecutionOutcome& outcome);
    void fail_spawn(const JobPtr& job, const std::string& what);

    ExecutionRegistry& registry_;
    const Workspace& workspace_;
    RunnerOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<std::string, JobPtr> jobs_;
    bool shutting_down_;
};

} // namespace execd

#endif // execd_EXEC_PROCESS_RUNNER_HPP
