/*
 * execd C++ - Process Runner Implementation
 */
#include <execd/exec/process_runner.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/subprocess.hpp>
#include <execd/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace execd {

namespace {

// Output still arriving after exit comes from background descendants;
// stop waiting for it after this much silence, or this long in total.
const int kDrainQuietMs = 200;
const int kDrainLimitMs = 2000;
const int kPollIntervalMs = 50;

// Hand everything but an unfinished UTF-8 tail to the registry
void flush_complete(ExecutionRegistry& registry, const std::string& id,
                    StreamKind stream, std::string& pending) {
    size_t n = utf8_complete_prefix(pending);
    if (n == 0) return;
    registry.append_log(id, stream, pending.substr(0, n));
    pending.erase(0, n);
}

// Once the shell is reaped its pid may be reused, so only its process
// group (kept alive by any remaining descendant) is signalled.
void signal_job(pid_t pid, bool leader_reaped, int sig) {
    if (leader_reaped) {
        kill(-pid, sig);
    } else {
        signal_process_group(pid, sig);
    }
}

} // anonymous namespace

ProcessRunner::ProcessRunner(ExecutionRegistry& registry, const Workspace& workspace,
                             const RunnerOptions& options)
    : registry_(registry)
    , workspace_(workspace)
    , options_(options)
    , shutting_down_(false)
{
}

ProcessRunner::~ProcessRunner() {
    shutdown();
}

size_t ProcessRunner::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

OpResult<std::string> ProcessRunner::run(const CommandRequest& request) {
    if (trim(request.command).empty()) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "command is required");
    }
    if (!is_valid_timeout(request.timeout_seconds)) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "timeout out of range");
    }
    if (request.command.find('\0') != std::string::npos) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "command contains a NUL byte");
    }
    for (std::map<std::string, std::string>::const_iterator it = request.envs.begin();
         it != request.envs.end(); ++it) {
        if (!valid_env_name(it->first)) {
            return OpResult<std::string>::fail(ErrorCode::ValidationError,
                                               "invalid environment variable name: " + it->first);
        }
        if (it->second.find('\0') != std::string::npos) {
            return OpResult<std::string>::fail(ErrorCode::ValidationError,
                                               "environment value contains a NUL byte: " + it->first);
        }
    }

    std::string cwd = workspace_.root();
    if (!request.cwd.empty()) {
        OpResult<std::string> resolved = workspace_.resolve(request.cwd);
        if (!resolved.success) {
            return OpResult<std::string>::fail(resolved.code, resolved.error);
        }
        struct stat st;
        if (stat(resolved.value.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            return OpResult<std::string>::fail(ErrorCode::NotFound,
                                               "working directory not found: " + request.cwd);
        }
        cwd = resolved.value;
    }

    double timeout = request.timeout_seconds > 0 ? request.timeout_seconds : options_.default_timeout_seconds;
    if (!(timeout <= kMaxTimeoutSeconds)) {
        timeout = kMaxTimeoutSeconds;
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> argv_items;
    argv_items.push_back(options_.shell);
    argv_items.push_back("-c");
    argv_items.push_back(request.command);
    CStringArray argv(argv_items);
    CStringArray envp(merged_environment(request.envs));
    std::string exec_error = "execd: cannot execute " + options_.shell + "\n";

    JobPtr job = std::make_shared<Job>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return OpResult<std::string>::fail(ErrorCode::InternalError, "runner is shutting down");
        }
        job->id = registry_.create(ExecutionKind::Command, request.sandbox_id, request.command);
        if (timeout > 0) {
            job->deadline_ms = monotonic_ms() + static_cast<int64_t>(timeout * 1000.0);
        }
        jobs_[job->id] = job;
    }

    LOG_DEBUG("[Runner] %s: %s (cwd=%s, timeout=%.1fs)",
              job->id.c_str(), request.command.c_str(), cwd.c_str(), timeout);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        fail_spawn(job, std::string("pipe: ") + strerror(errno));
        return OpResult<std::string>::ok(job->id);
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        fail_spawn(job, std::string("pipe: ") + strerror(saved));
        return OpResult<std::string>::ok(job->id);
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        fail_spawn(job, std::string("fork: ") + strerror(saved));
        return OpResult<std::string>::ok(job->id);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        if (chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        execve(options_.shell.c_str(), argv.data(), envp.data());
        ssize_t ignored = write(STDERR_FILENO, exec_error.data(), exec_error.size());
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    job->pid = pid;
    registry_.set_status(job->id, ExecutionStatus::Running);
    LOG_INFO("[Runner] Started command %s (pid %d)", job->id.c_str(), static_cast<int>(pid));

    std::thread(&ProcessRunner::supervise, this, job, out_pipe[0], err_pipe[0]).detach();
    return OpResult<std::string>::ok(job->id);
}

void ProcessRunner::fail_spawn(const JobPtr& job, const std::string& what) {
    LOG_ERROR("[Runner] Failed to start %s: %s", job->id.c_str(), what.c_str());
    finish(job, ExecutionStatus::Failed,
           ExecutionOutcome::failed(ExecutionError(ErrorCode::InternalError, "SpawnError", what)));
}

void ProcessRunner::finish(const JobPtr& job, ExecutionStatus status, const ExecutionOutcome& outcome) {
    registry_.set_status(job->id, status, outcome);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.erase(job->id);
    }
    idle_cv_.notify_all();
}

void ProcessRunner::supervise(JobPtr job, int out_fd, int err_fd) {
    int fds[2] = {out_fd, err_fd};
    StreamKind streams[2] = {StreamKind::Stdout, StreamKind::Stderr};
    std::string pending[2];
    bool open_fd[2] = {true, true};

    bool exited = false;
    int64_t exited_ms = 0;
    int wait_status = 0;
    int stop = STOP_NONE;           // reason latched when we started killing
    int64_t term_sent_ms = 0;
    bool kill_sent = false;
    int64_t last_activity_ms = monotonic_ms();

    while (true) {
        struct pollfd pfds[2];
        int nfds = 0;
        int index[2];
        for (int i = 0; i < 2; ++i) {
            if (!open_fd[i]) continue;
            pfds[nfds].fd = fds[i];
            pfds[nfds].events = POLLIN;
            pfds[nfds].revents = 0;
            index[nfds] = i;
            ++nfds;
        }

        int rc = poll(nfds > 0 ? pfds : nullptr, nfds, kPollIntervalMs);
        if (rc > 0) {
            for (int k = 0; k < nfds; ++k) {
                if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                int i = index[k];
                ssize_t n = read_available(fds[i], pending[i]);
                if (n > 0) {
                    last_activity_ms = monotonic_ms();
                    flush_complete(registry_, job->id, streams[i], pending[i]);
                } else if (n == 0) {
                    open_fd[i] = false;
                }
            }
        }

        int64_t now = monotonic_ms();

        if (!exited) {
            pid_t w = waitpid(job->pid, &wait_status, WNOHANG);
            if (w == job->pid) {
                exited = true;
                exited_ms = now;
                last_activity_ms = now;
            }
        }

        // Timeout and cancellation share the kill path. They stay armed after
        // the shell exits: its process group outlives it while descendants run.
        if (stop == STOP_NONE) {
            int requested = job->stop_reason.load();
            if (requested == STOP_NONE && job->deadline_ms > 0 && now >= job->deadline_ms) {
                requested = STOP_TIMEOUT;
                job->stop_reason.store(STOP_TIMEOUT);
            }
            if (requested != STOP_NONE) {
                stop = requested;
                LOG_INFO("[Runner] %s %s, sending SIGTERM", job->id.c_str(),
                         stop == STOP_TIMEOUT ? "timed out" : "cancelled");
                signal_job(job->pid, exited, SIGTERM);
                term_sent_ms = now;
            }
        }
        bool leader_gone_after_term = exited && exited_ms >= term_sent_ms;
        if (stop != STOP_NONE && !kill_sent &&
            (leader_gone_after_term || now - term_sent_ms >= options_.kill_grace_ms)) {
            if (!leader_gone_after_term) {
                LOG_WARN("[Runner] %s ignored SIGTERM for %d ms, sending SIGKILL",
                         job->id.c_str(), options_.kill_grace_ms);
            }
            // Also reaps descendants still holding the pipes
            signal_job(job->pid, exited, SIGKILL);
            kill_sent = true;
        }

        if (exited) {
            if (!open_fd[0] && !open_fd[1]) break;
            if (now - last_activity_ms >= kDrainQuietMs) break;
            if (now - exited_ms >= kDrainLimitMs && (stop == STOP_NONE || kill_sent)) {
                LOG_DEBUG("[Runner] %s: background output still flowing after %d ms, detaching",
                          job->id.c_str(), kDrainLimitMs);
                break;
            }
        }
    }

    for (int i = 0; i < 2; ++i) {
        if (!pending[i].empty()) {
            registry_.append_log(job->id, streams[i], pending[i]);
        }
        close(fds[i]);
    }

    int exit_code = exit_code_from_status(wait_status);
    ExecutionOutcome outcome = ExecutionOutcome::exited(exit_code);
    ExecutionStatus status = ExecutionStatus::Completed;
    if (stop == STOP_TIMEOUT) {
        status = ExecutionStatus::TimedOut;
        outcome.error = ExecutionError(ErrorCode::Timeout, "Timeout", "command exceeded its timeout");
    } else if (stop == STOP_CANCEL) {
        status = ExecutionStatus::Cancelled;
        outcome.error = ExecutionError(ErrorCode::Cancelled, "Cancelled", "command was cancelled");
    }

    LOG_INFO("[Runner] Command %s finished: %s (exit %d)",
             job->id.c_str(), execution_status_name(status), exit_code);
    finish(job, status, outcome);
}

OpStatus ProcessRunner::cancel(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, JobPtr>::iterator it = jobs_.find(execution_id);
    if (it == jobs_.end()) {
        LOG_DEBUG("[Runner] Cancel of %s: not running, nothing to do", execution_id.c_str());
        return OpStatus::ok();
    }
    int expected = STOP_NONE;
    if (it->second->stop_reason.compare_exchange_strong(expected, STOP_CANCEL)) {
        LOG_INFO("[Runner] Cancel requested for %s", execution_id.c_str());
    }
    return OpStatus::ok();
}

void ProcessRunner::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    shutting_down_ = true;
    if (jobs_.empty()) return;

    LOG_INFO("[Runner] Shutting down, cancelling %zu running command(s)", jobs_.size());
    for (std::map<std::string, JobPtr>::iterator it = jobs_.begin(); it != jobs_.end(); ++it) {
        int expected = STOP_NONE;
        it->second->stop_reason.compare_exchange_strong(expected, STOP_CANCEL);
    }

    // Supervisors escalate to SIGKILL after the grace period
    int bound_ms = options_.kill_grace_ms + 2000;
    if (!idle_cv_.wait_for(lock, std::chrono::milliseconds(bound_ms), [this]() { return jobs_.empty(); })) {
        LOG_WARN("[Runner] %zu command(s) still draining after %d ms", jobs_.size(), bound_ms);
        // Supervisors reference this runner, it cannot go away before them
        idle_cv_.wait(lock, [this]() { return jobs_.empty(); });
    }
}

} // namespace execd
