/*
 * execd C++ - Process-backed kernel implementation
 */
#include <execd/kernel/process_kernel.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/subprocess.hpp>
#include <execd/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace execd {

namespace {

const int kPollIntervalMs = 50;
const int kShutdownWaitMs = 1000;
const size_t kStartupErrorBytes = 2048;

// Writes to a dead kernel must fail with EPIPE, not kill the daemon
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}

void close_quietly(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // anonymous namespace

ProcessKernel::ProcessKernel()
    : pid_(-1)
    , dead_(false)
    , out_fd_(-1)
    , err_fd_(-1)
    , ctl_fd_(-1)
    , req_fd_(-1)
    , interrupt_grace_ms_(3000)
    , exited_(false)
    , exit_status_(0)
{
}

ProcessKernel::~ProcessKernel() {
    if (pid_.load() > 0 && !check_exited()) {
        kill();
        while (!check_exited()) {
            sleep_ms(10);
        }
    }
    close_fds();
}

std::map<std::string, std::string> ProcessKernel::driver_env() const {
    return std::map<std::string, std::string>();
}

std::string ProcessKernel::encode_request(const std::string& code) const {
    Json msg;
    msg["type"] = "execute";
    msg["code"] = code;
    return json_dump(msg) + "\n";
}

std::string ProcessKernel::shutdown_request() const {
    return "{\"type\":\"shutdown\"}\n";
}

void ProcessKernel::close_fds() {
    close_quietly(out_fd_);
    close_quietly(err_fd_);
    close_quietly(ctl_fd_);
    close_quietly(req_fd_);
}

bool ProcessKernel::check_exited() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exited_) return true;
    pid_t pid = pid_.load();
    if (pid <= 0) return true;
    int status = 0;
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid || (w < 0 && errno == ECHILD)) {
        exited_ = true;
        exit_status_ = status;
        dead_ = true;
        return true;
    }
    return false;
}

OpStatus ProcessKernel::start(const KernelStartOptions& options) {
    ignore_sigpipe_once();
    interrupt_grace_ms_ = options.interrupt_grace_ms;

    std::map<std::string, std::string> env = options.envs;
    std::map<std::string, std::string> extra = driver_env();
    for (std::map<std::string, std::string>::const_iterator it = extra.begin(); it != extra.end(); ++it) {
        env[it->first] = it->second;
    }

    std::vector<std::string> argv_items = command_line();
    if (argv_items.empty()) {
        return OpStatus::fail(ErrorCode::InternalError, "kernel has no command line");
    }
    CStringArray argv(argv_items);
    CStringArray envp(merged_environment(env));
    std::string exec_error = "execd: cannot execute " + argv_items[0] + "\n";

    // [0] read end, [1] write end
    int out_pipe[2], err_pipe[2], ctl_pipe[2], req_pipe[2];
    int* pipes[4] = {out_pipe, err_pipe, ctl_pipe, req_pipe};
    for (int i = 0; i < 4; ++i) {
        if (pipe2(pipes[i], O_CLOEXEC) != 0) {
            int saved = errno;
            for (int j = 0; j < i; ++j) {
                close(pipes[j][0]);
                close(pipes[j][1]);
            }
            return OpStatus::fail(ErrorCode::InternalError, std::string("pipe: ") + strerror(saved));
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        for (int i = 0; i < 4; ++i) {
            close(pipes[i][0]);
            close(pipes[i][1]);
        }
        return OpStatus::fail(ErrorCode::InternalError, std::string("fork: ") + strerror(saved));
    }

    if (pid == 0) {
        setsid();
        // Move the child ends above the target numbers before dup2 so that
        // none of them is clobbered
        int out_w = fcntl(out_pipe[1], F_DUPFD_CLOEXEC, 10);
        int err_w = fcntl(err_pipe[1], F_DUPFD_CLOEXEC, 10);
        int ctl_w = fcntl(ctl_pipe[1], F_DUPFD_CLOEXEC, 10);
        int req_r = fcntl(req_pipe[0], F_DUPFD_CLOEXEC, 10);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_w, STDOUT_FILENO);
        dup2(err_w, STDERR_FILENO);
        dup2(ctl_w, 3);
        dup2(req_r, 4);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(127);
        }
        execvpe(argv_items[0].c_str(), argv.data(), envp.data());
        ssize_t ignored = write(STDERR_FILENO, exec_error.data(), exec_error.size());
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(ctl_pipe[1]);
    close(req_pipe[0]);
    out_fd_ = out_pipe[0];
    err_fd_ = err_pipe[0];
    ctl_fd_ = ctl_pipe[0];
    req_fd_ = req_pipe[1];
    set_nonblocking(out_fd_);
    set_nonblocking(err_fd_);
    set_nonblocking(ctl_fd_);
    pid_ = pid;

    LOG_DEBUG("[Kernel] %s spawned (pid %d), waiting for ready", language().c_str(), static_cast<int>(pid));

    // Readiness handshake
    std::string startup_output;
    int64_t deadline = monotonic_ms() + options.start_timeout_ms;
    while (monotonic_ms() < deadline) {
        struct pollfd pfds[3];
        pfds[0].fd = ctl_fd_; pfds[0].events = POLLIN; pfds[0].revents = 0;
        pfds[1].fd = out_fd_; pfds[1].events = POLLIN; pfds[1].revents = 0;
        pfds[2].fd = err_fd_; pfds[2].events = POLLIN; pfds[2].revents = 0;
        poll(pfds, 3, kPollIntervalMs);

        if (pfds[1].revents) read_available(out_fd_, startup_output);
        if (pfds[2].revents) read_available(err_fd_, startup_output);
        if (startup_output.size() > kStartupErrorBytes) {
            startup_output.erase(0, startup_output.size() - kStartupErrorBytes);
        }

        std::vector<Json> frames;
        bool eof = false;
        read_control(frames, eof);
        for (size_t i = 0; i < frames.size(); ++i) {
            if (frames[i].value("type", std::string()) == "ready") {
                version_ = frames[i].value("version", std::string());
                LOG_INFO("[Kernel] %s ready (pid %d, version %s)", language().c_str(),
                         static_cast<int>(pid), version_.empty() ? "?" : version_.c_str());
                return OpStatus::ok();
            }
        }

        if (eof || check_exited()) {
            // Pick up the last words of the failed interpreter
            read_available(err_fd_, startup_output);
            sleep_ms(20);
            check_exited();
            std::string detail = trim(startup_output);
            kill();
            close_fds();
            dead_ = true;
            return OpStatus::fail(ErrorCode::InternalError,
                                  language() + " kernel exited during startup" +
                                  (detail.empty() ? std::string() : ": " + detail));
        }
    }

    kill();
    close_fds();
    dead_ = true;
    return OpStatus::fail(ErrorCode::Timeout,
                          language() + " kernel did not become ready within " +
                          std::to_string(options.start_timeout_ms) + " ms");
}

bool ProcessKernel::read_control(std::vector<Json>& frames, bool& eof) {
    eof = false;
    if (ctl_fd_ < 0) {
        eof = true;
        return false;
    }
    while (true) {
        ssize_t n = read_available(ctl_fd_, ctl_buffer_);
        if (n == 0) {
            eof = true;
            break;
        }
        if (n < 0) break;
    }

    size_t pos;
    while ((pos = ctl_buffer_.find('\n')) != std::string::npos) {
        std::string line = ctl_buffer_.substr(0, pos);
        ctl_buffer_.erase(0, pos + 1);
        if (trim(line).empty()) continue;
        Json frame = Json::parse(line, nullptr, false);
        if (frame.is_discarded() || !frame.is_object()) {
            LOG_WARN("[Kernel] %s sent a malformed control frame", language().c_str());
            continue;
        }
        frames.push_back(frame);
    }
    return !frames.empty();
}

void ProcessKernel::drain_stray_output() {
    std::string stray;
    if (out_fd_ >= 0) while (read_available(out_fd_, stray) > 0) {}
    if (err_fd_ >= 0) while (read_available(err_fd_, stray) > 0) {}
    if (!stray.empty()) {
        LOG_DEBUG("[Kernel] %s: discarded %zu bytes of output produced between cells",
                  language().c_str(), stray.size());
    }
}

KernelReply ProcessKernel::submit(const KernelRequest& request, const OutputCallback& on_output) {
    KernelReply reply;

    if (dead_ || check_exited() || req_fd_ < 0) {
        reply.outcome = KernelOutcome::Crashed;
        reply.alive = false;
        reply.error = ExecutionError(ErrorCode::KernelCrashed, "KernelCrashed", language() + " kernel is not running");
        return reply;
    }

    drain_stray_output();

    if (!write_all(req_fd_, encode_request(request.code))) {
        dead_ = true;
        reply.outcome = KernelOutcome::Crashed;
        reply.alive = false;
        reply.error = ExecutionError(ErrorCode::KernelCrashed, "KernelCrashed",
                                     std::string("cannot reach kernel: ") + strerror(errno));
        return reply;
    }

    int fds[2] = {out_fd_, err_fd_};
    StreamKind streams[2] = {StreamKind::Stdout, StreamKind::Stderr};
    std::string pending[2];
    bool open_fd[2] = {true, true};

    int64_t deadline = request.timeout_ms > 0 ? monotonic_ms() + request.timeout_ms : 0;
    KernelOutcome stop = KernelOutcome::Ok;     // Cancelled/TimedOut once interrupted
    int64_t interrupt_sent_ms = 0;
    bool got_done = false;
    bool crashed = false;
    Json done;

    while (!got_done && !crashed) {
        struct pollfd pfds[3];
        int nfds = 0;
        pfds[nfds].fd = ctl_fd_; pfds[nfds].events = POLLIN; pfds[nfds].revents = 0; ++nfds;
        int index[3] = {-1, -1, -1};
        for (int i = 0; i < 2; ++i) {
            if (!open_fd[i]) continue;
            pfds[nfds].fd = fds[i];
            pfds[nfds].events = POLLIN;
            pfds[nfds].revents = 0;
            index[nfds] = i;
            ++nfds;
        }
        poll(pfds, nfds, kPollIntervalMs);

        for (int k = 1; k < nfds; ++k) {
            if (!pfds[k].revents) continue;
            int i = index[k];
            ssize_t n = read_available(fds[i], pending[i]);
            if (n == 0) {
                open_fd[i] = false;
            }
            size_t complete = utf8_complete_prefix(pending[i]);
            if (complete > 0) {
                on_output(streams[i], pending[i].substr(0, complete));
                pending[i].erase(0, complete);
            }
        }

        std::vector<Json> frames;
        bool eof = false;
        read_control(frames, eof);
        for (size_t i = 0; i < frames.size(); ++i) {
            if (frames[i].value("type", std::string()) == "done") {
                done = frames[i];
                got_done = true;
                break;
            }
        }
        if (got_done) break;
        if (eof || check_exited()) {
            // The done frame may have landed between the read and the exit
            std::vector<Json> last;
            bool ignored_eof = false;
            read_control(last, ignored_eof);
            for (size_t i = 0; i < last.size() && !got_done; ++i) {
                if (last[i].value("type", std::string()) == "done") {
                    done = last[i];
                    got_done = true;
                }
            }
            if (!got_done) crashed = true;
            break;
        }

        int64_t now = monotonic_ms();
        if (stop == KernelOutcome::Ok) {
            if (request.cancel && request.cancel->load()) {
                stop = KernelOutcome::Cancelled;
            } else if (deadline > 0 && now >= deadline) {
                stop = KernelOutcome::TimedOut;
            }
            if (stop != KernelOutcome::Ok) {
                LOG_INFO("[Kernel] %s: interrupting cell (%s)", language().c_str(),
                         stop == KernelOutcome::Cancelled ? "cancelled" : "timed out");
                interrupt();
                interrupt_sent_ms = now;
            }
        } else if (now - interrupt_sent_ms >= interrupt_grace_ms_) {
            LOG_WARN("[Kernel] %s did not answer the interrupt within %d ms, killing it",
                     language().c_str(), interrupt_grace_ms_);
            kill();
            crashed = true;
        }
    }

    // Output written before the done frame is already in the pipes
    for (int i = 0; i < 2; ++i) {
        if (open_fd[i]) {
            while (read_available(fds[i], pending[i]) > 0) {}
        }
        if (!pending[i].empty()) {
            on_output(streams[i], pending[i]);
        }
    }

    if (crashed) {
        dead_ = true;
        reply.alive = false;
        if (stop != KernelOutcome::Ok) {
            reply.outcome = stop;
            reply.error = stop == KernelOutcome::Cancelled
                ? ExecutionError(ErrorCode::Cancelled, "Cancelled", "execution was cancelled")
                : ExecutionError(ErrorCode::Timeout, "Timeout", "execution exceeded its timeout");
        } else {
            check_exited();
            int code = exited_ ? exit_code_from_status(exit_status_) : -1;
            reply.outcome = KernelOutcome::Crashed;
            reply.error = ExecutionError(ErrorCode::KernelCrashed, "KernelCrashed",
                                         language() + " kernel exited unexpectedly" +
                                         (code >= 0 ? " (exit code " + std::to_string(code) + ")" : std::string()));
            LOG_WARN("[Kernel] %s kernel (pid %d) crashed", language().c_str(), static_cast<int>(pid_.load()));
        }
        return reply;
    }

    std::string status = done.value("status", std::string("ok"));
    if (status == "ok") {
        reply.outcome = KernelOutcome::Ok;
        if (done.contains("result") && done["result"].is_object()) {
            reply.result = done["result"];
        }
    } else {
        reply.outcome = KernelOutcome::Error;
        reply.error.code = ErrorCode::ExecutionFailed;
        reply.error.ename = done.value("ename", std::string("Error"));
        reply.error.evalue = done.value("evalue", std::string());
        if (done.contains("traceback") && done["traceback"].is_array()) {
            for (size_t i = 0; i < done["traceback"].size(); ++i) {
                if (done["traceback"][i].is_string()) {
                    reply.error.traceback.push_back(done["traceback"][i].get<std::string>());
                }
            }
        }
    }

    // The kernel answered the interrupt: the cell stops, the context survives
    if (stop != KernelOutcome::Ok) {
        reply.outcome = stop;
        ExecutionError cause = stop == KernelOutcome::Cancelled
            ? ExecutionError(ErrorCode::Cancelled, "Cancelled", "execution was cancelled")
            : ExecutionError(ErrorCode::Timeout, "Timeout", "execution exceeded its timeout");
        cause.traceback = reply.error.traceback;
        reply.error = cause;
        reply.result = Json();
    }
    return reply;
}

void ProcessKernel::interrupt() {
    pid_t pid = pid_.load();
    if (pid > 0 && !dead_) {
        signal_process_group(pid, SIGINT);
    }
}

void ProcessKernel::kill() {
    pid_t pid = pid_.load();
    if (pid > 0) {
        signal_process_group(pid, SIGKILL);
    }
    dead_ = true;
}

void ProcessKernel::shutdown() {
    pid_t pid = pid_.load();
    if (pid <= 0) {
        close_fds();
        return;
    }

    if (!check_exited()) {
        if (req_fd_ >= 0) {
            write_all(req_fd_, shutdown_request());
        }
        close_quietly(req_fd_);

        int64_t deadline = monotonic_ms() + kShutdownWaitMs;
        while (!check_exited() && monotonic_ms() < deadline) {
            sleep_ms(20);
        }
    }
    // Whatever the driver left behind in its process group goes too
    signal_process_group(pid, SIGKILL);
    while (!check_exited()) {
        sleep_ms(10);
    }
    dead_ = true;
    close_fds();
    LOG_DEBUG("[Kernel] %s kernel (pid %d) stopped", language().c_str(), static_cast<int>(pid));
}

bool ProcessKernel::is_healthy() {
    if (dead_) return false;
    return !check_exited();
}

} // namespace execd
