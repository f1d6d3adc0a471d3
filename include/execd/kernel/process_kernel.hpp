/*
 * execd C++ - Process-backed kernel
 *
 * Common plumbing for interpreter subprocesses:
 *   fd 1/2  raw output pipes, streamed as stdout/stderr chunks
 *   fd 3    control frames kernel -> daemon (one JSON object per line)
 *   fd 4    requests daemon -> kernel
 *   stdin   /dev/null
 * The driver program announces {"type":"ready"} once and answers each
 * request with a {"type":"done"} frame.
 */
#ifndef execd_KERNEL_PROCESS_KERNEL_HPP
#define execd_KERNEL_PROCESS_KERNEL_HPP

#include "kernel.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <sys/types.h>

namespace execd {

class ProcessKernel : public Kernel {
public:
    ProcessKernel();
    virtual ~ProcessKernel();

    OpStatus start(const KernelStartOptions& options) override;
    KernelReply submit(const KernelRequest& request, const OutputCallback& on_output) override;
    void interrupt() override;
    void kill() override;
    void shutdown() override;
    bool is_healthy() override;

    pid_t pid() const { return pid_.load(); }
    const std::string& version() const { return version_; }

protected:
    // argv of the interpreter running the driver
    virtual std::vector<std::string> command_line() const = 0;

    // Extra environment for the driver
    virtual std::map<std::string, std::string> driver_env() const;

    // Bytes written to fd 4 for one cell
    virtual std::string encode_request(const std::string& code) const;

    // Bytes written to fd 4 to ask the driver to exit
    virtual std::string shutdown_request() const;

private:
    ProcessKernel(const ProcessKernel&);
    ProcessKernel& operator=(const ProcessKernel&);

    bool check_exited();
    void close_fds();
    void drain_stray_output();
    bool read_control(std::vector<Json>& frames, bool& eof);

    std::atomic<pid_t> pid_;
    std::atomic<bool> dead_;
    int out_fd_;
    int err_fd_;
    int ctl_fd_;
    int req_fd_;
    std::string ctl_buffer_;
    std::string version_;
    int interrupt_grace_ms_;

    std::mutex reap_mutex_;
    bool exited_;
    int exit_status_;
};

} // namespace execd

#endif // execd_KERNEL_PROCESS_KERNEL_HPP
