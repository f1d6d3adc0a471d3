/*
 * execd C++ - Kernel capability
 *
 * A kernel is the interpreter subprocess behind a code context. The session
 * manager only talks to this interface; each language provides a variant.
 */
#ifndef execd_KERNEL_KERNEL_HPP
#define execd_KERNEL_KERNEL_HPP

#include <execd/core/errors.hpp>
#include <execd/core/json.hpp>
#include <execd/exec/execution.hpp>
#include <string>
#include <map>
#include <atomic>
#include <functional>

namespace execd {

struct KernelStartOptions {
    std::string cwd;                            // absolute host path
    std::map<std::string, std::string> envs;    // merged over the daemon env
    int start_timeout_ms;                       // readiness handshake bound
    int interrupt_grace_ms;                     // SIGINT -> SIGKILL

    KernelStartOptions() : start_timeout_ms(30000), interrupt_grace_ms(3000) {}
};

// One cell handed to the kernel. `cancel` is owned by the caller and may be
// raised from another thread while submit() runs.
struct KernelRequest {
    std::string code;
    int64_t timeout_ms;                 // <= 0: none
    const std::atomic<bool>* cancel;

    KernelRequest() : timeout_ms(0), cancel(nullptr) {}
};

enum class KernelOutcome {
    Ok,
    Error,          // code-level exception, kernel still usable
    Cancelled,
    TimedOut,
    Crashed         // kernel process died
};

struct KernelReply {
    KernelOutcome outcome;
    Json result;            // {"text/plain": ...} or null
    ExecutionError error;
    bool alive;             // false: the kernel is gone, context is Dead

    KernelReply() : outcome(KernelOutcome::Ok), alive(true) {}
};

typedef std::function<void(StreamKind, const std::string&)> OutputCallback;

class Kernel {
public:
    virtual ~Kernel() {}

    virtual std::string language() const = 0;

    // Spawn the interpreter and wait for its ready frame
    virtual OpStatus start(const KernelStartOptions& options) = 0;

    // Evaluate one cell against the accumulated state. Blocks until the
    // kernel reports completion, the cell is cancelled or times out, or the
    // kernel dies. Output is streamed through `on_output` as it arrives.
    virtual KernelReply submit(const KernelRequest& request, const OutputCallback& on_output) = 0;

    // Ask the running cell to stop (SIGINT). Safe from any thread.
    virtual void interrupt() = 0;

    // Kill the kernel immediately. Safe from any thread.
    virtual void kill() = 0;

    // Graceful stop; must not run concurrently with submit()
    virtual void shutdown() = 0;

    virtual bool is_healthy() = 0;
};

} // namespace execd

#endif // execd_KERNEL_KERNEL_HPP
