/*
 * execd C++ - Subprocess helpers
 *
 * Shared by the process runner and the process-backed kernels.
 */
#ifndef execd_CORE_SUBPROCESS_HPP
#define execd_CORE_SUBPROCESS_HPP

#include <string>
#include <vector>
#include <map>
#include <sys/types.h>

namespace execd {

// NULL-terminated char* array over owned strings, for execve().
// Built before fork() so the child does not allocate.
class CStringArray {
public:
    explicit CStringArray(const std::vector<std::string>& items);
    char* const* data() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

// Environment variable names must be non-empty and free of '=' and NUL
bool valid_env_name(const std::string& name);

// Current process environment with `overrides` applied, as NAME=value items
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides);

// waitpid() status -> shell-style exit code (128+signal when killed)
int exit_code_from_status(int status);

// Signal a whole process group; ESRCH is not an error
void signal_process_group(pid_t pgid, int sig);

// Read what is available on a non-blocking fd and append it to `out`.
// Returns >0 bytes read, 0 on EOF, -1 when nothing is available.
ssize_t read_available(int fd, std::string& out);

bool set_nonblocking(int fd);

// Write the whole buffer, retrying on EINTR/partial writes
bool write_all(int fd, const std::string& data);

} // namespace execd

#endif // execd_CORE_SUBPROCESS_HPP
