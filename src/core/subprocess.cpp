#include <execd/core/subprocess.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace execd {

CStringArray::CStringArray(const std::vector<std::string>& items)
    : storage_(items)
{
    ptrs_.reserve(storage_.size() + 1);
    for (size_t i = 0; i < storage_.size(); ++i) {
        ptrs_.push_back(&storage_[i][0]);
    }
    ptrs_.push_back(nullptr);
}

bool valid_env_name(const std::string& name) {
    if (name.empty()) return false;
    return name.find('=') == std::string::npos && name.find('\0') == std::string::npos;
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        size_t eq = entry.find('=');
        if (eq == std::string::npos) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (std::map<std::string, std::string>::const_iterator it = overrides.begin();
         it != overrides.end(); ++it) {
        env[it->first] = it->second;
    }

    std::vector<std::string> out;
    out.reserve(env.size());
    for (std::map<std::string, std::string>::const_iterator it = env.begin(); it != env.end(); ++it) {
        out.push_back(it->first + "=" + it->second);
    }
    return out;
}

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void signal_process_group(pid_t pgid, int sig) {
    if (pgid <= 0) return;
    if (kill(-pgid, sig) != 0 && errno == ESRCH) {
        // Group already gone; the leader may still be a zombie
        kill(pgid, sig);
    }
}

ssize_t read_available(int fd, std::string& out) {
    char buf[16384];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            return n;
        }
        if (n == 0) return 0;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return -1;
        return 0;  // treat read errors as EOF
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace execd
