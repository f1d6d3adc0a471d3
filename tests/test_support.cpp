#include "test_support.hpp"
#include <execd/core/utils.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <arpa/inet.h>
#include <ftw.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

namespace execd {
namespace test {

namespace {

int remove_entry(const char* path, const struct stat*, int, struct FTW*) {
    return ::remove(path);
}

} // anonymous namespace

TempDir::TempDir() {
    const char* base = getenv("TMPDIR");
    std::string tmpl = std::string(base && base[0] ? base : "/tmp") + "/execd-test-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp failed for " + tmpl);
    }
    path_ = buf.data();
}

TempDir::~TempDir() {
    if (!path_.empty()) {
        nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }
}

std::string TempDir::file(const std::string& relative) const {
    return join_path(path_, relative);
}

bool write_text(const std::string& path, const std::string& data) {
    create_parent_directory(path);
    std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    out << data;
    return out.good();
}

std::string read_text(const std::string& path) {
    std::ifstream in(path.c_str(), std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool path_exists(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool wait_for(const std::function<bool()>& condition, int timeout_ms) {
    int64_t deadline = monotonic_ms() + timeout_ms;
    while (!condition()) {
        if (monotonic_ms() >= deadline) return false;
        sleep_ms(10);
    }
    return true;
}

std::string stream_text(const ExecutionSnapshot& snapshot, StreamKind stream) {
    std::string out;
    for (size_t i = 0; i < snapshot.logs.size(); ++i) {
        if (snapshot.logs[i].stream == stream) out += snapshot.logs[i].text;
    }
    return out;
}

bool have_binary(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }
    const char* path = getenv("PATH");
    if (!path) return false;
    std::vector<std::string> dirs = split(path, ':');
    for (size_t i = 0; i < dirs.size(); ++i) {
        if (dirs[i].empty()) continue;
        if (access(join_path(dirs[i], name).c_str(), X_OK) == 0) return true;
    }
    return false;
}

namespace {

// Connected socket with the request already sent, -1 on failure
int send_local(int port, const std::string& request) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    struct timeval tv;
    tv.tv_sec = 10;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return -1;
    }

    size_t off = 0;
    while (off < request.size()) {
        ssize_t n = send(fd, request.data() + off, request.size() - off, MSG_NOSIGNAL);
        if (n <= 0) break;
        off += static_cast<size_t>(n);
    }
    return fd;
}

} // anonymous namespace

std::string raw_http(int port, const std::string& request) {
    return raw_http_until(port, request, "");
}

std::string raw_http_until(int port, const std::string& request, const std::string& marker) {
    int fd = send_local(port, request);
    if (fd < 0) return "";

    std::string response;
    char buf[4096];
    while (marker.empty() || response.find(marker) == std::string::npos) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        response.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

int raw_status(const std::string& response) {
    if (!starts_with(response, "HTTP/1.1 ") || response.size() < 12) return 0;
    int64_t status = 0;
    if (!parse_int64(response.substr(9, 3), status)) return 0;
    return static_cast<int>(status);
}

std::string raw_body(const std::string& response) {
    size_t pos = response.find("\r\n\r\n");
    return pos == std::string::npos ? std::string() : response.substr(pos + 4);
}

} // namespace test
} // namespace execd
