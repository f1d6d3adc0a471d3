/*
 * execd C++ - Workspace Implementation
 *
 * Lexical normalization first, then a realpath check on the nearest
 * existing ancestor so that symlinks inside the root cannot point out of it.
 */
#include <execd/core/workspace.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace execd {

Workspace::Workspace(const std::string& root)
    : root_(normalize_path(root.empty() ? std::string("/workspace") : root))
{
}

bool Workspace::has_prefix_dir(const std::string& path, const std::string& dir) {
    if (dir == "/") return !path.empty() && path[0] == '/';
    if (path.size() >= dir.size() && path.compare(0, dir.size(), dir) == 0) {
        return (path.size() == dir.size() || path[dir.size()] == '/');
    }
    return false;
}

bool Workspace::init(std::string& error) {
    if (root_.empty() || root_[0] != '/') {
        error = "workspace_dir must be an absolute path: " + root_;
        return false;
    }
    if (!make_directories(root_)) {
        error = "cannot create workspace " + root_ + ": " + strerror(errno);
        return false;
    }

    char resolved[PATH_MAX];
    if (!realpath(root_.c_str(), resolved)) {
        error = "cannot resolve workspace " + root_ + ": " + strerror(errno);
        return false;
    }
    real_root_ = resolved;

    LOG_INFO("[Workspace] Root: %s", root_.c_str());
    if (real_root_ != root_) {
        LOG_DEBUG("[Workspace] Root resolves to %s", real_root_.c_str());
    }
    return true;
}

bool Workspace::contains(const std::string& abs_path) const {
    return has_prefix_dir(abs_path, root_) ||
           (!real_root_.empty() && has_prefix_dir(abs_path, real_root_));
}

std::string Workspace::to_sandbox_path(const std::string& abs_path) const {
    const std::string* base = nullptr;
    if (has_prefix_dir(abs_path, root_)) base = &root_;
    else if (!real_root_.empty() && has_prefix_dir(abs_path, real_root_)) base = &real_root_;
    if (!base) return abs_path;
    if (*base == "/") return abs_path;

    std::string rest = abs_path.substr(base->size());
    return rest.empty() ? std::string("/") : rest;
}

OpResult<std::string> Workspace::resolve(const std::string& path) const {
    if (path.empty()) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "path is required");
    }
    if (path.find('\0') != std::string::npos) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "path contains a NUL byte");
    }

    // Lexical pass
    std::string candidate;
    std::string absolute = normalize_path(path);
    if (path[0] == '/' && has_prefix_dir(absolute, root_)) {
        candidate = absolute;
    } else {
        size_t start = path.find_first_not_of('/');
        std::string relative = (start == std::string::npos) ? std::string() : path.substr(start);
        std::string normalized = relative.empty() ? std::string(".") : normalize_path(relative);
        if (normalized == ".." || starts_with(normalized, "../")) {
            return OpResult<std::string>::fail(ErrorCode::PermissionDenied,
                                               "path escapes the sandbox root: " + path);
        }
        candidate = (normalized == ".") ? root_ : join_path(root_, normalized);
    }

    // Physical pass: the nearest existing ancestor must resolve inside the root
    std::string cursor = candidate;
    while (true) {
        struct stat st;
        if (lstat(cursor.c_str(), &st) == 0) {
            char resolved[PATH_MAX];
            if (!realpath(cursor.c_str(), resolved)) {
                if (errno == EACCES) {
                    return OpResult<std::string>::fail(ErrorCode::PermissionDenied,
                                                       "cannot access " + path);
                }
                // Dangling symlink: judge it by its target's location
                char target[PATH_MAX];
                ssize_t n = readlink(cursor.c_str(), target, sizeof(target) - 1);
                if (n < 0) {
                    return OpResult<std::string>::fail(ErrorCode::PermissionDenied,
                                                       "cannot resolve " + path);
                }
                target[n] = '\0';
                std::string t(target);
                std::string dir = cursor.substr(0, cursor.rfind('/'));
                std::string full = normalize_path(t[0] == '/' ? t : join_path(dir, t));
                if (!contains(full)) {
                    return OpResult<std::string>::fail(ErrorCode::PermissionDenied,
                                                       "path escapes the sandbox root: " + path);
                }
                break;
            }
            if (!has_prefix_dir(resolved, real_root_)) {
                return OpResult<std::string>::fail(ErrorCode::PermissionDenied,
                                                   "path escapes the sandbox root: " + path);
            }
            break;
        }
        if (errno == EACCES) {
            return OpResult<std::string>::fail(ErrorCode::PermissionDenied, "cannot access " + path);
        }
        size_t pos = cursor.rfind('/');
        if (pos == std::string::npos || pos == 0) break;
        cursor = cursor.substr(0, pos);
    }

    return OpResult<std::string>::ok(candidate);
}

} // namespace execd
