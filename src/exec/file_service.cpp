/*
 * execd C++ - File Operations Service Implementation
 */
#include <execd/exec/file_service.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/subprocess.hpp>
#include <execd/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace execd {

namespace {

const unsigned int kDefaultFileMode = 0644;
const unsigned int kDefaultDirMode = 0755;

ErrorCode code_from_errno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case EISDIR:
        case EINVAL:
        case ENAMETOOLONG:
            return ErrorCode::ValidationError;
        case EEXIST:
        case ENOTEMPTY:
        case EBUSY:
            return ErrorCode::Conflict;
        default:
            return ErrorCode::InternalError;
    }
}

std::string errno_message(const std::string& what, const std::string& path, int err) {
    return what + " " + path + ": " + strerror(err);
}

int remove_entry(const char* fpath, const struct stat*, int, struct FTW*) {
    return ::remove(fpath);
}

} // anonymous namespace

// ============================================================================
// Wire forms
// ============================================================================

Json FileWriteResult::to_json() const {
    Json j;
    j["path"] = path;
    j["ok"] = ok;
    if (!ok) {
        Json err;
        err["code"] = error_code_name(code);
        err["message"] = error;
        j["error"] = err;
    }
    return j;
}

Json FileContent::to_json() const {
    Json j;
    j["path"] = path;
    j["data"] = data;
    j["encoding"] = encoding;
    j["size"] = size;
    j["mode"] = FileService::mode_to_wire(mode);
    return j;
}

Json FileEntryInfo::to_json() const {
    Json j;
    j["name"] = name;
    j["path"] = path;
    j["type"] = type;
    j["size"] = size;
    j["mode"] = FileService::mode_to_wire(mode);
    j["mtime"] = mtime;
    return j;
}

// ============================================================================
// FileService
// ============================================================================

FileService::FileService(const Workspace& workspace)
    : workspace_(workspace)
{
}

bool FileService::parse_mode(const std::string& text, unsigned int& out) {
    std::string t = trim(text);
    if (t.empty() || t.size() > 5) return false;
    unsigned int value = 0;
    for (size_t i = 0; i < t.size(); ++i) {
        if (t[i] < '0' || t[i] > '7') return false;
        value = value * 8 + static_cast<unsigned int>(t[i] - '0');
    }
    if (value > 07777) return false;
    out = value;
    return true;
}

int FileService::mode_to_wire(unsigned int mode) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%o", mode & 07777);
    return atoi(buf);
}

FileEntryInfo FileService::describe(const std::string& abs_path, const struct stat& st) const {
    FileEntryInfo info;
    size_t slash = abs_path.rfind('/');
    info.name = (slash == std::string::npos) ? abs_path : abs_path.substr(slash + 1);
    info.path = workspace_.to_sandbox_path(abs_path);
    if (info.path == "/") info.name = "/";
    if (S_ISREG(st.st_mode)) info.type = "file";
    else if (S_ISDIR(st.st_mode)) info.type = "directory";
    else if (S_ISLNK(st.st_mode)) info.type = "symlink";
    else info.type = "other";
    info.size = static_cast<int64_t>(st.st_size);
    info.mode = st.st_mode & 07777;
    info.mtime = static_cast<int64_t>(st.st_mtime);
    return info;
}

std::vector<FileWriteResult> FileService::write_files(const std::vector<FileWriteEntry>& entries) {
    std::vector<FileWriteResult> results;
    results.reserve(entries.size());
    size_t failures = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        results.push_back(write_one(entries[i]));
        if (!results.back().ok) ++failures;
    }
    LOG_DEBUG("[Files] Batch write: %zu entries, %zu failed", entries.size(), failures);
    return results;
}

FileWriteResult FileService::write_one(const FileWriteEntry& entry) {
    FileWriteResult result;
    result.path = entry.path;

    OpResult<std::string> resolved = workspace_.resolve(entry.path);
    if (!resolved.success) {
        result.code = resolved.code;
        result.error = resolved.error;
        return result;
    }
    const std::string& target = resolved.value;
    if (target == workspace_.root()) {
        result.code = ErrorCode::ValidationError;
        result.error = "cannot write to the sandbox root";
        return result;
    }

    unsigned int mode = kDefaultFileMode;
    if (!entry.mode.empty() && !parse_mode(entry.mode, mode)) {
        result.code = ErrorCode::ValidationError;
        result.error = "invalid mode: " + entry.mode;
        return result;
    }

    std::string bytes;
    std::string encoding = to_lower(entry.encoding);
    if (encoding.empty() || encoding == "utf-8" || encoding == "utf8") {
        bytes = entry.data;
    } else if (encoding == "base64") {
        if (!base64_decode(entry.data, bytes)) {
            result.code = ErrorCode::ValidationError;
            result.error = "data is not valid base64";
            return result;
        }
    } else {
        result.code = ErrorCode::ValidationError;
        result.error = "unsupported encoding: " + entry.encoding;
        return result;
    }

    struct stat st;
    if (::stat(target.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        result.code = ErrorCode::ValidationError;
        result.error = "path is a directory: " + entry.path;
        return result;
    }

    if (!create_parent_directory(target)) {
        int err = errno;
        result.code = code_from_errno(err);
        result.error = errno_message("cannot create parent directory of", entry.path, err);
        return result;
    }

    // Temp file beside the target, then rename over it
    std::string dir = target.substr(0, target.rfind('/'));
    std::string tmpl = dir + "/.execd-tmp-XXXXXX";
    std::vector<char> tmp_path(tmpl.begin(), tmpl.end());
    tmp_path.push_back('\0');

    int fd = mkstemp(tmp_path.data());
    if (fd < 0) {
        int err = errno;
        result.code = code_from_errno(err);
        result.error = errno_message("cannot write", entry.path, err);
        return result;
    }

    bool written = write_all(fd, bytes);
    int write_err = errno;
    if (written && fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        written = false;
        write_err = errno;
    }
    if (close(fd) != 0 && written) {
        written = false;
        write_err = errno;
    }
    if (!written) {
        unlink(tmp_path.data());
        result.code = code_from_errno(write_err);
        result.error = errno_message("cannot write", entry.path, write_err);
        return result;
    }

    if (rename(tmp_path.data(), target.c_str()) != 0) {
        int err = errno;
        unlink(tmp_path.data());
        result.code = code_from_errno(err);
        result.error = errno_message("cannot replace", entry.path, err);
        return result;
    }

    result.ok = true;
    result.code = ErrorCode::None;
    return result;
}

OpResult<FileContent> FileService::read_file(const std::string& path, const std::string& encoding) {
    std::string enc = to_lower(encoding.empty() ? std::string("utf-8") : encoding);
    if (enc == "utf8") enc = "utf-8";
    if (enc != "utf-8" && enc != "base64") {
        return OpResult<FileContent>::fail(ErrorCode::ValidationError, "unsupported encoding: " + encoding);
    }

    OpResult<std::string> resolved = workspace_.resolve(path);
    if (!resolved.success) {
        return OpResult<FileContent>::fail(resolved.code, resolved.error);
    }

    struct stat st;
    if (::stat(resolved.value.c_str(), &st) != 0) {
        int err = errno;
        return OpResult<FileContent>::fail(code_from_errno(err), errno_message("cannot read", path, err));
    }
    if (S_ISDIR(st.st_mode)) {
        return OpResult<FileContent>::fail(ErrorCode::ValidationError, "path is a directory: " + path);
    }

    std::ifstream file(resolved.value.c_str(), std::ios::binary);
    if (!file.is_open()) {
        int err = errno ? errno : EACCES;
        return OpResult<FileContent>::fail(code_from_errno(err), errno_message("cannot read", path, err));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    FileContent content;
    content.path = path;
    content.encoding = enc;
    content.size = static_cast<int64_t>(buffer.str().size());
    content.mode = st.st_mode & 07777;
    content.data = (enc == "base64") ? base64_encode(buffer.str()) : buffer.str();
    return OpResult<FileContent>::ok(content);
}

OpResult<std::vector<FileEntryInfo> > FileService::list(const std::string& path) {
    typedef OpResult<std::vector<FileEntryInfo> > ListResult;

    OpResult<std::string> resolved = workspace_.resolve(path.empty() ? std::string("/") : path);
    if (!resolved.success) {
        return ListResult::fail(resolved.code, resolved.error);
    }

    struct stat st;
    if (::stat(resolved.value.c_str(), &st) != 0) {
        int err = errno;
        return ListResult::fail(code_from_errno(err), errno_message("cannot list", path, err));
    }
    if (!S_ISDIR(st.st_mode)) {
        return ListResult::fail(ErrorCode::ValidationError, "not a directory: " + path);
    }

    DIR* dir = opendir(resolved.value.c_str());
    if (!dir) {
        int err = errno;
        return ListResult::fail(code_from_errno(err), errno_message("cannot list", path, err));
    }

    std::vector<FileEntryInfo> entries;
    struct dirent* ent;
    while ((ent = readdir(dir)) != nullptr) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;

        std::string full = join_path(resolved.value, name);
        struct stat est;
        if (lstat(full.c_str(), &est) != 0) continue;  // vanished while listing
        entries.push_back(describe(full, est));
    }
    closedir(dir);

    std::sort(entries.begin(), entries.end(),
              [](const FileEntryInfo& a, const FileEntryInfo& b) { return a.name < b.name; });
    return ListResult::ok(entries);
}

OpStatus FileService::remove(const std::string& path, bool recursive) {
    OpResult<std::string> resolved = workspace_.resolve(path);
    if (!resolved.success) {
        return OpStatus::fail(resolved.code, resolved.error);
    }
    const std::string& target = resolved.value;
    if (target == workspace_.root()) {
        return OpStatus::fail(ErrorCode::PermissionDenied, "cannot delete the sandbox root");
    }

    struct stat st;
    if (lstat(target.c_str(), &st) != 0) {
        int err = errno;
        return OpStatus::fail(code_from_errno(err), errno_message("cannot delete", path, err));
    }

    int rc;
    if (S_ISDIR(st.st_mode) && recursive) {
        rc = nftw(target.c_str(), remove_entry, 64, FTW_DEPTH | FTW_PHYS);
    } else {
        rc = ::remove(target.c_str());
    }
    if (rc != 0) {
        int err = errno;
        return OpStatus::fail(code_from_errno(err), errno_message("cannot delete", path, err));
    }

    LOG_DEBUG("[Files] Deleted %s%s", path.c_str(), recursive ? " (recursive)" : "");
    return OpStatus::ok();
}

OpResult<FileEntryInfo> FileService::make_dirs(const std::string& path, const std::string& mode) {
    unsigned int bits = kDefaultDirMode;
    if (!mode.empty() && !parse_mode(mode, bits)) {
        return OpResult<FileEntryInfo>::fail(ErrorCode::ValidationError, "invalid mode: " + mode);
    }

    OpResult<std::string> resolved = workspace_.resolve(path);
    if (!resolved.success) {
        return OpResult<FileEntryInfo>::fail(resolved.code, resolved.error);
    }

    if (!make_directories(resolved.value, bits)) {
        int err = errno;
        return OpResult<FileEntryInfo>::fail(code_from_errno(err), errno_message("cannot create", path, err));
    }
    // mkdir() is subject to the umask; apply the requested bits explicitly
    if (resolved.value != workspace_.root()) {
        chmod(resolved.value.c_str(), static_cast<mode_t>(bits));
    }

    struct stat st;
    if (::stat(resolved.value.c_str(), &st) != 0) {
        int err = errno;
        return OpResult<FileEntryInfo>::fail(code_from_errno(err), errno_message("cannot stat", path, err));
    }
    return OpResult<FileEntryInfo>::ok(describe(resolved.value, st));
}

OpStatus FileService::move(const std::string& source, const std::string& destination) {
    OpResult<std::string> src = workspace_.resolve(source);
    if (!src.success) return OpStatus::fail(src.code, src.error);
    OpResult<std::string> dst = workspace_.resolve(destination);
    if (!dst.success) return OpStatus::fail(dst.code, dst.error);

    if (src.value == workspace_.root() || dst.value == workspace_.root()) {
        return OpStatus::fail(ErrorCode::PermissionDenied, "cannot move the sandbox root");
    }

    struct stat st;
    if (lstat(src.value.c_str(), &st) != 0) {
        int err = errno;
        return OpStatus::fail(code_from_errno(err), errno_message("cannot move", source, err));
    }
    if (!create_parent_directory(dst.value)) {
        int err = errno;
        return OpStatus::fail(code_from_errno(err), errno_message("cannot create parent directory of", destination, err));
    }
    if (rename(src.value.c_str(), dst.value.c_str()) != 0) {
        int err = errno;
        return OpStatus::fail(code_from_errno(err), errno_message("cannot move", source, err));
    }

    LOG_DEBUG("[Files] Moved %s -> %s", source.c_str(), destination.c_str());
    return OpStatus::ok();
}

OpResult<FileEntryInfo> FileService::stat(const std::string& path) {
    OpResult<std::string> resolved = workspace_.resolve(path);
    if (!resolved.success) {
        return OpResult<FileEntryInfo>::fail(resolved.code, resolved.error);
    }
    struct stat st;
    if (lstat(resolved.value.c_str(), &st) != 0) {
        int err = errno;
        return OpResult<FileEntryInfo>::fail(code_from_errno(err), errno_message("cannot stat", path, err));
    }
    return OpResult<FileEntryInfo>::ok(describe(resolved.value, st));
}

} // namespace execd
