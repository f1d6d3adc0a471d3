/*
 * execd C++ - File Operations Service
 *
 * Read/write/list/delete inside the workspace root. Batch writes apply each
 * entry independently and report a per-entry outcome.
 */
#ifndef execd_EXEC_FILE_SERVICE_HPP
#define execd_EXEC_FILE_SERVICE_HPP

#include <execd/core/errors.hpp>
#include <execd/core/json.hpp>
#include <execd/core/workspace.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <sys/stat.h>

namespace execd {

struct FileWriteEntry {
    std::string path;
    std::string data;
    std::string mode;       // chmod-style octal ("644", "0755"); empty = 644
    std::string encoding;   // "utf-8" (default) or "base64"
};

struct FileWriteResult {
    std::string path;
    bool ok;
    ErrorCode code;
    std::string error;

    FileWriteResult() : ok(false), code(ErrorCode::None) {}

    Json to_json() const;
};

struct FileContent {
    std::string path;
    std::string data;       // raw bytes or base64 text, per `encoding`
    std::string encoding;
    int64_t size;
    unsigned int mode;

    FileContent() : size(0), mode(0) {}

    Json to_json() const;
};

struct FileEntryInfo {
    std::string name;
    std::string path;       // sandbox path ("/dir/name")
    std::string type;       // file | directory | symlink | other
    int64_t size;
    unsigned int mode;
    int64_t mtime;          // unix seconds

    FileEntryInfo() : size(0), mode(0), mtime(0) {}

    Json to_json() const;
};

class FileService {
public:
    explicit FileService(const Workspace& workspace);

    std::vector<FileWriteResult> write_files(const std::vector<FileWriteEntry>& entries);

    OpResult<FileContent> read_file(const std::string& path, const std::string& encoding = "utf-8");

    // Directory listing sorted by name
    OpResult<std::vector<FileEntryInfo> > list(const std::string& path);

    // Delete a file, symlink or empty directory; `recursive` removes trees
    OpStatus remove(const std::string& path, bool recursive);

    // mkdir -p with the given mode
    OpResult<FileEntryInfo> make_dirs(const std::string& path, const std::string& mode = "");

    OpStatus move(const std::string& source, const std::string& destination);

    OpResult<FileEntryInfo> stat(const std::string& path);

    // "644", "0644", "4755" -> bits; false if not an octal mode
    static bool parse_mode(const std::string& text, unsigned int& out);

    // 0644 -> 644 (octal digits read as a decimal number, the wire form)
    static int mode_to_wire(unsigned int mode);

private:
    const Workspace& workspace_;

    FileWriteResult write_one(const FileWriteEntry& entry);
    FileEntryInfo describe(const std::string& abs_path, const struct stat& st) const;
};

} // namespace execd

#endif // execd_EXEC_FILE_SERVICE_HPP
