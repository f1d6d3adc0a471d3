/*
 * execd C++ - Workspace
 *
 * The sandbox root directory. Every client path (file operations, command
 * cwd, kernel cwd) is resolved through here and must stay inside the root.
 */
#ifndef execd_CORE_WORKSPACE_HPP
#define execd_CORE_WORKSPACE_HPP

#include "errors.hpp"
#include <string>

namespace execd {

class Workspace {
public:
    explicit Workspace(const std::string& root);

    // Create the root if needed and resolve its canonical location
    bool init(std::string& error);

    const std::string& root() const { return root_; }

    // Map a sandbox path to an absolute host path.
    //   ""  or a path with NUL      -> ValidationError
    //   escapes the root (.., symlink) -> PermissionDenied
    // A leading "/" means the sandbox root, unless the path already names a
    // location under the root directory itself.
    OpResult<std::string> resolve(const std::string& path) const;

    // Check if an absolute path is the root or below it
    bool contains(const std::string& abs_path) const;

    // Inverse of resolve(): "/"-prefixed sandbox path for an absolute path
    std::string to_sandbox_path(const std::string& abs_path) const;

private:
    std::string root_;       // as configured, normalized
    std::string real_root_;  // realpath of root_

    static bool has_prefix_dir(const std::string& path, const std::string& dir);
};

} // namespace execd

#endif // execd_CORE_WORKSPACE_HPP
