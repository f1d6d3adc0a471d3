#include <execd/kernel/kernel_factory.hpp>
#include <execd/kernel/python_kernel.hpp>
#include <execd/kernel/node_kernel.hpp>
#include <execd/kernel/bash_kernel.hpp>
#include <execd/core/utils.hpp>

namespace execd {

bool normalize_language(const std::string& name, std::string& canonical) {
    std::string lower = to_lower(trim(name));
    if (lower == "python" || lower == "python3" || lower == "py") {
        canonical = "python";
        return true;
    }
    if (lower == "javascript" || lower == "js" || lower == "node" || lower == "nodejs") {
        canonical = "javascript";
        return true;
    }
    if (lower == "bash" || lower == "sh" || lower == "shell") {
        canonical = "bash";
        return true;
    }
    return false;
}

KernelFactory make_process_kernel_factory(const std::map<std::string, std::string>& binaries) {
    return [binaries](const std::string& language) -> std::unique_ptr<Kernel> {
        std::map<std::string, std::string>::const_iterator it = binaries.find(language);
        std::string binary = (it != binaries.end()) ? it->second : std::string();

        if (language == "python") {
            return std::unique_ptr<Kernel>(new PythonKernel(binary));
        }
        if (language == "javascript") {
            return std::unique_ptr<Kernel>(new NodeKernel(binary));
        }
        if (language == "bash") {
            return std::unique_ptr<Kernel>(new BashKernel(binary));
        }
        return std::unique_ptr<Kernel>();
    };
}

} // namespace execd
