/*
 * execd C++ - Kernel factory
 */
#ifndef execd_KERNEL_KERNEL_FACTORY_HPP
#define execd_KERNEL_KERNEL_FACTORY_HPP

#include "kernel.hpp"
#include <string>
#include <map>
#include <memory>
#include <functional>

namespace execd {

// Builds the kernel for a canonical language name; nullptr if unsupported
typedef std::function<std::unique_ptr<Kernel>(const std::string& language)> KernelFactory;

// "python" | "javascript" (js, node) | "bash" (sh, shell), case-insensitive.
// Returns false for anything else.
bool normalize_language(const std::string& name, std::string& canonical);

// Factory for the interpreter kernels. `binaries` maps a canonical language
// to the interpreter binary; missing entries use the defaults.
KernelFactory make_process_kernel_factory(const std::map<std::string, std::string>& binaries);

} // namespace execd

#endif // execd_KERNEL_KERNEL_FACTORY_HPP
