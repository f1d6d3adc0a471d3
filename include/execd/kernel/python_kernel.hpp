/*
 * execd C++ - Python kernel
 *
 * python3 running an embedded REPL driver: each cell is exec'd in one
 * persistent namespace and the value of a trailing expression is returned
 * as the cell result.
 */
#ifndef execd_KERNEL_PYTHON_KERNEL_HPP
#define execd_KERNEL_PYTHON_KERNEL_HPP

#include "process_kernel.hpp"

namespace execd {

class PythonKernel : public ProcessKernel {
public:
    explicit PythonKernel(const std::string& binary = "python3");

    std::string language() const override { return "python"; }

protected:
    std::vector<std::string> command_line() const override;
    std::map<std::string, std::string> driver_env() const override;

private:
    std::string binary_;
};

} // namespace execd

#endif // execd_KERNEL_PYTHON_KERNEL_HPP
