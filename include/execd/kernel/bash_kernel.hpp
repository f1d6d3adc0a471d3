/*
 * execd C++ - Bash kernel
 *
 * A persistent bash process evaluating each cell with `eval`, so variables,
 * functions and the working directory carry over. A cell ends with a
 * random terminator line; a non-zero status fails it with NonZeroExit.
 */
#ifndef execd_KERNEL_BASH_KERNEL_HPP
#define execd_KERNEL_BASH_KERNEL_HPP

#include "process_kernel.hpp"

namespace execd {

class BashKernel : public ProcessKernel {
public:
    explicit BashKernel(const std::string& binary = "/bin/bash");

    std::string language() const override { return "bash"; }

protected:
    std::vector<std::string> command_line() const override;
    std::map<std::string, std::string> driver_env() const override;
    std::string encode_request(const std::string& code) const override;
    std::string shutdown_request() const override;

private:
    std::string binary_;
    std::string terminator_;
};

} // namespace execd

#endif // execd_KERNEL_BASH_KERNEL_HPP
