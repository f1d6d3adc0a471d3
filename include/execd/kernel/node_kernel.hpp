/*
 * execd C++ - JavaScript kernel
 *
 * node running an embedded driver that evaluates each cell with
 * vm.runInThisContext, so top-level bindings persist between cells.
 * Promises returned by a cell are awaited before the result is reported.
 */
#ifndef execd_KERNEL_NODE_KERNEL_HPP
#define execd_KERNEL_NODE_KERNEL_HPP

#include "process_kernel.hpp"

namespace execd {

class NodeKernel : public ProcessKernel {
public:
    explicit NodeKernel(const std::string& binary = "node");

    std::string language() const override { return "javascript"; }

protected:
    std::vector<std::string> command_line() const override;

private:
    std::string binary_;
};

} // namespace execd

#endif // execd_KERNEL_NODE_KERNEL_HPP
