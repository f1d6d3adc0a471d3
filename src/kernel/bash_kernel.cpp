#include <execd/kernel/bash_kernel.hpp>
#include <execd/core/utils.hpp>

namespace execd {

namespace {

const char* kBashDriver = R"SH(
__execd_terminator="$EXECD_CELL_TERMINATOR"
unset EXECD_CELL_TERMINATOR
trap 'true' INT

printf '{"type":"ready","language":"bash","version":"%s"}\n' "$BASH_VERSION" >&3

while true; do
    __execd_code=""
    __execd_complete=0
    while IFS= read -r __execd_line <&4; do
        if [ "$__execd_line" = "$__execd_terminator" ]; then
            __execd_complete=1
            break
        fi
        __execd_code+="$__execd_line"$'\n'
    done
    [ "$__execd_complete" = 1 ] || exit 0

    eval "$__execd_code"
    __execd_status=$?

    if [ "$__execd_status" = 0 ]; then
        printf '{"type":"done","status":"ok","exit_code":0}\n' >&3
    else
        printf '{"type":"done","status":"error","ename":"NonZeroExit","evalue":"exit status %d","traceback":[],"exit_code":%d}\n' \
            "$__execd_status" "$__execd_status" >&3
    fi
done
)SH";

} // anonymous namespace

BashKernel::BashKernel(const std::string& binary)
    : binary_(binary.empty() ? std::string("/bin/bash") : binary)
    , terminator_("__execd_end_" + generate_uuid())
{
}

std::vector<std::string> BashKernel::command_line() const {
    std::vector<std::string> argv;
    argv.push_back(binary_);
    argv.push_back("--noprofile");
    argv.push_back("--norc");
    argv.push_back("-c");
    argv.push_back(kBashDriver);
    return argv;
}

std::map<std::string, std::string> BashKernel::driver_env() const {
    std::map<std::string, std::string> env;
    env["EXECD_CELL_TERMINATOR"] = terminator_;
    return env;
}

std::string BashKernel::encode_request(const std::string& code) const {
    std::string request = code;
    if (request.empty() || request[request.size() - 1] != '\n') {
        request += '\n';
    }
    return request + terminator_ + "\n";
}

std::string BashKernel::shutdown_request() const {
    // Closing fd 4 ends the read loop; nothing to send
    return std::string();
}

} // namespace execd
