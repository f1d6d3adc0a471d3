/*
 * execd C++ - Error taxonomy
 *
 * Component APIs report failures through OpResult / OpStatus values carrying
 * one of these codes. The gateway maps them to HTTP statuses and to the
 * {"code","message"} wire body.
 */
#ifndef execd_CORE_ERRORS_HPP
#define execd_CORE_ERRORS_HPP

#include <string>

namespace execd {

enum class ErrorCode {
    None = 0,
    ValidationError,
    Unauthorized,
    NotFound,
    PermissionDenied,
    Timeout,
    Cancelled,
    KernelCrashed,
    ExecutionFailed,
    Conflict,
    InternalError
};

const char* error_code_name(ErrorCode code);
int error_code_http_status(ErrorCode code);

// Status-only result
struct OpStatus {
    bool success;
    ErrorCode code;
    std::string error;

    OpStatus() : success(true), code(ErrorCode::None) {}

    static OpStatus ok() {
        return OpStatus();
    }

    static OpStatus fail(ErrorCode c, const std::string& err) {
        OpStatus r;
        r.success = false;
        r.code = c;
        r.error = err;
        return r;
    }
};

// Result carrying a value on success
template <typename T>
struct OpResult {
    bool success;
    T value;
    ErrorCode code;
    std::string error;

    OpResult() : success(false), value(), code(ErrorCode::InternalError) {}

    static OpResult ok(const T& v) {
        OpResult r;
        r.success = true;
        r.value = v;
        r.code = ErrorCode::None;
        return r;
    }

    static OpResult fail(ErrorCode c, const std::string& err) {
        OpResult r;
        r.success = false;
        r.code = c;
        r.error = err;
        return r;
    }

    static OpResult fail(const OpStatus& status) {
        return fail(status.code, status.error);
    }
};

} // namespace execd

#endif // execd_CORE_ERRORS_HPP
