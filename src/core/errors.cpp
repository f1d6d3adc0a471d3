#include <execd/core/errors.hpp>

namespace execd {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::KernelCrashed: return "KernelCrashed";
        case ErrorCode::ExecutionFailed: return "ExecutionFailed";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::InternalError: return "InternalError";
    }
    return "InternalError";
}

int error_code_http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return 200;
        case ErrorCode::ValidationError: return 400;
        case ErrorCode::Unauthorized: return 401;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::PermissionDenied: return 403;
        case ErrorCode::Timeout: return 504;
        case ErrorCode::Cancelled: return 409;
        case ErrorCode::KernelCrashed: return 500;
        // A failed execution is a normal terminal state, not a protocol error
        case ErrorCode::ExecutionFailed: return 200;
        case ErrorCode::Conflict: return 409;
        case ErrorCode::InternalError: return 500;
    }
    return 500;
}

} // namespace execd
