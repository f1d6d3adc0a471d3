#include <execd/gateway/auth.hpp>
#include <execd/core/utils.hpp>

namespace execd {

Authenticator::Authenticator(const std::string& api_key)
    : api_key_(api_key)
{
}

std::string Authenticator::bearer_token(const std::string& header) {
    std::string value = trim(header);
    if (value.size() < 7 || to_lower(value.substr(0, 7)) != "bearer ") {
        return std::string();
    }
    return trim(value.substr(7));
}

OpStatus Authenticator::check(const HttpRequest& request) const {
    if (!enabled()) {
        return OpStatus::ok();
    }
    std::string header = request.header("authorization");
    if (header.empty()) {
        return OpStatus::fail(ErrorCode::Unauthorized, "missing bearer credential");
    }
    std::string token = bearer_token(header);
    if (token.empty() || !secure_equals(token, api_key_)) {
        return OpStatus::fail(ErrorCode::Unauthorized, "invalid bearer credential");
    }
    return OpStatus::ok();
}

} // namespace execd
