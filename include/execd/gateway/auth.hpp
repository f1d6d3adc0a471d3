/*
 * execd C++ - Bearer authentication
 */
#ifndef execd_GATEWAY_AUTH_HPP
#define execd_GATEWAY_AUTH_HPP

#include "http_server.hpp"
#include <execd/core/errors.hpp>
#include <string>

namespace execd {

class Authenticator {
public:
    // An empty key disables authentication
    explicit Authenticator(const std::string& api_key);

    bool enabled() const { return !api_key_.empty(); }

    // Checks `Authorization: Bearer <key>` in constant time
    OpStatus check(const HttpRequest& request) const;

    // Token from an Authorization header value; empty if not a bearer credential
    static std::string bearer_token(const std::string& header);

private:
    std::string api_key_;
};

} // namespace execd

#endif // execd_GATEWAY_AUTH_HPP
