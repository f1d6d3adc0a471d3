/*
 * execd C++ - HTTP Client (libcurl)
 *
 * Blocking client used to talk to the orchestration API. One curl easy
 * handle per request, so an HttpClient may be shared between threads.
 */
#ifndef execd_CORE_HTTP_CLIENT_HPP
#define execd_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>

namespace execd {

struct HttpResponse {
    long status_code;
    std::string body;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string error;                           // transport error, empty on success

    HttpResponse() : status_code(0) {}

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    // Parse body as JSON; returns a null Json if the body is not valid JSON
    Json json() const;
};

class HttpClient {
public:
    HttpClient();

    void set_timeout(long seconds) { timeout_seconds_ = seconds; }
    void set_connect_timeout(long seconds) { connect_timeout_seconds_ = seconds; }

    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

    HttpResponse post_json(const std::string& url, const Json& body,
                           const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

    HttpResponse del(const std::string& url,
                     const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

    // Generic request; `body` is sent as-is when non-empty
    HttpResponse request(const std::string& method, const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers);

    // Global libcurl setup/teardown, once per process
    static void global_init();
    static void global_cleanup();

private:
    long timeout_seconds_;
    long connect_timeout_seconds_;
};

} // namespace execd

#endif // execd_CORE_HTTP_CLIENT_HPP
