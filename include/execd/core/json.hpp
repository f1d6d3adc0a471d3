/*
 * execd C++ - JSON type
 *
 * All wire payloads and the config file go through nlohmann::json.
 */
#ifndef execd_CORE_JSON_HPP
#define execd_CORE_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace execd {

typedef nlohmann::json Json;

// Serialize without throwing on invalid UTF-8 (process output is arbitrary bytes)
inline std::string json_dump(const Json& j) {
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace execd

#endif // execd_CORE_JSON_HPP
