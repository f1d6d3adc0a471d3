/*
 * execd C++ - Configuration
 *
 * JSON config file with dotted-key lookups ("gateway.port") and
 * environment overrides injected by the orchestration layer.
 */
#ifndef execd_CORE_CONFIG_HPP
#define execd_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace execd {

class Config {
public:
    Config();

    // Load a JSON file. Returns false if the file is missing or malformed;
    // the previous contents are kept in that case.
    bool load_file(const std::string& path);

    // Parse config from a JSON string (used by tests)
    bool load_string(const std::string& text);

    // Apply EXECD_* environment variables on top of the loaded values
    void apply_env_overrides();

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    double get_double(const std::string& key, double default_val = 0.0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    Json get_object(const std::string& key) const;

    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& raw() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    Json data_;
    std::string last_error_;

    // Walk a dotted key; returns nullptr if any segment is missing
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);
};

} // namespace execd

#endif // execd_CORE_CONFIG_HPP
