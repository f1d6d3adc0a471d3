/*
 * execd C++ - Configuration Implementation
 */
#include <execd/core/config.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

#include <fstream>
#include <sstream>
#include <cstdlib>

namespace execd {

namespace {

struct EnvOverride {
    const char* env;
    const char* key;
    bool numeric;
};

const EnvOverride kEnvOverrides[] = {
    {"EXECD_SANDBOX_ID", "sandbox.id", false},
    {"EXECD_API_KEY", "gateway.api_key", false},
    {"EXECD_PORT", "gateway.port", true},
    {"EXECD_WORKSPACE", "workspace_dir", false},
    {"EXECD_LOG_LEVEL", "log_level", false},
    {"EXECD_EXPIRES_AT", "sandbox.expires_at", true},
    {"EXECD_LIFECYCLE_URL", "lifecycle.url", false},
};

} // anonymous namespace

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "cannot open " + path;
        return false;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return load_string(content.str());
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            last_error_ = "config root must be a JSON object";
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        return false;
    }
}

void Config::apply_env_overrides() {
    for (size_t i = 0; i < sizeof(kEnvOverrides) / sizeof(kEnvOverrides[0]); ++i) {
        const char* value = getenv(kEnvOverrides[i].env);
        if (!value || value[0] == '\0') continue;

        if (kEnvOverrides[i].numeric) {
            int64_t parsed = 0;
            if (!parse_int64(value, parsed)) {
                LOG_WARN("[Config] Ignoring %s=%s (not a number)", kEnvOverrides[i].env, value);
                continue;
            }
            set_int(kEnvOverrides[i].key, parsed);
        } else {
            set_string(kEnvOverrides[i].key, value);
        }
        LOG_DEBUG("[Config] %s overridden from %s", kEnvOverrides[i].key, kEnvOverrides[i].env);
    }
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number_integer()) return std::to_string(v->get<int64_t>());
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        int64_t parsed = 0;
        if (parse_int64(v->get<std::string>(), parsed)) return parsed;
    }
    return default_val;
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number()) return v->get<double>();
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
    }
    return default_val;
}

Json Config::get_object(const std::string& key) const {
    const Json* v = find(key);
    if (!v || !v->is_object()) return Json::object();
    return *v;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace execd
