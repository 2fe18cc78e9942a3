#include <meshgate/core/config.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>
#include <fstream>
#include <iterator>

namespace meshgate {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) return false;

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top-level value must be an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config: parse error: %s", e.what());
        return false;
    }
}

const Json* Config::find(const std::string& key) const {
    const Json* current = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!current->is_object() || !current->contains(parts[i])) {
            LOG_DEBUG("Config: key '%s' not found", key.c_str());
            return NULL;
        }
        current = &(*current)[parts[i]];
    }
    return current;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (v && v->is_string()) {
        return v->get<std::string>();
    }
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (v && v->is_number()) {
        return v->get<int64_t>();
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (v && v->is_boolean()) {
        return v->get<bool>();
    }
    return def;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> result;
    const Json* v = find(key);
    if (!v || !v->is_array()) return result;

    for (size_t i = 0; i < v->size(); ++i) {
        if ((*v)[i].is_string()) {
            result.push_back((*v)[i].get<std::string>());
        }
    }
    return result;
}

bool Config::has(const std::string& key) const {
    return find(key) != NULL;
}

const Json& Config::get_section(const std::string& key) const {
    static const Json null_json;
    const Json* v = find(key);
    return v ? *v : null_json;
}

void Config::set(const std::string& key, const Json& value) {
    Json* current = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& next = (*current)[parts[i]];
        if (!next.is_object()) {
            next = Json::object();
        }
        current = &next;
    }
    if (!parts.empty()) {
        (*current)[parts.back()] = value;
    }
}

const Json& Config::data() const { return data_; }

} // namespace meshgate
