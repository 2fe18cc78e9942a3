#ifndef MESHGATE_CORE_CONFIG_HPP
#define MESHGATE_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace meshgate {

class Config {
public:
    Config();

    // Load from JSON file
    bool load_file(const std::string& path);

    // Load from JSON string
    bool load_string(const std::string& json_str);

    // Dotted keys walk nested objects ("gateway.discovery.method").
    // A value of the wrong type counts as missing.
    std::string get_string(const std::string& key, const std::string& def = "") const;

    int64_t get_int(const std::string& key, int64_t def = 0) const;

    bool get_bool(const std::string& key, bool def = false) const;

    std::vector<std::string> get_string_list(const std::string& key) const;

    bool has(const std::string& key) const;

    // Get nested object
    const Json& get_section(const std::string& key) const;

    // Overwrite a value, creating intermediate objects
    void set(const std::string& key, const Json& value);

    // Raw data access
    const Json& data() const;

private:
    Json data_;

    const Json* find(const std::string& key) const;
};

} // namespace meshgate

#endif // MESHGATE_CORE_CONFIG_HPP
