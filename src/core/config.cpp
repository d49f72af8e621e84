#include "ondd/core/config.hpp"
#include "ondd/core/logger.hpp"
#include "ondd/core/utils.hpp"

namespace ondd::core {

using utils::StringUtils;

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_DEBUG("Cannot open configuration file {}", filename);
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = StringUtils::trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value, ignoring '{}'", filename, line_number, line);
            continue;
        }

        values_[key] = StringUtils::trim(line.substr(eq_pos + 1));
    }

    LOG_DEBUG("Loaded {} configuration lines from {}", line_number, filename);
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;

    LOG_WARN("Configuration key {} has non-boolean value '{}'", key, *value);
    return default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["ondd.socket"] = "/var/run/ondd.ctrl";
    values_["ondd.timeout_ms"] = "20000";
    values_["ondd.connect_timeout_ms"] = "5000";
    values_["ondd.connection_mode"] = "per-call";
    values_["ondd.auto_open"] = "true";
    values_["ondd.max_response_bytes"] = "1048576";
    values_["log.level"] = "info";
    values_["log.file"] = "";
}

}
