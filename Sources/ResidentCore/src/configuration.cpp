#include "resident/configuration.hpp"
#include "resident/errors.hpp"
#include <nlohmann/json.hpp>

namespace resident {

using json = nlohmann::json;

std::optional<log_level> log_level_from_string(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    return std::nullopt;
}

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

configuration configuration::from_json(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        LOG_ERROR("configuration", "Failed to parse configuration: %s", e.what());
        throw config_error(std::string("Failed to parse configuration: ") + e.what());
    }

    if (!j.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    configuration config;

    if (j.contains("clear_leaks")) {
        if (!j["clear_leaks"].is_boolean()) {
            throw config_error("clear_leaks must be a boolean");
        }
        config.clear_leaks = j["clear_leaks"].get<bool>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            throw config_error("log_level must be a string");
        }
        auto name = j["log_level"].get<std::string>();
        auto level = log_level_from_string(name);
        if (!level) {
            throw config_error("Unknown log_level '" + name + "'");
        }
        config.verbosity = *level;
    }

    return config;
}

} // namespace resident
