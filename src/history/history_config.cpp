#include "history_config.hpp"

#include <fstream>

#include "../utility/exceptions.hpp"

namespace cadhistory {

namespace {

const char *level_name(Logger::Level level) {
    switch (level) {
    case Logger::DEBUG_LEVEL:
        return "debug";
    case Logger::WARN_LEVEL:
        return "warn";
    case Logger::ERROR_LEVEL:
        return "error";
    case Logger::INFO_LEVEL:
    default:
        return "info";
    }
}

} // namespace

HistoryConfig history_config_from_json(const json &j) {
    if (!j.is_object()) {
        throw ConfigError("expected a JSON object");
    }

    HistoryConfig config;

    if (j.contains("max_nodes")) {
        const auto &value = j["max_nodes"];
        if (!value.is_number_integer() || value.get<long long>() <= 0) {
            throw ConfigError("max_nodes must be a positive integer");
        }
        config.max_nodes = static_cast<std::size_t>(value.get<long long>());
    }

    if (j.contains("auto_compress")) {
        const auto &value = j["auto_compress"];
        if (!value.is_boolean()) {
            throw ConfigError("auto_compress must be a boolean");
        }
        config.auto_compress = value.get<bool>();
    }

    if (j.contains("log_level")) {
        const auto &value = j["log_level"];
        if (!value.is_string() ||
            !Logger::parse_level(value.get<std::string>(), config.log_level)) {
            throw ConfigError("log_level must be one of debug, info, warn, "
                              "error");
        }
    }

    return config;
}

json history_config_to_json(const HistoryConfig &config) {
    return json{{"max_nodes", config.max_nodes},
                {"auto_compress", config.auto_compress},
                {"log_level", level_name(config.log_level)}};
}

HistoryConfig load_history_config(const std::string &filepath) {
    LOG_INFO("Loading history configuration from: {}", filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for reading: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: {}", e.what());
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }

    return history_config_from_json(j);
}

void configure_logging(const HistoryConfig &config) {
    Logger::set_level(config.log_level);
}

} // namespace cadhistory
