#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "../utility/logger.hpp"

namespace cadhistory {

using json = nlohmann::json;

/**
 * @brief Tunables of a history tree.
 */
struct HistoryConfig {
    /** @brief Node count at which add_operation compresses first */
    std::size_t max_nodes = 1000;
    /** @brief Whether add_operation compresses automatically */
    bool auto_compress = true;
    /** @brief Minimum level written by the logger */
    Logger::Level log_level = Logger::INFO_LEVEL;
};

/**
 * @brief Build a configuration from a JSON object.
 *
 * Recognized keys are "max_nodes", "auto_compress" and "log_level". Missing
 * keys keep their defaults and unknown keys are ignored.
 * @throws ConfigError if a value has the wrong type or is out of range
 */
HistoryConfig history_config_from_json(const json &j);

/**
 * @brief Convert a configuration to JSON.
 */
json history_config_to_json(const HistoryConfig &config);

/**
 * @brief Load a configuration file.
 * @param filepath Path to a JSON file
 * @throws IOError if the file cannot be read or parsed
 * @throws ConfigError if a value is invalid
 */
HistoryConfig load_history_config(const std::string &filepath);

/**
 * @brief Apply the configured log level to the process-wide logger.
 */
void configure_logging(const HistoryConfig &config);

} // namespace cadhistory
