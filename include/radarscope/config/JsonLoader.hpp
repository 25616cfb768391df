/**
 * @file JsonLoader.hpp
 * @brief JSON configuration loader
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_CONFIG_JSONLOADER_HPP
#define RADARSCOPE_CONFIG_JSONLOADER_HPP

#include "../core/RadarConfig.hpp"
#include <string>

namespace radarscope {

/**
 * @brief JSON configuration file loader
 *
 * Loads RadarConfig from JSON files or strings. Missing sections and keys
 * keep their defaults. Uses a small built-in JSON parser.
 */
class JsonLoader {
public:
    /**
     * @brief Load configuration from file
     *
     * @param filepath Path to JSON file
     * @return Parsed RadarConfig
     * @throws std::runtime_error on I/O or parse error, or an invalid result
     * @throws std::invalid_argument on an unknown scanner name
     */
    static RadarConfig loadFromFile(const std::string& filepath);

    /**
     * @brief Load configuration from JSON string
     *
     * @param jsonString JSON configuration string
     * @return Parsed RadarConfig
     * @throws std::runtime_error on parse error or an invalid result
     * @throws std::invalid_argument on an unknown scanner name
     */
    static RadarConfig loadFromString(const std::string& jsonString);

private:
    JsonLoader() = delete;
};

} // namespace radarscope

#endif // RADARSCOPE_CONFIG_JSONLOADER_HPP
