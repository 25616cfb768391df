/**
 * @file JsonSaver.hpp
 * @brief JSON configuration saver
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_CONFIG_JSONSAVER_HPP
#define RADARSCOPE_CONFIG_JSONSAVER_HPP

#include "../core/RadarConfig.hpp"
#include <string>

namespace radarscope {

/**
 * @brief JSON configuration file saver
 *
 * Output uses the layout JsonLoader reads, so a saved file loads back
 * into an equivalent configuration.
 */
class JsonSaver {
public:
    /**
     * @brief Save configuration to file
     *
     * @throws std::runtime_error on write error
     */
    static void saveToFile(const RadarConfig& config, const std::string& filepath);

    /**
     * @brief Save configuration to JSON string
     *
     * @param pretty If true, format with indentation
     */
    static std::string saveToString(const RadarConfig& config, bool pretty = true);

private:
    JsonSaver() = delete;

    static std::string escapeString(const std::string& str);
    static std::string indent(int level);
};

} // namespace radarscope

#endif // RADARSCOPE_CONFIG_JSONSAVER_HPP
