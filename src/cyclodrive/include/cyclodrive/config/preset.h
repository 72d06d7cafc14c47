/**
 * @file preset.h
 * @brief JSON presets for gearbox parameters
 */

#ifndef CYCLODRIVE_PRESET_H
#define CYCLODRIVE_PRESET_H

#include "cyclodrive/core/parameters.h"
#include <nlohmann/json.hpp>
#include <string>

namespace cyclodrive {

    /**
     * @class Preset
     * @brief Parameters plus the phase they were saved at
     */
    class Preset {
    public:
        ParameterValues values;
        double phase = 0.0;
    };

    // Keys are the snake_case parameter names; a missing key keeps its default.
    void to_json(nlohmann::json& j, const ParameterValues& values);
    void from_json(const nlohmann::json& j, ParameterValues& values);

    /**
     * @brief Parse a preset document
     * @throws cyclodrive::ConfigError on malformed JSON or mistyped values
     */
    Preset parse_preset(const std::string& contents);

    /**
     * @brief Load a preset file
     * @throws cyclodrive::FileIOError if the file cannot be read
     * @throws cyclodrive::ConfigError if it does not parse
     */
    Preset load_preset(const std::string& path);

    /**
     * @brief Write a preset file (pretty printed)
     * @throws cyclodrive::FileIOError if the file cannot be written
     */
    void save_preset(const std::string& path, const Preset& preset);

} // namespace cyclodrive

#endif // CYCLODRIVE_PRESET_H
