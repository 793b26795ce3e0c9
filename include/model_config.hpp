#pragma once

#include <string>
#include <unordered_map>

#include "evaluation.hpp"
#include "logging.hpp"

/**
 * @file model_config.hpp
 * @brief Configuration of logging and default evaluation behaviour.
 *
 * Settings are read from a simple indented YAML file into dotted keys
 * (`evaluation.lateral_method`). Unrecognised values are reported on
 * `std::cerr` and leave the default in place.
 *
 * Recognised keys:
 *   logging.profile             quiet | normal | debug
 *   evaluation.lateral_method   nearest | triangle
 *   evaluation.radial_boundary  clamp | extrapolate
 *   evaluation.depth            boolean
 */

namespace terra
{

struct ModelConfig
{
    LogProfile log_profile = LogProfile::normal;
    EvaluationOptions evaluation{};
};

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Map of dotted section keys to raw values; empty if the file cannot be read.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Builds a configuration from parsed key-value pairs.
 */
ModelConfig model_config_from_map(const std::unordered_map<std::string, std::string>& values);

/**
 * @brief Loads configuration from disk and applies its log profile globally.
 * @param config_path Path to configuration file.
 * @return Parsed configuration.
 */
ModelConfig load_model_config(const std::string& config_path);

} // namespace terra
