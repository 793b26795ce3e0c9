/**
 * @file model_config.cpp
 * @brief YAML-style configuration loading for the model library.
 */

#include "model_config.hpp"
#include "string_utils.hpp"

#include <fstream>
#include <iostream>
#include <vector>

namespace terra
{
namespace
{

void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "[config] Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping default value." << std::endl;
}

} // namespace

/**
 * @brief Parses a YAML file.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::unordered_map<std::string, std::string> config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "[config] Could not open config file: " << filename << std::endl;
        return config;
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        const size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;
        const size_t indent_level = indent / 2;

        const std::string trimmed = strutil::trim_copy(line);
        if (trimmed.empty()) continue;

        while (section_stack.size() > indent_level)
        {
            section_stack.pop_back();
        }

        if (trimmed.back() == ':')
        {
            const std::string section_name = strutil::trim_copy(trimmed.substr(0, trimmed.size() - 1));
            section_stack.push_back(section_name);
            continue;
        }

        const size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos)
        {
            continue;
        }

        const std::string key = strutil::trim_copy(trimmed.substr(0, colon_pos));
        const std::string value = strutil::strip_wrapping_quotes(strutil::trim_copy(trimmed.substr(colon_pos + 1)));

        std::string full_key;
        for (const auto& section : section_stack)
        {
            full_key += section;
            full_key += ".";
        }
        full_key += key;
        config[full_key] = value;
    }

    return config;
}

ModelConfig model_config_from_map(const std::unordered_map<std::string, std::string>& values)
{
    ModelConfig config;

    auto it = values.find("logging.profile");
    if (it != values.end())
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(it->second, &valid);
        if (valid)
        {
            config.log_profile = parsed;
        }
        else
        {
            warn_invalid_config_value(it->first, it->second, "quiet, normal or debug");
        }
    }

    it = values.find("evaluation.lateral_method");
    if (it != values.end() && !parse_lateral_method(it->second, config.evaluation.lateral))
    {
        warn_invalid_config_value(it->first, it->second, "nearest or triangle");
    }

    it = values.find("evaluation.radial_boundary");
    if (it != values.end() && !parse_radial_boundary(it->second, config.evaluation.radial_boundary))
    {
        warn_invalid_config_value(it->first, it->second, "clamp or extrapolate");
    }

    it = values.find("evaluation.depth");
    if (it != values.end() && !strutil::try_parse_bool(it->second, config.evaluation.depth))
    {
        warn_invalid_config_value(it->first, it->second, "a boolean");
    }

    return config;
}

/**
 * @brief Loads the configuration from a YAML file.
 */
ModelConfig load_model_config(const std::string& config_path)
{
    const ModelConfig config = model_config_from_map(parse_yaml_simple(config_path));
    global_log_profile = config.log_profile;

    if (log_normal_enabled())
    {
        std::cout << "[config] loaded " << config_path
                  << " (logging=" << log_profile_name(config.log_profile)
                  << ", lateral=" << to_string(config.evaluation.lateral)
                  << ", radial_boundary=" << to_string(config.evaluation.radial_boundary)
                  << ", depth=" << (config.evaluation.depth ? "true" : "false") << ")" << std::endl;
    }
    return config;
}

} // namespace terra
