#pragma once

#include <string>

/**
 * @file logging.hpp
 * @brief Process-wide log verbosity shared by all model components.
 *
 * Components write informational lines to `std::cout` and warnings to
 * `std::cerr`, prefixed with a bracketed component tag, and consult the
 * helpers below before emitting anything above the quiet level.
 */

namespace terra
{

enum class LogProfile : int
{
    quiet = 0,
    normal = 1,
    debug = 2
};

extern LogProfile global_log_profile;

/**
 * @brief Returns whether current logging level includes the target level.
 * @param level Minimum desired logging level.
 * @return True when logging at the requested level is enabled.
 */
inline bool log_at_least(LogProfile level)
{
    return static_cast<int>(global_log_profile) >= static_cast<int>(level);
}

inline bool log_normal_enabled()
{
    return log_at_least(LogProfile::normal);
}

inline bool log_debug_enabled()
{
    return log_at_least(LogProfile::debug);
}

/**
 * @brief Returns a string label for a log profile.
 */
const char* log_profile_name(LogProfile profile);

/**
 * @brief Parses a log profile string.
 * @param value Input profile string.
 * @param valid Optional parse-success output flag.
 * @return Parsed log profile, or normal when the text is not recognised.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

} // namespace terra
