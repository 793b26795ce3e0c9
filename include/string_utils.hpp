#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by config parsing and summaries.
 *
 * Provides case normalization, trimming, boolean parsing, and the
 * number/list formatting used by the model summary. Functions are
 * header-inline because they are small and reused across modules.
 */

namespace terra
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy with leading and trailing whitespace removed.
 */
inline std::string trim_copy(std::string_view value)
{
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    const auto first = std::find_if(value.begin(), value.end(), not_space);
    const auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (first >= last)
    {
        return std::string();
    }
    return std::string(first, last);
}

/**
 * @brief Removes one pair of matching single or double quotes.
 */
inline std::string strip_wrapping_quotes(std::string_view value)
{
    if (value.size() >= 2)
    {
        const char front = value.front();
        const char back = value.back();
        if ((front == '"' && back == '"') || (front == '\'' && back == '\''))
        {
            return std::string(value.substr(1, value.size() - 2));
        }
    }
    return std::string(value);
}

/**
 * @brief Parses boolean spellings.
 * @param value Input string view.
 * @param out Parsed value.
 * @return True when the text is one of 1/0, true/false, yes/no, on/off.
 */
inline bool try_parse_bool(std::string_view value, bool& out)
{
    const std::string normalized = lower_copy(trim_copy(value));
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on")
    {
        out = true;
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off")
    {
        out = false;
        return true;
    }
    return false;
}

/**
 * @brief Formats a double as its shortest round-trip decimal text.
 *
 * Integral values keep a trailing ".0", so 1000 prints as "1000.0".
 */
inline std::string format_float(double value)
{
    if (std::isnan(value))
    {
        return "nan";
    }
    if (std::isinf(value))
    {
        return value > 0.0 ? "inf" : "-inf";
    }

    // Shortest significand that survives a round trip through strtod.
    char buffer[64];
    int digits = 17;
    for (int precision = 1; precision <= 17; ++precision)
    {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, value);
        if (std::strtod(buffer, nullptr) == value)
        {
            digits = precision;
            break;
        }
    }

    const std::string scientific(buffer);
    const int exponent = std::atoi(scientific.c_str() + scientific.find('e') + 1);
    if (exponent < -4 || exponent >= 16)
    {
        return scientific;
    }

    const int decimals = std::max(digits - 1 - exponent, 0);
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    std::string out(buffer);
    if (out.find('.') == std::string::npos)
    {
        out += ".0";
    }
    return out;
}

/**
 * @brief Formats names as a bracketed, single-quoted list: ['a', 'b'].
 */
inline std::string format_name_list(const std::vector<std::string>& names)
{
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
        {
            oss << ", ";
        }
        oss << "'" << names[i] << "'";
    }
    oss << "]";
    return oss.str();
}

} // namespace strutil
} // namespace terra
