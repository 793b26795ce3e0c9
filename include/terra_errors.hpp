#pragma once

#include <stdexcept>
#include <string>

/**
 * @file terra_errors.hpp
 * @brief Exception types raised by the model container.
 *
 * All errors are raised synchronously at the point where a precondition
 * is violated. Malformed grid input and malformed `new_field` arguments
 * use plain `std::invalid_argument`.
 */

namespace terra
{

/**
 * @brief Field name is not present in the field taxonomy.
 */
class FieldNameError : public std::invalid_argument
{
public:
    explicit FieldNameError(const std::string& field_name)
        : std::invalid_argument("Field name '" + field_name + "' is not a valid field name"),
          field_name_(field_name)
    {
    }

    const std::string& field_name() const { return field_name_; }

private:
    std::string field_name_;
};

/**
 * @brief Field array shape disagrees with the grid or the expected component count.
 */
class FieldDimensionError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Valid field name with no backing data on this model.
 */
class NoFieldError : public std::runtime_error
{
public:
    explicit NoFieldError(const std::string& field_name)
        : std::runtime_error("Model does not contain field '" + field_name + "'"),
          field_name_(field_name)
    {
    }

    const std::string& field_name() const { return field_name_; }

private:
    std::string field_name_;
};

/**
 * @brief Lookup key missing from the field/variable name tables.
 */
class UnknownFieldError : public std::out_of_range
{
public:
    using std::out_of_range::out_of_range;
};

} // namespace terra
