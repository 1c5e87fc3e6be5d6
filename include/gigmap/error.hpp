#pragma once

#include <stdexcept>
#include <string>

namespace gigmap
{

// Invalid composition or parameters: duplicate element ids, colliding
// argument keys, unrecognized arguments. Raised before any data is read.
class ConfigError : public std::runtime_error
{
   public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Missing required input or malformed data (absent column, non-numeric
// value, too few members). The message names the offending file/column.
class DataError : public std::runtime_error
{
   public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

}   // namespace gigmap
