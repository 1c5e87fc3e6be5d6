#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <gigmap/argument.hpp>
#include <gigmap/error.hpp>

namespace gigmap
{

namespace
{

bool parse_integer(const std::string& s, long long& out)
{
    if (s.empty())
        return false;
    char* end = nullptr;
    errno     = 0;
    long long val = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE)
        return false;
    out = val;
    return true;
}

bool parse_float(const std::string& s, double& out)
{
    if (s.empty())
        return false;
    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0')
        return false;
    out = val;
    return true;
}

bool matches_type(const ArgValue& value, ArgType type)
{
    switch (type)
    {
        case ArgType::String:
            return std::holds_alternative<std::string>(value);
        case ArgType::Integer:
            return std::holds_alternative<long long>(value);
        case ArgType::Float:
            return std::holds_alternative<double>(value)
                   || std::holds_alternative<long long>(value);
    }
    return false;
}

}   // namespace

// --- Argument ---

Argument::Argument(std::string             key,
                   std::string             description,
                   ArgType                 type,
                   std::optional<ArgValue> default_value)
    : key_(std::move(key)),
      description_(std::move(description)),
      type_(type),
      default_(std::move(default_value))
{
    if (key_.empty())
    {
        throw ConfigError("argument key must not be empty");
    }
    for (char c : key_)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            throw ConfigError("argument key cannot contain whitespace: '" + key_ + "'");
        }
    }
    if (default_ && !matches_type(*default_, type_))
    {
        throw ConfigError("default for '" + key_ + "' is not of type " + arg_type_name(type_));
    }
    // Integer defaults for float arguments are stored as floats.
    if (default_ && type_ == ArgType::Float && std::holds_alternative<long long>(*default_))
    {
        default_ = static_cast<double>(std::get<long long>(*default_));
    }
}

ArgValue Argument::parse(std::string_view raw, std::string_view boundary_key) const
{
    std::string text(raw);
    switch (type_)
    {
        case ArgType::String:
            return text;
        case ArgType::Integer:
        {
            long long v = 0;
            if (!parse_integer(text, v))
            {
                throw ConfigError("argument --" + std::string(boundary_key)
                                  + ": expected an integer, got '" + text + "'");
            }
            return v;
        }
        case ArgType::Float:
        {
            double v = 0.0;
            if (!parse_float(text, v))
            {
                throw ConfigError("argument --" + std::string(boundary_key)
                                  + ": expected a number, got '" + text + "'");
            }
            return v;
        }
    }
    return text;
}

const char* arg_type_name(ArgType type)
{
    switch (type)
    {
        case ArgType::String:
            return "string";
        case ArgType::Integer:
            return "integer";
        case ArgType::Float:
            return "float";
    }
    return "unknown";
}

std::string arg_value_to_string(const ArgValue& value)
{
    if (const auto* s = std::get_if<std::string>(&value))
        return *s;
    if (const auto* i = std::get_if<long long>(&value))
        return std::to_string(*i);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", std::get<double>(value));
    return buf;
}

// --- ParamMap ---

void ParamMap::set(const std::string& key, ArgValue value)
{
    values_[key] = std::move(value);
}

bool ParamMap::has(const std::string& key) const
{
    return values_.count(key) > 0;
}

std::optional<std::string> ParamMap::get_string(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second))
        return *s;
    throw ConfigError("parameter '" + key + "' is not a string");
}

std::optional<long long> ParamMap::get_int(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    if (const auto* i = std::get_if<long long>(&it->second))
        return *i;
    throw ConfigError("parameter '" + key + "' is not an integer");
}

std::optional<double> ParamMap::get_double(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    if (const auto* d = std::get_if<double>(&it->second))
        return *d;
    if (const auto* i = std::get_if<long long>(&it->second))
        return static_cast<double>(*i);
    throw ConfigError("parameter '" + key + "' is not a number");
}

}   // namespace gigmap
