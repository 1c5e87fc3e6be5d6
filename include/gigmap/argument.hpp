#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gigmap
{

enum class ArgType
{
    String,
    Integer,
    Float,
};

using ArgValue = std::variant<std::string, long long, double>;

// Boundary key -> raw value, exactly as delivered by the parameter source.
using RawParams = std::map<std::string, std::string>;

// A typed, described, optionally-defaulted input. Immutable once built.
class Argument
{
   public:
    // Throws ConfigError if the key is empty or contains whitespace, or if
    // the default does not match the declared type.
    Argument(std::string             key,
             std::string             description,
             ArgType                 type          = ArgType::String,
             std::optional<ArgValue> default_value = std::nullopt);

    const std::string&             key() const { return key_; }
    const std::string&             description() const { return description_; }
    ArgType                        type() const { return type_; }
    const std::optional<ArgValue>& default_value() const { return default_; }

    // Convert a raw boundary value to the declared type.
    // `boundary_key` is only used for the error message.
    ArgValue parse(std::string_view raw, std::string_view boundary_key) const;

   private:
    std::string             key_;
    std::string             description_;
    ArgType                 type_;
    std::optional<ArgValue> default_;
};

const char* arg_type_name(ArgType type);
std::string arg_value_to_string(const ArgValue& value);

// Resolved values for one namespace ("global" or an element id).
class ParamMap
{
   public:
    void set(const std::string& key, ArgValue value);
    bool has(const std::string& key) const;

    // Typed lookups return nullopt for keys without a value and throw
    // ConfigError when the stored value has a different type.
    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<long long>   get_int(const std::string& key) const;
    std::optional<double>      get_double(const std::string& key) const;

    const std::map<std::string, ArgValue>& values() const { return values_; }
    size_t                                 size() const { return values_.size(); }
    bool                                   empty() const { return values_.empty(); }

   private:
    std::map<std::string, ArgValue> values_;
};

}   // namespace gigmap
