#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace gigmap
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Parse "trace", "debug", "info", "warn"/"warning", "error", "critical".
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // "{timestamp} {LEVEL} [{category}] {message}", the line every sink writes.
    static std::string format_entry(const LogEntry& entry);

    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(Args) > 0)
        {
            // Resume after each substitution so "{}" inside an argument stays literal.
            size_t cursor       = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", cursor);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                cursor = pos + text.size();
            };
            (replace_next(std::forward<Args>(args)), ...);
        }
        return result;
    }

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }
    log(level, category, format_message(format, std::forward<Args>(args)...));
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
// Writes to a caller-owned stream; the stream must outlive the sink.
Logger::LogSink stream_sink(std::ostream& out);
Logger::LogSink null_sink();
}   // namespace sinks

#define GIGMAP_LOG_AT(level, category, ...)                                          \
    do                                                                              \
    {                                                                               \
        if (::gigmap::Logger::instance().is_enabled(level))                         \
        {                                                                           \
            ::gigmap::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                           \
    } while (0)

#define GIGMAP_LOG_TRACE(category, ...) GIGMAP_LOG_AT(::gigmap::LogLevel::Trace, category, __VA_ARGS__)
#define GIGMAP_LOG_DEBUG(category, ...) GIGMAP_LOG_AT(::gigmap::LogLevel::Debug, category, __VA_ARGS__)
#define GIGMAP_LOG_INFO(category, ...) GIGMAP_LOG_AT(::gigmap::LogLevel::Info, category, __VA_ARGS__)
#define GIGMAP_LOG_WARN(category, ...) \
    GIGMAP_LOG_AT(::gigmap::LogLevel::Warning, category, __VA_ARGS__)
#define GIGMAP_LOG_ERROR(category, ...) GIGMAP_LOG_AT(::gigmap::LogLevel::Error, category, __VA_ARGS__)
#define GIGMAP_LOG_CRITICAL(category, ...) \
    GIGMAP_LOG_AT(::gigmap::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace gigmap
