#pragma once

#include <chartkit/format.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace chartkit
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

// Process-wide logger. Geometry functions report their edge-case fallbacks
// at Debug under the "chartkit.*" categories; with no sinks installed the
// messages are dropped after the level check.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Replace each "{}" in format, left to right, with the next argument.
    // Surplus placeholders are left untouched.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(Args) > 0)
        {
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
        else if constexpr (std::is_floating_point_v<D>)
            return format_number(static_cast<double>(v));
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
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", format_message("Format error: {}", e.what()));
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
// Appends every entry to a shared buffer; used by tests and tooling that
// want to inspect what the library reported.
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> buffer);
}   // namespace sinks

#define CHARTKIT_LOG_AT(lvl, category, ...)                                                \
    do                                                                                     \
    {                                                                                      \
        if (::chartkit::Logger::instance().is_enabled(lvl))                                \
        {                                                                                  \
            ::chartkit::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);      \
        }                                                                                  \
    } while (0)

#define CHARTKIT_LOG_TRACE(category, ...) \
    CHARTKIT_LOG_AT(::chartkit::LogLevel::Trace, category, __VA_ARGS__)
#define CHARTKIT_LOG_DEBUG(category, ...) \
    CHARTKIT_LOG_AT(::chartkit::LogLevel::Debug, category, __VA_ARGS__)
#define CHARTKIT_LOG_INFO(category, ...) \
    CHARTKIT_LOG_AT(::chartkit::LogLevel::Info, category, __VA_ARGS__)
#define CHARTKIT_LOG_WARN(category, ...) \
    CHARTKIT_LOG_AT(::chartkit::LogLevel::Warning, category, __VA_ARGS__)
#define CHARTKIT_LOG_ERROR(category, ...) \
    CHARTKIT_LOG_AT(::chartkit::LogLevel::Error, category, __VA_ARGS__)
#define CHARTKIT_LOG_CRITICAL(category, ...) \
    CHARTKIT_LOG_AT(::chartkit::LogLevel::Critical, category, __VA_ARGS__)

#define CHARTKIT_LOG_DEBUG_HERE(category, ...) \
    CHARTKIT_LOG_DEBUG(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define CHARTKIT_LOG_WARN_HERE(category, ...) \
    CHARTKIT_LOG_WARN(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

}   // namespace chartkit
