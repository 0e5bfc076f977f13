module;
#include <cstdint>
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core.Logging;

export namespace Core::Log
{
    enum class Level : uint8_t
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // A sink receives every message that passes the level filter.
    using Sink = std::function<void(Level, std::string_view)>;

    void SetSink(Sink sink);
    void ResetSink();

    void SetLevel(Level minimum);
    [[nodiscard]] Level GetLevel();

    void Write(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
