module;

#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

module Core.Logging;

namespace Core::Log
{
    namespace
    {
        // Global lock to prevent scrambled output from multiple threads
        std::mutex s_LogMutex;
        Sink s_Sink;
        Level s_MinLevel = Level::Debug;

        void PrintColored(Level level, std::string_view msg)
        {
            // ANSI Color Codes
            const char* color = "\033[0m";
            const char* label = "[INFO]";

            switch (level) {
            case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
            case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
            case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
            case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
            }

            // Diagnostics go to stderr so that tools can stream documents on stdout.
            std::cerr << color << label << msg << "\033[0m" << std::endl;
        }
    }

    void SetSink(Sink sink)
    {
        std::lock_guard lock(s_LogMutex);
        s_Sink = std::move(sink);
    }

    void ResetSink()
    {
        std::lock_guard lock(s_LogMutex);
        s_Sink = nullptr;
    }

    void SetLevel(Level minimum)
    {
        std::lock_guard lock(s_LogMutex);
        s_MinLevel = minimum;
    }

    Level GetLevel()
    {
        std::lock_guard lock(s_LogMutex);
        return s_MinLevel;
    }

    void Write(Level level, std::string_view msg)
    {
        std::lock_guard lock(s_LogMutex);
        if (level < s_MinLevel)
            return;

        if (s_Sink)
            s_Sink(level, msg);
        else
            PrintColored(level, msg);
    }
}
