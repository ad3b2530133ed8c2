#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace presence::core
{
enum class LogLevel
{
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

class Log
{
public:
    static Log& Instance()
    {
        static Log s_instance;
        return s_instance;
    }

    bool OpenFile(const std::string& path);
    void CloseFile();

    void SetLevel(LogLevel level);
    void SetConsoleEnabled(bool enabled);
    [[nodiscard]] LogLevel Level() const;

    void Write(LogLevel level, std::string_view tag, std::string_view text);

    static void Debug(std::string_view tag, std::string_view text) { Instance().Write(LogLevel::Debug, tag, text); }
    static void Info(std::string_view tag, std::string_view text) { Instance().Write(LogLevel::Info, tag, text); }
    static void Warn(std::string_view tag, std::string_view text) { Instance().Write(LogLevel::Warning, tag, text); }
    static void Error(std::string_view tag, std::string_view text) { Instance().Write(LogLevel::Error, tag, text); }

    [[nodiscard]] static LogLevel ParseLevel(const std::string& text, LogLevel fallback);

private:
    Log() = default;
    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    void AppendFileLine(std::string_view line);

    mutable std::mutex m_mutex;
    std::ofstream m_file;
    LogLevel m_level = LogLevel::Info;
    bool m_consoleEnabled = true;
};
} // namespace presence::core
