#include "presence/core/Log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>

namespace presence::core
{
namespace
{
std::string TimestampNow()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &nowTime);
#else
    localtime_r(&nowTime, &localTm);
#endif
    char timeBuffer[64]{};
    std::strftime(timeBuffer, sizeof(timeBuffer), "%Y-%m-%d %H:%M:%S", &localTm);
    return timeBuffer;
}

const char* LevelText(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:
        default: return "off";
    }
}
} // namespace

Log::~Log()
{
    CloseFile();
}

bool Log::OpenFile(const std::string& path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open())
    {
        m_file.close();
    }

    const std::filesystem::path filePath(path);
    std::error_code error;
    if (filePath.has_parent_path())
    {
        std::filesystem::create_directories(filePath.parent_path(), error);
    }

    m_file.open(filePath, std::ios::out | std::ios::app);
    if (!m_file.is_open())
    {
        std::cerr << "[Log] Cannot open log file: " << path << "\n";
        return false;
    }

    AppendFileLine("=== Session start ===");
    return true;
}

void Log::CloseFile()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open())
    {
        AppendFileLine("=== Session end ===");
        m_file.close();
    }
}

void Log::SetLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level = level;
}

void Log::SetConsoleEnabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consoleEnabled = enabled;
}

LogLevel Log::Level() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_level;
}

void Log::Write(LogLevel level, std::string_view tag, std::string_view text)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level || level == LogLevel::Off)
    {
        return;
    }

    std::string line;
    line.reserve(tag.size() + text.size() + 4);
    line += "[";
    line += tag;
    line += "] ";
    line += text;

    if (m_consoleEnabled)
    {
        std::ostream& stream = level >= LogLevel::Warning ? std::cerr : std::cout;
        stream << line << "\n";
    }

    if (m_file.is_open())
    {
        AppendFileLine(std::string(LevelText(level)) + " " + line);
    }
}

void Log::AppendFileLine(std::string_view line)
{
    m_file << "[" << TimestampNow() << "] " << line << "\n";
    m_file.flush();
}

LogLevel Log::ParseLevel(const std::string& text, LogLevel fallback)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug")
    {
        return LogLevel::Debug;
    }
    if (lower == "info")
    {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning")
    {
        return LogLevel::Warning;
    }
    if (lower == "error")
    {
        return LogLevel::Error;
    }
    if (lower == "off")
    {
        return LogLevel::Off;
    }
    return fallback;
}
} // namespace presence::core
