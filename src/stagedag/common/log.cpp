/**
 * @file log.cpp
 */
#include "stagedag/common/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <iomanip>

#ifdef _WIN32
#include <io.h>
#define STAGEDAG_ISATTY(fd) _isatty(fd)
#define STAGEDAG_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define STAGEDAG_ISATTY(fd) isatty(fd)
#define STAGEDAG_FILENO(f) fileno(f)
#endif

namespace stagedag
{

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

LogLevel level_from_verbosity(size_t verbosity) noexcept
{
    if (verbosity == 0)
    {
        return LogLevel::Warn;
    }
    if (verbosity == 1)
    {
        return LogLevel::Info;
    }
    return LogLevel::Debug;
}

// ============================================================================
// ConsoleSink
// ============================================================================

namespace
{

bool detect_terminal_colors()
{
    if (!STAGEDAG_ISATTY(STAGEDAG_FILENO(stderr)))
    {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string{term} != "dumb";
}

const char* level_color(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

} // namespace

ConsoleSink::ConsoleSink(bool use_colors)
    : m_colors_enabled(use_colors && detect_terminal_colors())
{
}

void ConsoleSink::write(const LogRecord& record)
{
    std::ostringstream oss;
    if (m_colors_enabled)
    {
        oss << level_color(record.level);
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (m_colors_enabled)
    {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message << "\n";
    std::cerr << oss.str();
}

void ConsoleSink::flush()
{
    std::cerr.flush();
}

// ============================================================================
// MemorySink
// ============================================================================

MemorySink::MemorySink()
    : m_records(std::make_shared<std::vector<LogRecord>>())
{
}

void MemorySink::write(const LogRecord& record)
{
    m_records->push_back(record);
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger()
{
    m_sinks.push_back(std::make_unique<ConsoleSink>(false));
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config)
{
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.m_mutex);

    logger.m_sinks.clear();
    logger.m_level = config.level;
    if (config.console)
    {
        logger.m_sinks.push_back(std::make_unique<ConsoleSink>(config.colors));
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line)
{
    LogRecord record{level, std::string{module}, message, file, line};

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& sink : m_sinks)
    {
        sink->write(record);
    }
    if (level >= LogLevel::Error)
    {
        for (auto& sink : m_sinks)
        {
            sink->flush();
        }
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sinks.clear();
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level = level;
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& sink : m_sinks)
    {
        sink->flush();
    }
}

} // namespace stagedag
