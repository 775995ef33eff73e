/**
 * @file log.hpp
 * @brief Process-wide logger with module-tagged records and pluggable sinks.
 *
 * @details
 * Usage:
 * @code
 * STAGEDAG_LOG_INFO("eval", "Resolved " << count << " keys");
 * STAGEDAG_LOG_DEBUG("graph", "Adding node " << idx);
 * @endcode
 *
 * The message expression is only evaluated when the record passes the level
 * check.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include <mutex>
#include <string_view>

namespace stagedag
{

/**
 * @brief Log severity levels in ascending order.
 */
enum class LogLevel : int
{
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,  ///< Internal defects; the pass is abandoned right after.
    Off = 6
};

/// Returns the upper-case name of a level, e.g. "WARN".
const char* level_name(LogLevel level) noexcept;

/**
 * @brief A single log message with its metadata.
 */
struct LogRecord
{
    LogLevel level;
    std::string module;
    std::string message;
    const char* file;
    int line;
};

/**
 * @brief Destination for log records.
 */
class LogSink
{
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/**
 * @brief Writes records to stderr, optionally with ANSI colors.
 */
class ConsoleSink : public LogSink
{
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_colors_enabled;
};

/**
 * @brief Keeps every record in memory.
 *
 * @details
 * Used by tests and by callers that want to inspect what a pass reported.
 * The records are shared with the creator through `records()`, so the sink
 * can be handed over to the Logger while the caller keeps observing it.
 */
class MemorySink : public LogSink
{
public:
    MemorySink();

    void write(const LogRecord& record) override;
    void flush() override {}

    /// Shared view of the captured records.
    std::shared_ptr<const std::vector<LogRecord>> records() const noexcept
    {
        return m_records;
    }

private:
    std::shared_ptr<std::vector<LogRecord>> m_records;
};

/**
 * @brief Configuration for logger initialization.
 */
struct LogConfig
{
    LogLevel level = LogLevel::Warn;
    bool console = true;
    bool colors = true;
};

/**
 * @brief The process-wide logger.
 *
 * @details
 * Until `init()` is called the logger writes Warn and above to a console
 * sink without colors.
 *
 * @par Thread safety
 * - Sinks are guarded by an internal mutex.
 * - The level check is a plain read; set the level before starting work.
 */
class Logger
{
public:
    /// Reset sinks and level from @p config.
    static void init(const LogConfig& config);

    static Logger& instance();

    bool should_log(LogLevel level) const noexcept
    {
        return level >= m_level && level != LogLevel::Off;
    }

    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink, silencing the logger.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const noexcept
    {
        return m_level;
    }

    void flush();

private:
    Logger();

    LogLevel m_level = LogLevel::Warn;
    std::vector<std::unique_ptr<LogSink>> m_sinks;
    mutable std::mutex m_mutex;
};

/**
 * @brief Map a count of `-v` flags to a level: none is Warn, one is Info,
 * more is Debug.
 */
LogLevel level_from_verbosity(size_t verbosity) noexcept;

} // namespace stagedag

/// Internal macro, use the level-specific macros below.
#define STAGEDAG_LOG_IMPL(level, module_str, msg)                                  \
    do                                                                             \
    {                                                                              \
        auto& stagedag_logger_ = ::stagedag::Logger::instance();                   \
        if (stagedag_logger_.should_log(level))                                    \
        {                                                                          \
            std::ostringstream stagedag_oss_;                                      \
            stagedag_oss_ << msg;                                                  \
            stagedag_logger_.log(level, module_str, stagedag_oss_.str(),           \
                                 __FILE__, __LINE__);                              \
        }                                                                          \
    } while (0)

#define STAGEDAG_LOG_TRACE(module, msg) STAGEDAG_LOG_IMPL(::stagedag::LogLevel::Trace, module, msg)
#define STAGEDAG_LOG_DEBUG(module, msg) STAGEDAG_LOG_IMPL(::stagedag::LogLevel::Debug, module, msg)
#define STAGEDAG_LOG_INFO(module, msg) STAGEDAG_LOG_IMPL(::stagedag::LogLevel::Info, module, msg)
#define STAGEDAG_LOG_WARN(module, msg) STAGEDAG_LOG_IMPL(::stagedag::LogLevel::Warn, module, msg)
#define STAGEDAG_LOG_ERROR(module, msg) STAGEDAG_LOG_IMPL(::stagedag::LogLevel::Error, module, msg)
#define STAGEDAG_LOG_FATAL(module, msg) STAGEDAG_LOG_IMPL(::stagedag::LogLevel::Fatal, module, msg)
