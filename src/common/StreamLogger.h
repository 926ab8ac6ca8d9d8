// src/common/StreamLogger.h
#pragma once

#include <sstream>

#include <spdlog/spdlog.h>

// Collects one log record through operator<< and hands it to the default
// spdlog logger when the statement ends.
class StreamLogger
{
public:
    StreamLogger(spdlog::level::level_enum level, spdlog::source_loc location)
        : m_level(level), m_location(location) {}

    ~StreamLogger()
    {
        spdlog::default_logger_raw()->log(m_location, m_level, m_stream.str());
    }

    StreamLogger(const StreamLogger &) = delete;
    StreamLogger &operator=(const StreamLogger &) = delete;

    template <typename T>
    StreamLogger &operator<<(const T &value)
    {
        m_stream << value;
        return *this;
    }

private:
    const spdlog::level::level_enum m_level;
    const spdlog::source_loc m_location;
    std::ostringstream m_stream;
};

// Gives both branches of the LOG_STREAM conditional the type void,
// so the macro is a single expression that is safe in unbraced if/else.
class LogVoidify
{
public:
    void operator&(const StreamLogger &) {}
};

#define LOG_STREAM(level) \
    !(spdlog::should_log(level)) ? (void)0 : LogVoidify() & StreamLogger(level, spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION})

#define LOG_DBG LOG_STREAM(spdlog::level::debug)
#define LOG_INF LOG_STREAM(spdlog::level::info)
#define LOG_WAR LOG_STREAM(spdlog::level::warn)
#define LOG_ERR LOG_STREAM(spdlog::level::err)
#define LOG_CRT LOG_STREAM(spdlog::level::critical)
