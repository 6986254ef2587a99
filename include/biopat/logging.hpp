#pragma once

#ifndef BOOST_LOG_DYN_LINK
#define BOOST_LOG_DYN_LINK 1
#endif

#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

#include <boost/log/core.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

namespace biopat::logging {

namespace src = boost::log::sources;

enum class severity_level { trace, debug, info, warning, error, fatal };

std::ostream& operator<<(std::ostream& os, severity_level level);

// Records are discarded until init() installs the sinks
BOOST_LOG_GLOBAL_LOGGER(logger, src::severity_logger<severity_level>)

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

/**
 * @brief Sink configuration installed by init()
 */
struct LogConfig {
    severity_level console_level = severity_level::warning;
    std::optional<std::filesystem::path> debug_log;
    std::optional<std::filesystem::path> trace_log;
};

/**
 * @brief Replace any installed sinks with a console sink on std::clog and the
 *        optional debug/trace file sinks named in config
 */
void init(const LogConfig& config = {});

/**
 * @brief Remove all sinks and discard records until the next init()
 */
void reset();

template <severity_level L>
class Logger {
public:
    Logger() : lg_{logger::get()} {}

    template <typename T> void write(const T& msg) { BOOST_LOG_SEV(lg_, L) << msg; }

private:
    src::severity_logger<severity_level> lg_;
};

template <severity_level L, typename T>
Logger<L>& operator<<(Logger<L>& lg, const T& msg) {
    lg.write(msg);
    return lg;
}

class TraceLogger   : public Logger<severity_level::trace> {};
class DebugLogger   : public Logger<severity_level::debug> {};
class InfoLogger    : public Logger<severity_level::info> {};
class WarningLogger : public Logger<severity_level::warning> {};
class ErrorLogger   : public Logger<severity_level::error> {};
class FatalLogger   : public Logger<severity_level::fatal> {};

/**
 * @brief Collects streamed pieces and emits them as one record on destruction
 */
template <typename Log>
class LogStream {
public:
    LogStream() = delete;

    explicit LogStream(Log& log) : log_{log}, msg_{} {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&) = default;
    LogStream& operator=(LogStream&&) = default;

    ~LogStream() noexcept {
        try {
            auto str = msg_.str();
            if (!str.empty() && str.back() == '\n') {
                str.pop_back();
            }
            log_.get() << str;
        } catch (const std::exception&) {
            return;
        }
    }

    template <typename M> void write(const M& msg) { msg_ << msg; }

private:
    std::reference_wrapper<Log> log_;
    std::ostringstream msg_;
};

template <typename Log>
auto stream(Log& log) {
    return LogStream<Log>{log};
}

template <typename T, typename M>
LogStream<T>& operator<<(LogStream<T>& lg, const M& msg) {
    lg.write(msg);
    return lg;
}

template <typename T, typename M>
LogStream<T>& operator<<(LogStream<T>&& lg, const M& msg) {
    lg.write(msg);
    return lg;
}

} // namespace biopat::logging
