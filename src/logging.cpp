#include "biopat/logging.hpp"

#include <atomic>
#include <iostream>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace biopat::logging {

namespace keywords = boost::log::keywords;
namespace expr     = boost::log::expressions;

namespace {

std::atomic<bool> configured{false};

} // namespace

BOOST_LOG_GLOBAL_LOGGER_INIT(logger, src::severity_logger<severity_level>) {
    if (!configured) {
        boost::log::core::get()->set_logging_enabled(false);
    }
    return src::severity_logger<severity_level>{};
}

std::ostream& operator<<(std::ostream& os, severity_level level) {
    switch (level) {
        case severity_level::trace: os << "TRCE"; break;
        case severity_level::debug: os << "DEBG"; break;
        case severity_level::info: os << "INFO"; break;
        case severity_level::warning: os << "WARN"; break;
        case severity_level::error: os << "ERRR"; break;
        case severity_level::fatal: os << "FATL"; break;
    }
    return os;
}

void init(const LogConfig& config) {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    const boost::log::formatter format = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "[%Y-%m-%d %H:%M:%S]")
        << " <" << severity
        << "> " << expr::smessage;

    boost::log::add_console_log(
        std::clog,
        keywords::filter = (severity >= config.console_level),
        keywords::format = format);

    if (config.debug_log) {
        boost::log::add_file_log(
            keywords::file_name = config.debug_log->string(),
            keywords::filter = (severity != severity_level::trace),
            keywords::format = format,
            keywords::auto_flush = true);
    }

    if (config.trace_log) {
        boost::log::add_file_log(
            keywords::file_name = config.trace_log->string(),
            keywords::filter = (severity != severity_level::debug),
            keywords::format = format,
            keywords::auto_flush = true);
    }

    boost::log::add_common_attributes();
    configured = true;
    core->set_logging_enabled(true);
}

void reset() {
    auto core = boost::log::core::get();
    core->remove_all_sinks();
    configured = false;
    core->set_logging_enabled(false);
}

} // namespace biopat::logging
