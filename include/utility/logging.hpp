#ifndef INCLUDED_UTILTIY_LOGGING
#define INCLUDED_UTILTIY_LOGGING

#include "macro_definitions.hpp"
#include <cstddef>
#include <iterator>
#include <utility>

#ifdef GEOHASH_USE_BOOST_LOGGING

#    include <boost/date_time/posix_time/posix_time_types.hpp>
#    include <boost/log/attributes.hpp>
#    include <boost/log/attributes/constant.hpp>
#    include <boost/log/attributes/scoped_attribute.hpp>
#    include <boost/log/expressions.hpp>
#    include <boost/log/sinks/sync_frontend.hpp>
#    include <boost/log/sinks/text_ostream_backend.hpp>
#    include <boost/log/sources/record_ostream.hpp>
#    include <boost/log/sources/severity_logger.hpp>
#    include <boost/log/support/date_time.hpp>
#    include <boost/log/utility/setup/common_attributes.hpp>
#    include <boost/smart_ptr/make_shared_object.hpp>
#    include <boost/smart_ptr/shared_ptr.hpp>
#    include <filesystem>
#    include <fstream>
#    include <iomanip>
#    include <mutex>
#    include <ostream>
#    include <string>
#    include <string_view>
#else
#    include <string_view>
#    ifndef DEBUG_OSTREAM
#        include <iostream>
#        define DEBUG_OSTREAM std::clog
#    endif
#endif

#ifndef GEOHASH_DEFAULT_LOG_LEVEL_TRACE
#    define GEOHASH_DEFAULT_LOG_LEVEL_TRACE 1
#endif
#ifndef GEOHASH_DEFAULT_LOG_LEVEL_DEBUG
#    define GEOHASH_DEFAULT_LOG_LEVEL_DEBUG 2
#endif
#ifndef GEOHASH_DEFAULT_LOG_LEVEL_INFO
#    define GEOHASH_DEFAULT_LOG_LEVEL_INFO 3
#endif
#ifndef GEOHASH_DEFAULT_LOG_LEVEL_WARNING
#    define GEOHASH_DEFAULT_LOG_LEVEL_WARNING 4
#endif
#ifndef GEOHASH_DEFAULT_LOG_LEVEL_ERROR
#    define GEOHASH_DEFAULT_LOG_LEVEL_ERROR 5
#endif
#ifndef GEOHASH_DEFAULT_LOG_LEVEL_FATAL
#    define GEOHASH_DEFAULT_LOG_LEVEL_FATAL 6
#endif
#ifndef GEOHASH_DEFAULT_LOG_LEVEL_OFF
#    define GEOHASH_DEFAULT_LOG_LEVEL_OFF 7
#endif

#define DEFAULT_SOURCE_LOG_LEVEL_TRACE   GEOHASH_DEFAULT_LOG_LEVEL_TRACE
#define DEFAULT_SOURCE_LOG_LEVEL_DEBUG   GEOHASH_DEFAULT_LOG_LEVEL_DEBUG
#define DEFAULT_SOURCE_LOG_LEVEL_INFO    GEOHASH_DEFAULT_LOG_LEVEL_INFO
#define DEFAULT_SOURCE_LOG_LEVEL_WARNING GEOHASH_DEFAULT_LOG_LEVEL_WARNING
#define DEFAULT_SOURCE_LOG_LEVEL_ERROR   GEOHASH_DEFAULT_LOG_LEVEL_ERROR
#define DEFAULT_SOURCE_LOG_LEVEL_FATAL   GEOHASH_DEFAULT_LOG_LEVEL_FATAL
#define DEFAULT_SOURCE_LOG_LEVEL_OFF     GEOHASH_DEFAULT_LOG_LEVEL_OFF

#ifdef GEOHASH_LOG_LEVEL
#    define DEFAULT_SOURCE_LOG_LEVEL \
        UTILITY_CONCATENATE_MACRO(DEFAULT_SOURCE_LOG_LEVEL_, GEOHASH_LOG_LEVEL)
#else
#    define DEFAULT_SOURCE_LOG_LEVEL DEFAULT_SOURCE_LOG_LEVEL_INFO
#endif

#define DEFAULT_SOURCE_LOG_IGNORE(msg) ((void)0)

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_TRACE
#    define DEFAULT_SOURCE_LOG_TRACE(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::trace, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_TRACE(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_DEBUG
#    define DEFAULT_SOURCE_LOG_DEBUG(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::debug, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_DEBUG(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_INFO
#    define DEFAULT_SOURCE_LOG_INFO(msg) \
        utility::logging::default_source::log(utility::logging::severity_level::info, msg)
#else
#    define DEFAULT_SOURCE_LOG_INFO(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_WARNING
#    define DEFAULT_SOURCE_LOG_WARNING(msg)                \
        utility::logging::default_source::log(             \
            utility::logging::severity_level::warning, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_WARNING(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_ERROR
#    define DEFAULT_SOURCE_LOG_ERROR(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::error, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_ERROR(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_FATAL
#    define DEFAULT_SOURCE_LOG_FATAL(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::fatal, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_FATAL(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

namespace utility::logging
{
enum severity_level
{
    trace,
    debug,
    info,
    warning,
    error,
    fatal,
};

inline constexpr std::string_view s_severity_names[] = { "trace",   "debug", "info",
                                                         "warning", "error", "fatal" };

[[nodiscard]]
inline constexpr auto severity_name(severity_level sev) noexcept -> std::string_view
{
    if (static_cast<std::size_t>(sev) < std::size(s_severity_names))
    {
        return s_severity_names[sev];
    }
    return "UNKNOWN";
}

#ifdef GEOHASH_USE_BOOST_LOGGING
namespace log   = boost::log;
namespace src   = boost::log::sources;
namespace expr  = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;

#    define LOGGING_UTILITY_SCOPED_ADD_TAG(tag) \
        BOOST_LOG_SCOPED_THREAD_ATTR(                \
            "Tag", boost::log::attributes::constant<std::string>(tag) \
        )

inline auto operator<<(std::ostream& strm, severity_level level) -> std::ostream&
{
    const auto s = severity_name(level);
    strm << "<" << s << std::setw(static_cast<int>(9uz - s.size())) << std::setfill(' ')
         << ">";
    return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(line_id, "LineID", unsigned int)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(tag_attr, "Tag", std::string)

inline auto make_file_sink(std::string const& path)
{
    using text_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    auto sink       = boost::make_shared<text_sink>();
    sink->locked_backend()->add_stream(boost::make_shared<std::ofstream>(path));
    sink->set_formatter(
        expr::stream
        << std::setw(5) << std::left << std::dec << std::setfill(' ') << line_id << " "
        << expr::format_date_time<boost::posix_time::ptime>(
               "TimeStamp", "  %Y-%m-%d %H:%M:%S    "
           )
        << severity
        << expr::if_(expr::has_attr(tag_attr))[expr::stream << "  [" << tag_attr << "]"]
        << "  " << expr::smessage
    );
    sink->locked_backend()->auto_flush(true);
    return sink;
}

inline auto init() -> void
{
    std::filesystem::create_directories("logs");

    auto general_sink = make_file_sink("logs/general.log");
    auto errors_sink  = make_file_sink("logs/errors.log");
    errors_sink->set_filter(severity >= severity_level::warning);

    log::core::get()->add_sink(general_sink);
    log::core::get()->add_sink(errors_sink);

    log::add_common_attributes();
}
#else
#    define LOGGING_UTILITY_SCOPED_ADD_TAG(tag) ((void)0)
#endif

class default_source
{
public:
    inline static auto log(severity_level sev, auto&& message) -> void
    {
#ifdef GEOHASH_USE_BOOST_LOGGING
        std::call_once(s_initialized, init);
        static src::severity_logger_mt<severity_level> lg;
        BOOST_LOG_SEV(lg, sev) << std::forward<decltype(message)>(message);
#else
        DEBUG_OSTREAM << "geohash32 <" << severity_name(sev) << "> "
                      << std::forward<decltype(message)>(message) << '\n';
#endif
    }

#ifdef GEOHASH_USE_BOOST_LOGGING
private:
    inline static std::once_flag s_initialized;
#endif
};

} // namespace utility::logging

#endif // INCLUDED_UTILTIY_LOGGING
