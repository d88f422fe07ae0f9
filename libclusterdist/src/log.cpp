#include "../include/clusterdist/log.hpp"
#include "../include/clusterdist/config.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

BOOST_LOG_ATTRIBUTE_KEYWORD(clusterdist_logger_severity,
                            "Severity",
                            ::clusterdist::Log::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(clusterdist_logger_timestamp,
                            "Timestamp",
                            boost::posix_time::ptime)
BOOST_LOG_ATTRIBUTE_KEYWORD(clusterdist_logger_context, "Context", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(clusterdist_logger_context_meta,
                            "ContextMeta",
                            std::string)

bool LogSinksSetup = false;

namespace clusterdist {

Log::Log(ConfigPtr config)
  : m_config(config)
{
  // Initialise global logging attributes for all loggers.
  try {
    logging::core::get()->add_global_attribute(
      "Timestamp", logging::attributes::local_clock());
    logging::add_common_attributes();

    // Logging Filter
    Severity defaultSeverity = Severity::Warning;
    m_targetSeverity =
      std::min({ config->isTraceMode() ? Severity::Trace : defaultSeverity,
                 config->isDebugMode() ? Severity::Debug : defaultSeverity,
                 config->isVerboseMode() ? Severity::Info : defaultSeverity });

    boost::log::core::get()->set_filter(clusterdist_logger_severity >=
                                        m_targetSeverity);
  } catch(const std::exception& e) {
    std::cerr
      << "> Exception during initialisation of global log variables! Error: "
      << e.what() << ". Log level would have been " << m_targetSeverity
      << std::endl;
    throw;
  }
  try {
    auto& targetStream =
      m_config->useSTDERRForLogging() ? std::clog : std::cout;

    if(!LogSinksSetup) {
      m_consoleSink = logging::add_console_log(
        targetStream,
        keywords::format =
          (expr::stream
           << "[" << clusterdist_logger_timestamp << "] ["
           << expr::attr<Log::Severity, Log::Severity_Tag>("Severity") << "] "
           << expr::if_(expr::has_attr<std::string>(
                "ContextMeta"))[expr::stream
                                << "[" << clusterdist_logger_context << "<"
                                << clusterdist_logger_context_meta << ">]"]
                .else_[expr::stream << "[" << clusterdist_logger_context
                                    << "]"]
           << " " << expr::smessage));
      boost::log::core::get()->add_sink(m_consoleSink);
      LogSinksSetup = true;
    }
  } catch(const std::exception& e) {
    std::cerr << "> Exception during initialisation of log sinks! Error: "
              << e.what() << std::endl;
    throw;
  }
}
Log::~Log() {}

template<typename LoggerType>
static LoggerType
createGenericLogger(const std::string& context)
{
  auto lg = LoggerType();
  auto contextConstant = boost::log::attributes::make_constant(context);
  lg.add_attribute("Context", contextConstant);
  return lg;
}

template<typename Logger>
static Log::Handle<Logger>
createGenericLoggerHandle(Logger&& logger, Log& log, const std::string& meta)
{
  auto handle = Log::Handle<Logger>{ logger, log };
  if(meta != "") {
    handle.setMeta(meta);
  }
  return handle;
}

Logger
Log::createLogger(const std::string& context, const std::string& meta)
{
  return createGenericLoggerHandle(
    createGenericLogger<boost::log::sources::severity_logger<Log::Severity>>(
      context),
    *this,
    meta);
}

std::ostream&
operator<<(std::ostream& strm, ::clusterdist::Log::Severity level)
{
  static const char* strings[] = { "Trace",   "Debug", "Info",
                                   "Warning", "Error", "Fatal" };
  if(static_cast<std::size_t>(level) < sizeof(strings) / sizeof(*strings))
    strm << strings[level];
  else
    strm << static_cast<int>(level);

  return strm;
}

boost::log::formatting_ostream&
operator<<(
  boost::log::formatting_ostream& strm,
  boost::log::to_log_manip<::clusterdist::Log::Severity,
                           ::clusterdist::Log::Severity_Tag> const& manip)
{
  static const char* colorised_strings[] = {
    "\033[0;37mTRCE\033[0m", "\033[0;32mDEBG\033[0m", "\033[1;37mINFO\033[0m",
    "\033[0;33mWARN\033[0m", "\033[0;31mERRO\033[0m", "\033[0;35mFTAL\033[0m",
  };
  static const char* uncolorised_strings[] = { "TRCE", "DEBG", "INFO",
                                               "WARN", "ERRO", "FTAL" };

  const char** strings = uncolorised_strings;

  const char* terminal = std::getenv("TERM");
  if(terminal != NULL && std::strlen(terminal) > 7) {
    strings = colorised_strings;
  }

  ::clusterdist::Log::Severity level = manip.get();

  if(static_cast<std::size_t>(level) <
     sizeof(uncolorised_strings) / sizeof(*uncolorised_strings))
    strm << strings[level];
  else
    strm << static_cast<int>(level);

  return strm;
}
}
