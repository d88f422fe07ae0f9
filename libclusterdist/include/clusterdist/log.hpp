#ifndef CLUSTERDIST_LOG_HPP
#define CLUSTERDIST_LOG_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_feature.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/manipulators/to_log.hpp>
#include <boost/thread.hpp>
#include <memory>
#include <string>

#include "types.hpp"

template<typename T>
using MutableConstant = boost::log::attributes::mutable_constant<
  T,
  boost::shared_mutex,                    // synchronization primitive
  boost::unique_lock<boost::shared_mutex>,// exclusive lock type
  boost::shared_lock<boost::shared_mutex> // shared lock type;
  >;

namespace clusterdist {

/** @brief Utility class to manage logging.
 *
 * Progress output of the orchestrating components is written as Info
 * messages, so it only appears in verbose mode.
 */
class Log
{
  public:
  /** @brief Tag to associate severity internally.
   */
  struct Severity_Tag;
  /** @brief Severity of a log message.
   */
  enum Severity
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal,
  };

  template<typename LoggerType>
  struct Handle
  {
    Handle(LoggerType logger, Log& log)
      : logger(logger)
      , log(&log)
      , metaAttr("")
    {}
    Handle(const Handle& o)
      : logger(o.logger)
      , log(o.log)
      , metaAttr(o.metaAttr)
    {}
    Handle& operator=(const Handle& o)
    {
      logger = o.logger;
      log = o.log;
      metaAttr = o.metaAttr;
      return *this;
    }
    void setMeta(const std::string& meta)
    {
      if(!metaAdded) {
        logger.add_attribute("ContextMeta", metaAttr);
        metaAdded = true;
      }
      metaAttr.set(meta);
    }
    LoggerType logger;
    Log* log;
    MutableConstant<std::string> metaAttr;
    bool metaAdded = false;
  };

  using Logger = Handle<boost::log::sources::severity_logger<Log::Severity>>;

  /** @brief Constructor
   */
  Log(ConfigPtr config);
  /** @brief Destructor.
   */
  ~Log();

  /** @brief Create a logger for a specific environment, which may receive
   * multiple custom attributes.
   */
  Logger createLogger(const std::string& context, const std::string& meta = "");

  inline bool isLogLevelEnabled(Severity severity) const
  {
    return severity >= m_targetSeverity;
  }

  private:
  ConfigPtr m_config;
  Severity m_targetSeverity = Warning;
  boost::shared_ptr<boost::log::sinks::synchronous_sink<
    boost::log::sinks::basic_text_ostream_backend<char>>>
    m_consoleSink;
};

using Logger = Log::Logger;

std::ostream&
operator<<(std::ostream& strm, ::clusterdist::Log::Severity level);

boost::log::formatting_ostream&
operator<<(
  boost::log::formatting_ostream& strm,
  boost::log::to_log_manip<::clusterdist::Log::Severity,
                           ::clusterdist::Log::Severity_Tag> const& manip);
}

#define CLUSTERDIST_LOG(LOGGER, SEVERITY)                                  \
  if((LOGGER).log->isLogLevelEnabled(::clusterdist::Log::Severity::SEVERITY)) \
  BOOST_LOG_SEV((LOGGER).logger, ::clusterdist::Log::Severity::SEVERITY)

#endif
