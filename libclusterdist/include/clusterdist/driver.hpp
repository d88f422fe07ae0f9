#ifndef CLUSTERDIST_DRIVER_HPP
#define CLUSTERDIST_DRIVER_HPP

#include <string>

#include "log.hpp"
#include "status.hpp"
#include "types.hpp"

namespace clusterdist {
class RemoteExecutor;
class PowerSwitch;
class Pacer;

/** @brief Runs a single pass over a parsed \ref Config.
 *
 * In command mode, the command is broadcast and the run ends. Otherwise at
 * least one file is required; all files are validated before the nodes are
 * powered (if requested) and the files are distributed. Nothing is retried
 * and no state survives the run.
 */
class Driver
{
  public:
  /** @param currentDirectory First search root for the files to distribute.
   * Empty uses the working directory of the process. */
  Driver(ConfigPtr config,
         LogPtr log,
         RemoteExecutor& executor,
         PowerSwitch& powerSwitch,
         Pacer& pacer,
         std::string currentDirectory = "");
  ~Driver();

  Status run();

  private:
  Status runCommandMode();
  Status runDistributeMode();

  ConfigPtr m_config;
  LogPtr m_log;
  Logger m_logger;
  RemoteExecutor& m_executor;
  PowerSwitch& m_powerSwitch;
  Pacer& m_pacer;
  std::string m_currentDirectory;
};
}

#endif
