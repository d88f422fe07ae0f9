#ifndef CLUSTERDIST_PROCESS_REMOTE_HPP
#define CLUSTERDIST_PROCESS_REMOTE_HPP

#include "command_line.hpp"
#include "log.hpp"
#include "remote.hpp"

namespace clusterdist {
/** @brief Run an external program and wait for it to exit.
 *
 * The child inherits stdout and stderr, so output of remote commands reaches
 * the user. The program is looked up in PATH unless it contains a '/'. Spawn
 * errors are returned as a failed status instead of being thrown.
 */
RemoteStatus
RunProcess(const CommandLine& cl, Logger& logger);

/** @brief Remote primitives implemented by spawning ssh and scp. */
class ProcessRemoteExecutor : public RemoteExecutor
{
  public:
  ProcessRemoteExecutor(ConfigPtr config, LogPtr log);
  virtual ~ProcessRemoteExecutor();

  virtual RemoteStatus makeDirectory(const NodeAddress& node,
                                     const std::string& directory) override;
  virtual RemoteStatus copyFile(const NodeAddress& node,
                                const std::string& localPath,
                                const std::string& remotePath) override;
  virtual RemoteStatus execute(const NodeAddress& node,
                               const std::string& command) override;

  private:
  Logger m_logger;
  CommandLineBuilder m_builder;
};

/** @brief Power control implemented by spawning the power program. */
class ProcessPowerSwitch : public PowerSwitch
{
  public:
  ProcessPowerSwitch(ConfigPtr config, LogPtr log);
  virtual ~ProcessPowerSwitch();

  virtual RemoteStatus powerOnAll() override;
  virtual RemoteStatus powerOn(NodeIndex index) override;

  private:
  Logger m_logger;
  CommandLineBuilder m_builder;
};
}

#endif
