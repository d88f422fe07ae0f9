#ifndef CLUSTERDIST_DRY_RUN_REMOTE_HPP
#define CLUSTERDIST_DRY_RUN_REMOTE_HPP

#include "command_line.hpp"
#include "log.hpp"
#include "remote.hpp"

namespace clusterdist {
/** @brief Logs the ssh and scp calls it would make and reports success. */
class DryRunRemoteExecutor : public RemoteExecutor
{
  public:
  DryRunRemoteExecutor(ConfigPtr config, LogPtr log);
  virtual ~DryRunRemoteExecutor();

  virtual RemoteStatus makeDirectory(const NodeAddress& node,
                                     const std::string& directory) override;
  virtual RemoteStatus copyFile(const NodeAddress& node,
                                const std::string& localPath,
                                const std::string& remotePath) override;
  virtual RemoteStatus execute(const NodeAddress& node,
                               const std::string& command) override;

  private:
  RemoteStatus log(const CommandLine& cl);

  Logger m_logger;
  CommandLineBuilder m_builder;
};

/** @brief Logs the power program calls it would make and reports success. */
class DryRunPowerSwitch : public PowerSwitch
{
  public:
  DryRunPowerSwitch(ConfigPtr config, LogPtr log);
  virtual ~DryRunPowerSwitch();

  virtual RemoteStatus powerOnAll() override;
  virtual RemoteStatus powerOn(NodeIndex index) override;

  private:
  RemoteStatus log(const CommandLine& cl);

  Logger m_logger;
  CommandLineBuilder m_builder;
};

/** @brief Logs waits instead of sleeping. */
class DryRunPacer : public Pacer
{
  public:
  explicit DryRunPacer(LogPtr log);
  virtual ~DryRunPacer();

  virtual void sleepFor(std::chrono::milliseconds duration) override;

  private:
  Logger m_logger;
};
}

#endif
