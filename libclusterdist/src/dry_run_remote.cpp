#include "../include/clusterdist/dry_run_remote.hpp"
#include "../include/clusterdist/config.hpp"

namespace clusterdist {
DryRunRemoteExecutor::DryRunRemoteExecutor(ConfigPtr config, LogPtr log)
  : m_logger(log->createLogger("DryRun"))
  , m_builder(*config)
{}
DryRunRemoteExecutor::~DryRunRemoteExecutor() {}

RemoteStatus
DryRunRemoteExecutor::log(const CommandLine& cl)
{
  CLUSTERDIST_LOG(m_logger, Info) << "Would run: " << CommandLineToString(cl);
  return RemoteStatus::success();
}

RemoteStatus
DryRunRemoteExecutor::makeDirectory(const NodeAddress& node,
                                    const std::string& directory)
{
  return log(m_builder.makeDirectory(node, directory));
}

RemoteStatus
DryRunRemoteExecutor::copyFile(const NodeAddress& node,
                               const std::string& localPath,
                               const std::string& remotePath)
{
  return log(m_builder.copyFile(node, localPath, remotePath));
}

RemoteStatus
DryRunRemoteExecutor::execute(const NodeAddress& node,
                              const std::string& command)
{
  return log(m_builder.execute(node, command));
}

DryRunPowerSwitch::DryRunPowerSwitch(ConfigPtr config, LogPtr log)
  : m_logger(log->createLogger("DryRun"))
  , m_builder(*config)
{}
DryRunPowerSwitch::~DryRunPowerSwitch() {}

RemoteStatus
DryRunPowerSwitch::log(const CommandLine& cl)
{
  CLUSTERDIST_LOG(m_logger, Info) << "Would run: " << CommandLineToString(cl);
  return RemoteStatus::success();
}

RemoteStatus
DryRunPowerSwitch::powerOnAll()
{
  return log(m_builder.powerOnAll());
}

RemoteStatus
DryRunPowerSwitch::powerOn(NodeIndex index)
{
  return log(m_builder.powerOn(index));
}

DryRunPacer::DryRunPacer(LogPtr log)
  : m_logger(log->createLogger("DryRun"))
{}
DryRunPacer::~DryRunPacer() {}

void
DryRunPacer::sleepFor(std::chrono::milliseconds duration)
{
  CLUSTERDIST_LOG(m_logger, Info)
    << "Would wait for " << duration.count() << "ms";
}
}
