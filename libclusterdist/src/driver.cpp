#include "../include/clusterdist/driver.hpp"
#include "../include/clusterdist/broadcaster.hpp"
#include "../include/clusterdist/config.hpp"
#include "../include/clusterdist/node_address.hpp"
#include "../include/clusterdist/power_controller.hpp"
#include "../include/clusterdist/preflight.hpp"
#include "../include/clusterdist/remote.hpp"
#include "../include/clusterdist/transfer.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/filesystem/operations.hpp>

namespace clusterdist {
Driver::Driver(ConfigPtr config,
               LogPtr log,
               RemoteExecutor& executor,
               PowerSwitch& powerSwitch,
               Pacer& pacer,
               std::string currentDirectory)
  : m_config(config)
  , m_log(log)
  , m_logger(log->createLogger("Driver"))
  , m_executor(executor)
  , m_powerSwitch(powerSwitch)
  , m_pacer(pacer)
  , m_currentDirectory(currentDirectory.empty()
                         ? boost::filesystem::current_path().string()
                         : std::move(currentDirectory))
{}
Driver::~Driver() {}

Status
Driver::run()
{
  if(m_config->hasCommand()) {
    return runCommandMode();
  }
  return runDistributeMode();
}

Status
Driver::runCommandMode()
{
  NodeAddressing addressing(*m_config);
  CommandBroadcaster broadcaster(m_log, addressing, m_executor);
  broadcaster.broadcast(std::string(m_config->getString(Config::Command)),
                        m_config->getNodeCount());
  CLUSTERDIST_LOG(m_logger, Info) << "Command sent to all nodes.";
  return Status::Ok;
}

Status
Driver::runDistributeMode()
{
  const StringVector& files = m_config->getStringVector(Config::Files);
  if(files.empty()) {
    CLUSTERDIST_LOG(m_logger, Fatal)
      << "No files given! Provide at least one file or a command (-c).";
    return Status::MissingFileArguments;
  }

  std::string directory(m_config->getString(Config::Directory));

  PreflightValidator validator(m_log, m_currentDirectory);
  PreflightResult preflight = validator.validate(files, directory);
  if(!preflight.ok()) {
    CLUSTERDIST_LOG(m_logger, Fatal)
      << "Could not find file(s) " << boost::algorithm::join(preflight.missing, ", ")
      << " in " << NormalizeDirectory(m_currentDirectory) << " or "
      << directory << "!";
    return preflight.status;
  }

  NodeIndex count = m_config->getNodeCount();

  if(m_config->isPowerMode()) {
    PowerController powerController(m_log, m_powerSwitch, m_pacer);
    powerController.powerOn(count);
  }

  NodeAddressing addressing(*m_config);
  TransferOrchestrator transfer(m_log, addressing, m_executor);
  transfer.distribute(
    MakeTransferFiles(files, preflight.resolvedPaths), directory, count);

  CLUSTERDIST_LOG(m_logger, Info)
    << "Distributed " << files.size() << " file(s) to " << count
    << " node(s).";
  return Status::Ok;
}
}
