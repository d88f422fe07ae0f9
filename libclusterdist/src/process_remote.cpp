#include "../include/clusterdist/process_remote.hpp"
#include "../include/clusterdist/config.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/search_path.hpp>
#include <vector>

namespace bp = boost::process;

namespace clusterdist {
RemoteStatus
RunProcess(const CommandLine& cl, Logger& logger)
{
  if(cl.empty()) {
    return RemoteStatus::failure(-1, "empty command line");
  }

  const std::string& program = cl.front();
  boost::filesystem::path executable;
  if(program.find('/') != std::string::npos) {
    executable = program;
  } else {
    executable = bp::search_path(program);
  }
  if(executable.empty()) {
    CLUSTERDIST_LOG(logger, Debug)
      << "Program \"" << program << "\" not found in PATH.";
    return RemoteStatus::failure(127, "program " + program + " not found");
  }

  CLUSTERDIST_LOG(logger, Trace) << "Running " << CommandLineToString(cl);

  try {
    bp::child child(executable,
                    bp::args(std::vector<std::string>(cl.begin() + 1, cl.end())));
    child.wait();
    int exitCode = child.exit_code();
    if(exitCode != 0) {
      return RemoteStatus::failure(exitCode);
    }
    return RemoteStatus::success();
  } catch(const bp::process_error& e) {
    return RemoteStatus::failure(e.code().value(), e.what());
  }
}

ProcessRemoteExecutor::ProcessRemoteExecutor(ConfigPtr config, LogPtr log)
  : m_logger(log->createLogger("ProcessRemoteExecutor"))
  , m_builder(*config)
{}
ProcessRemoteExecutor::~ProcessRemoteExecutor() {}

RemoteStatus
ProcessRemoteExecutor::makeDirectory(const NodeAddress& node,
                                     const std::string& directory)
{
  return RunProcess(m_builder.makeDirectory(node, directory), m_logger);
}

RemoteStatus
ProcessRemoteExecutor::copyFile(const NodeAddress& node,
                                const std::string& localPath,
                                const std::string& remotePath)
{
  return RunProcess(m_builder.copyFile(node, localPath, remotePath), m_logger);
}

RemoteStatus
ProcessRemoteExecutor::execute(const NodeAddress& node,
                               const std::string& command)
{
  return RunProcess(m_builder.execute(node, command), m_logger);
}

ProcessPowerSwitch::ProcessPowerSwitch(ConfigPtr config, LogPtr log)
  : m_logger(log->createLogger("ProcessPowerSwitch"))
  , m_builder(*config)
{}
ProcessPowerSwitch::~ProcessPowerSwitch() {}

RemoteStatus
ProcessPowerSwitch::powerOnAll()
{
  return RunProcess(m_builder.powerOnAll(), m_logger);
}

RemoteStatus
ProcessPowerSwitch::powerOn(NodeIndex index)
{
  return RunProcess(m_builder.powerOn(index), m_logger);
}
}
