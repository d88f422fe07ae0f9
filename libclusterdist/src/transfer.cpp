#include "../include/clusterdist/transfer.hpp"
#include "../include/clusterdist/remote.hpp"

#include <cassert>

namespace clusterdist {
TransferOrchestrator::TransferOrchestrator(LogPtr log,
                                           const NodeAddressing& addressing,
                                           RemoteExecutor& executor)
  : m_logger(log->createLogger("TransferOrchestrator"))
  , m_addressing(addressing)
  , m_executor(executor)
{}
TransferOrchestrator::~TransferOrchestrator() {}

void
TransferOrchestrator::distribute(const TransferFiles& files,
                                 const std::string& workingDirectory,
                                 NodeIndex count)
{
  for(NodeIndex index : TargetNodes(count)) {
    distributeToNode(m_addressing.address(index), files, workingDirectory);
  }
}

void
TransferOrchestrator::distributeToNode(const NodeAddress& node,
                                       const TransferFiles& files,
                                       const std::string& workingDirectory)
{
  m_logger.setMeta(node.str());

  CLUSTERDIST_LOG(m_logger, Info)
    << "Checking directory " << workingDirectory << " on node " << node.index
    << ".";
  RemoteStatus status = m_executor.makeDirectory(node, workingDirectory);
  CLUSTERDIST_LOG(m_logger, Debug) << "mkdir returned " << status;

  for(const auto& file : files) {
    // The name is appended as given, also when it is an absolute path.
    std::string remotePath = workingDirectory + file.name;
    CLUSTERDIST_LOG(m_logger, Info)
      << "Sending " << file.localPath << " to " << node << ":" << remotePath;
    status = m_executor.copyFile(node, file.localPath, remotePath);
    CLUSTERDIST_LOG(m_logger, Debug) << "scp returned " << status;
  }
}

TransferFiles
MakeTransferFiles(const StringVector& names, const StringVector& localPaths)
{
  assert(names.size() == localPaths.size());
  TransferFiles files;
  files.reserve(names.size());
  for(size_t i = 0; i < names.size(); ++i) {
    files.push_back(TransferFile{ localPaths[i], names[i] });
  }
  return files;
}
}
