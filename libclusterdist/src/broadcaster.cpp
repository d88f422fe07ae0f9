#include "../include/clusterdist/broadcaster.hpp"
#include "../include/clusterdist/remote.hpp"

namespace clusterdist {
CommandBroadcaster::CommandBroadcaster(LogPtr log,
                                       const NodeAddressing& addressing,
                                       RemoteExecutor& executor)
  : m_logger(log->createLogger("CommandBroadcaster"))
  , m_addressing(addressing)
  , m_executor(executor)
{}
CommandBroadcaster::~CommandBroadcaster() {}

void
CommandBroadcaster::broadcast(const std::string& command, NodeIndex count)
{
  for(NodeIndex index : TargetNodes(count)) {
    NodeAddress node = m_addressing.address(index);
    CLUSTERDIST_LOG(m_logger, Info)
      << "Running \"" << command << "\" on " << node << ".";
    RemoteStatus status = m_executor.execute(node, command);
    CLUSTERDIST_LOG(m_logger, Debug)
      << "Command on " << node << " returned " << status;
  }
}
}
