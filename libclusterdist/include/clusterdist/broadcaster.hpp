#ifndef CLUSTERDIST_BROADCASTER_HPP
#define CLUSTERDIST_BROADCASTER_HPP

#include <string>

#include "log.hpp"
#include "node_address.hpp"
#include "types.hpp"

namespace clusterdist {
class RemoteExecutor;

/** @brief Runs one command on every node of the target set, one node after
 * another. Failing nodes are skipped silently. */
class CommandBroadcaster
{
  public:
  CommandBroadcaster(LogPtr log,
                     const NodeAddressing& addressing,
                     RemoteExecutor& executor);
  ~CommandBroadcaster();

  void broadcast(const std::string& command, NodeIndex count);

  private:
  Logger m_logger;
  const NodeAddressing& m_addressing;
  RemoteExecutor& m_executor;
};
}

#endif
