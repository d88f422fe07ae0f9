#ifndef CLUSTERDIST_TRANSFER_HPP
#define CLUSTERDIST_TRANSFER_HPP

#include <string>
#include <vector>

#include "log.hpp"
#include "node_address.hpp"
#include "types.hpp"

namespace clusterdist {
class RemoteExecutor;

/** @brief A file to distribute. */
struct TransferFile
{
  /** @brief Path of the source file on the controller. */
  std::string localPath;
  /** @brief Name as given by the user, appended to the destination
   * directory. */
  std::string name;
};
using TransferFiles = std::vector<TransferFile>;

/** @brief Copies files to every node of the target set.
 *
 * Nodes are processed one after another. On each node, the destination
 * directory is created first and then the files are copied in the given
 * order. Results of the remote calls are discarded, an unreachable node does
 * not prevent copies to the remaining ones.
 */
class TransferOrchestrator
{
  public:
  TransferOrchestrator(LogPtr log,
                       const NodeAddressing& addressing,
                       RemoteExecutor& executor);
  ~TransferOrchestrator();

  /** @param workingDirectory Normalized destination directory, ending in '/'.
   */
  void distribute(const TransferFiles& files,
                  const std::string& workingDirectory,
                  NodeIndex count);

  private:
  void distributeToNode(const NodeAddress& node,
                        const TransferFiles& files,
                        const std::string& workingDirectory);

  Logger m_logger;
  const NodeAddressing& m_addressing;
  RemoteExecutor& m_executor;
};

/** @brief Pair file names as given with the paths they were found at. */
TransferFiles
MakeTransferFiles(const StringVector& names, const StringVector& localPaths);
}

#endif
