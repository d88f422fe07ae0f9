#ifndef CLUSTERDIST_REMOTE_HPP
#define CLUSTERDIST_REMOTE_HPP

#include <chrono>
#include <iosfwd>
#include <string>
#include <utility>

#include "node_address.hpp"
#include "types.hpp"

namespace clusterdist {
/** @brief Result of a single external primitive.
 *
 * Orchestrating components receive this for every call and discard it. A
 * failing node never stops the fan-out to its siblings.
 */
struct RemoteStatus
{
  int exitCode = 0;
  std::string error;

  bool ok() const { return exitCode == 0 && error.empty(); }

  static RemoteStatus success() { return RemoteStatus{}; }
  static RemoteStatus failure(int exitCode, std::string error = "")
  {
    return RemoteStatus{ exitCode, std::move(error) };
  }
};

std::ostream&
operator<<(std::ostream& o, const RemoteStatus& status);

/** @brief Remote directory creation, file copy and command execution on a
 * node.
 */
class RemoteExecutor
{
  public:
  virtual ~RemoteExecutor() = default;

  /** @brief Create the directory tree on the node. Existing directories are
   * no error. */
  virtual RemoteStatus makeDirectory(const NodeAddress& node,
                                     const std::string& directory) = 0;

  /** @brief Copy a local file to the given remote path on the node. */
  virtual RemoteStatus copyFile(const NodeAddress& node,
                                const std::string& localPath,
                                const std::string& remotePath) = 0;

  /** @brief Run a literal command on the node. */
  virtual RemoteStatus execute(const NodeAddress& node,
                               const std::string& command) = 0;
};

/** @brief Power rail control of the cluster HAT. */
class PowerSwitch
{
  public:
  virtual ~PowerSwitch() = default;

  /** @brief Switch on every node with one bulk directive. */
  virtual RemoteStatus powerOnAll() = 0;

  /** @brief Switch on a single node. */
  virtual RemoteStatus powerOn(NodeIndex index) = 0;
};

/** @brief Blocking wait. There is no way to cancel a running wait. */
class Pacer
{
  public:
  virtual ~Pacer() = default;

  virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/** @brief Pacer sleeping on the calling thread. */
class ThreadPacer : public Pacer
{
  public:
  virtual ~ThreadPacer() = default;

  virtual void sleepFor(std::chrono::milliseconds duration) override;
};
}

#endif
