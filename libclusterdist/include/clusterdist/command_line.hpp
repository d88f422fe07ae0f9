#ifndef CLUSTERDIST_COMMAND_LINE_HPP
#define CLUSTERDIST_COMMAND_LINE_HPP

#include <string>

#include "node_address.hpp"
#include "types.hpp"

namespace clusterdist {
/** @brief Argument vector of an external program call, program name first. */
using CommandLine = StringVector;

/** @brief Builds the ssh, scp and power program invocations of all remote
 * primitives.
 */
class CommandLineBuilder
{
  public:
  /** @param connectTimeout Seconds passed as ConnectTimeout to ssh and scp, 0
   * leaves the option out.
   * @param powerProgram Program called as "<program> on all|p<i>".
   */
  CommandLineBuilder(uint32_t connectTimeout, std::string powerProgram);
  explicit CommandLineBuilder(const Config& config);

  CommandLine makeDirectory(const NodeAddress& node,
                            const std::string& directory) const;
  CommandLine copyFile(const NodeAddress& node,
                       const std::string& localPath,
                       const std::string& remotePath) const;
  CommandLine execute(const NodeAddress& node,
                      const std::string& command) const;
  CommandLine powerOnAll() const;
  CommandLine powerOn(NodeIndex index) const;

  private:
  void addConnectOptions(CommandLine& cl) const;

  uint32_t m_connectTimeout;
  std::string m_powerProgram;
};

/** @brief Quote a string for the remote POSIX shell ssh hands commands to. */
std::string
ShellQuote(const std::string& str);

/** @brief Render a command line for log output. */
std::string
CommandLineToString(const CommandLine& cl);
}

#endif
