#include "../include/clusterdist/command_line.hpp"
#include "../include/clusterdist/config.hpp"

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>

namespace clusterdist {
CommandLineBuilder::CommandLineBuilder(uint32_t connectTimeout,
                                       std::string powerProgram)
  : m_connectTimeout(connectTimeout)
  , m_powerProgram(std::move(powerProgram))
{}

CommandLineBuilder::CommandLineBuilder(const Config& config)
  : CommandLineBuilder(config.getUint32(Config::ConnectTimeout),
                       std::string(config.getString(Config::PowerProgram)))
{}

void
CommandLineBuilder::addConnectOptions(CommandLine& cl) const
{
  if(m_connectTimeout > 0) {
    cl.push_back("-o");
    cl.push_back(fmt::format("ConnectTimeout={}", m_connectTimeout));
  }
}

CommandLine
CommandLineBuilder::makeDirectory(const NodeAddress& node,
                                  const std::string& directory) const
{
  CommandLine cl{ "ssh" };
  addConnectOptions(cl);
  cl.push_back(node.str());
  cl.push_back("mkdir -p " + ShellQuote(directory));
  return cl;
}

CommandLine
CommandLineBuilder::copyFile(const NodeAddress& node,
                             const std::string& localPath,
                             const std::string& remotePath) const
{
  CommandLine cl{ "scp" };
  addConnectOptions(cl);
  cl.push_back(localPath);
  cl.push_back(fmt::format("{}:{}", node.str(), remotePath));
  return cl;
}

CommandLine
CommandLineBuilder::execute(const NodeAddress& node,
                            const std::string& command) const
{
  CommandLine cl{ "ssh" };
  addConnectOptions(cl);
  cl.push_back(node.str());
  cl.push_back(command);
  return cl;
}

CommandLine
CommandLineBuilder::powerOnAll() const
{
  return { m_powerProgram, "on", PowerOnAllDirective };
}

CommandLine
CommandLineBuilder::powerOn(NodeIndex index) const
{
  return { m_powerProgram, "on", fmt::format("p{}", index) };
}

std::string
ShellQuote(const std::string& str)
{
  std::string quoted = "'";
  for(char c : str) {
    if(c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

std::string
CommandLineToString(const CommandLine& cl)
{
  return boost::algorithm::join(cl, " ");
}
}
