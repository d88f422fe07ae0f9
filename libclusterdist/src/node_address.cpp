#include "../include/clusterdist/node_address.hpp"
#include "../include/clusterdist/config.hpp"

#include <fmt/format.h>
#include <ostream>

namespace clusterdist {
std::string
NodeAddress::str() const
{
  return fmt::format("{}@{}", user, host);
}

std::ostream&
operator<<(std::ostream& o, const NodeAddress& address)
{
  return o << address.str();
}

NodeAddressing::NodeAddressing(std::string user,
                               std::string hostPrefix,
                               std::string hostSuffix)
  : m_user(std::move(user))
  , m_hostPrefix(std::move(hostPrefix))
  , m_hostSuffix(std::move(hostSuffix))
{}

NodeAddressing::NodeAddressing(const Config& config)
  : NodeAddressing(std::string(config.getString(Config::User)),
                   std::string(config.getString(Config::HostPrefix)),
                   std::string(config.getString(Config::HostSuffix)))
{}

NodeAddress
NodeAddressing::address(NodeIndex index) const
{
  return NodeAddress{ index,
                      fmt::format("{}{}{}", m_hostPrefix, index, m_hostSuffix),
                      m_user };
}

std::vector<NodeIndex>
TargetNodes(NodeIndex count)
{
  std::vector<NodeIndex> nodes;
  nodes.reserve(count);
  for(NodeIndex i = 1; i <= count; ++i) {
    nodes.push_back(i);
  }
  return nodes;
}
}
