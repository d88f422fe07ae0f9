#ifndef CLUSTERDIST_NODE_ADDRESS_HPP
#define CLUSTERDIST_NODE_ADDRESS_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include "types.hpp"

namespace clusterdist {
/** @brief Connection identity of a single node. */
struct NodeAddress
{
  NodeIndex index;
  std::string host;
  std::string user;

  /** @brief Destination as understood by ssh and scp ("user@host"). */
  std::string str() const;

  bool operator==(const NodeAddress& o) const
  {
    return index == o.index && host == o.host && user == o.user;
  }
};

std::ostream&
operator<<(std::ostream& o, const NodeAddress& address);

/** @brief Derives node addresses from their 1-based index.
 *
 * The host of node i is built as "{prefix}{i}{suffix}", so the defaults give
 * p1.local up to p4.local.
 */
class NodeAddressing
{
  public:
  NodeAddressing(std::string user,
                 std::string hostPrefix,
                 std::string hostSuffix);
  explicit NodeAddressing(const Config& config);

  /** @brief Address of the node with the given index. The index has to be
   * validated by the caller. */
  NodeAddress address(NodeIndex index) const;

  private:
  std::string m_user;
  std::string m_hostPrefix;
  std::string m_hostSuffix;
};

/** @brief Ordered indices of the target set [1, count]. */
std::vector<NodeIndex>
TargetNodes(NodeIndex count);
}

#endif
