#ifndef CLUSTERDIST_TYPES
#define CLUSTERDIST_TYPES

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace clusterdist {
using NodeIndex = uint16_t;
using StringVector = std::vector<std::string>;

/** @brief Number of nodes the cluster HAT can carry.
 *
 * Powering exactly this many nodes uses the bulk "all" directive of the power
 * controller instead of one call per node.
 */
constexpr NodeIndex MaxNodes = 4;

/** @brief Delay between two per-node power-on calls. */
constexpr std::chrono::milliseconds PowerOnPacingDelay{ 200 };

/** @brief Fixed wait after powering nodes, until they are assumed to be
 * reachable. */
constexpr std::chrono::seconds PowerOnSettleWindow{ 30 };

/** @brief Directive of the power program addressing every node at once. */
constexpr const char* PowerOnAllDirective = "all";

class Config;
class Log;
using ConfigPtr = std::shared_ptr<Config>;
using LogPtr = std::shared_ptr<Log>;
}

#endif
