#ifndef CLUSTERDIST_POWER_CONTROLLER_HPP
#define CLUSTERDIST_POWER_CONTROLLER_HPP

#include "log.hpp"
#include "types.hpp"

namespace clusterdist {
class PowerSwitch;
class Pacer;

/** @brief Switches on the target nodes and waits until they should have
 * booted.
 *
 * Powering all \ref MaxNodes nodes uses the bulk directive of the power
 * switch. Fewer nodes are switched on one after another with
 * \ref PowerOnPacingDelay in between, to keep power rail transients apart.
 * Afterwards the controller always waits for \ref PowerOnSettleWindow. Failed
 * power calls are neither retried nor do they stop the sequence.
 */
class PowerController
{
  public:
  PowerController(LogPtr log, PowerSwitch& powerSwitch, Pacer& pacer);
  ~PowerController();

  void powerOn(NodeIndex count);

  private:
  Logger m_logger;
  PowerSwitch& m_powerSwitch;
  Pacer& m_pacer;
};
}

#endif
