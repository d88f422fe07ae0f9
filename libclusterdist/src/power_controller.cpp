#include "../include/clusterdist/power_controller.hpp"
#include "../include/clusterdist/node_address.hpp"
#include "../include/clusterdist/remote.hpp"

namespace clusterdist {
PowerController::PowerController(LogPtr log,
                                 PowerSwitch& powerSwitch,
                                 Pacer& pacer)
  : m_logger(log->createLogger("PowerController"))
  , m_powerSwitch(powerSwitch)
  , m_pacer(pacer)
{}
PowerController::~PowerController() {}

void
PowerController::powerOn(NodeIndex count)
{
  if(count == MaxNodes) {
    CLUSTERDIST_LOG(m_logger, Info) << "Powering on all nodes.";
    RemoteStatus status = m_powerSwitch.powerOnAll();
    CLUSTERDIST_LOG(m_logger, Debug) << "Power on all returned " << status;
  } else {
    auto nodes = TargetNodes(count);
    for(auto it = nodes.begin(); it != nodes.end(); ++it) {
      if(it != nodes.begin()) {
        m_pacer.sleepFor(PowerOnPacingDelay);
      }
      CLUSTERDIST_LOG(m_logger, Info) << "Powering on node " << *it << ".";
      RemoteStatus status = m_powerSwitch.powerOn(*it);
      CLUSTERDIST_LOG(m_logger, Debug)
        << "Power on node " << *it << " returned " << status;
    }
  }

  CLUSTERDIST_LOG(m_logger, Info)
    << "Waiting " << PowerOnSettleWindow.count() << "s for nodes to boot.";
  m_pacer.sleepFor(PowerOnSettleWindow);
}
}
