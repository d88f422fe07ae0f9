#include "../include/clusterdist/remote.hpp"

#include <ostream>
#include <thread>

namespace clusterdist {
std::ostream&
operator<<(std::ostream& o, const RemoteStatus& status)
{
  if(status.ok()) {
    return o << "ok";
  }
  o << "exit code " << status.exitCode;
  if(!status.error.empty()) {
    o << " (" << status.error << ")";
  }
  return o;
}

void
ThreadPacer::sleepFor(std::chrono::milliseconds duration)
{
  std::this_thread::sleep_for(duration);
}
}
