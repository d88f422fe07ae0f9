#include "../include/clusterdist/status.hpp"

#include <ostream>

namespace clusterdist {
const char*
StatusToStr(Status status)
{
  switch(status) {
    case Status::Ok:
      return "Ok";
    case Status::ParseError:
      return "ParseError";
    case Status::HelpRequested:
      return "HelpRequested";
    case Status::MissingFileArguments:
      return "MissingFileArguments";
    case Status::NodeCountOutOfRange:
      return "NodeCountOutOfRange";
    case Status::FileNotFound:
      return "FileNotFound";
  }
  return "Unknown Status!";
}

int
StatusToExitCode(Status status)
{
  switch(status) {
    case Status::Ok:
      return 0;
    case Status::ParseError:
      return 1;
    case Status::HelpRequested:
      return 2;
    case Status::MissingFileArguments:
      return 3;
    case Status::NodeCountOutOfRange:
      return 4;
    case Status::FileNotFound:
      return 5;
  }
  return 1;
}

std::ostream&
operator<<(std::ostream& o, Status status)
{
  return o << StatusToStr(status);
}
}
