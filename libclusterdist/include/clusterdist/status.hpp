#ifndef CLUSTERDIST_STATUS_HPP
#define CLUSTERDIST_STATUS_HPP

#include <iosfwd>

namespace clusterdist {
/** @brief Outcome of parsing and validating a single run.
 *
 * Remote failures are not part of this enumeration, they are reported through
 * \ref RemoteStatus and never end a run.
 */
enum class Status
{
  Ok,
  ParseError,
  HelpRequested,
  MissingFileArguments,
  NodeCountOutOfRange,
  FileNotFound,
};

const char*
StatusToStr(Status status);

/** @brief Process exit code reported for a status. */
int
StatusToExitCode(Status status);

std::ostream&
operator<<(std::ostream& o, Status status);
}

#endif
