#ifndef CLUSTERDIST_PREFLIGHT_HPP
#define CLUSTERDIST_PREFLIGHT_HPP

#include <string>

#include "log.hpp"
#include "status.hpp"
#include "types.hpp"

namespace clusterdist {
/** @brief Outcome of checking the local source files. */
struct PreflightResult
{
  Status status = Status::Ok;

  /** @brief Local paths to copy from, in the order of the input files. Only
   * filled if all files were found. */
  StringVector resolvedPaths;

  /** @brief Files missing from the last searched root. */
  StringVector missing;

  bool ok() const { return status == Status::Ok; }
};

/** @brief Checks that every file to distribute exists locally.
 *
 * Files are first searched in the current working directory. If any of them
 * is missing there, all files are searched again in the destination
 * directory. There is no mixing of both roots.
 */
class PreflightValidator
{
  public:
  /** @param currentDirectory First search root, usually the working directory
   * of the process. */
  PreflightValidator(LogPtr log, std::string currentDirectory);
  explicit PreflightValidator(LogPtr log);
  ~PreflightValidator();

  PreflightResult validate(const StringVector& files,
                           const std::string& workingDirectory) const;

  private:
  bool searchRoot(const StringVector& files,
                  const std::string& root,
                  StringVector& resolved,
                  StringVector& missing) const;

  mutable Logger m_logger;
  std::string m_currentDirectory;
};
}

#endif
