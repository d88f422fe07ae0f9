#include "../include/clusterdist/preflight.hpp"
#include "../include/clusterdist/config.hpp"

#include <boost/filesystem/operations.hpp>

namespace fs = boost::filesystem;

namespace clusterdist {
PreflightValidator::PreflightValidator(LogPtr log, std::string currentDirectory)
  : m_logger(log->createLogger("PreflightValidator"))
  , m_currentDirectory(NormalizeDirectory(currentDirectory))
{}
PreflightValidator::PreflightValidator(LogPtr log)
  : PreflightValidator(log, fs::current_path().string())
{}
PreflightValidator::~PreflightValidator() {}

bool
PreflightValidator::searchRoot(const StringVector& files,
                               const std::string& root,
                               StringVector& resolved,
                               StringVector& missing) const
{
  resolved.clear();
  missing.clear();
  for(const auto& file : files) {
    fs::path path(file);
    if(path.is_relative()) {
      path = fs::path(root) / path;
    }

    boost::system::error_code ec;
    if(fs::is_regular_file(path, ec)) {
      resolved.push_back(path.string());
    } else {
      CLUSTERDIST_LOG(m_logger, Debug)
        << "File \"" << file << "\" not found in " << root;
      missing.push_back(file);
    }
  }
  return missing.empty();
}

PreflightResult
PreflightValidator::validate(const StringVector& files,
                             const std::string& workingDirectory) const
{
  PreflightResult result;

  if(searchRoot(files, m_currentDirectory, result.resolvedPaths, result.missing))
    return result;

  std::string root = NormalizeDirectory(workingDirectory);
  CLUSTERDIST_LOG(m_logger, Debug)
    << result.missing.size() << " file(s) missing in " << m_currentDirectory
    << ", searching all files in " << root;

  if(searchRoot(files, root, result.resolvedPaths, result.missing))
    return result;

  result.resolvedPaths.clear();
  result.status = Status::FileNotFound;
  return result;
}
}
