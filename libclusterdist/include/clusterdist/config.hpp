#ifndef CLUSTERDIST_CONFIG_HPP
#define CLUSTERDIST_CONFIG_HPP

#include <array>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <cstddef>
#include <string_view>
#include <variant>

#include "status.hpp"
#include "types.hpp"

namespace clusterdist {
/** @brief Store for all options of a single run.
 *
 * Filled from the command line by \ref parseParameters. The node count and the
 * destination directory are validated and normalized there, so every later
 * stage can rely on them.
 */
class Config
{
  public:
  /** Configuration variable differentiator enumeration.
   */
  enum Key
  {
    NodeCount,
    Directory,
    Command,
    Files,
    User,
    HostPrefix,
    HostSuffix,
    PowerProgram,
    ConnectTimeout,

    _KEY_COUNT
  };

  using ConfigVariant =
    std::variant<int32_t, uint32_t, std::string, StringVector>;

  /** @brief Constructor
   */
  Config();
  /** @brief Destructor.
   */
  ~Config();

  /** @brief Parse command line parameters.
   *
   * Help output and parse errors are printed directly, as logging is not set
   * up at this point.
   *
   * @return Status::Ok if program execution may continue, the reason to
   * terminate otherwise.
   */
  Status parseParameters(int argc = 0, char* argv[] = nullptr);

  /** @brief Get a configuration variable with type and key.
   */
  template<typename T>
  inline T& get(Key key)
  {
    return std::get<T>(m_config[key]);
  }
  /** @brief Get a configuration variable with type and key.
   */
  template<typename T>
  inline const T& get(Key key) const
  {
    return std::get<T>(m_config[key]);
  }
  /** @brief Get a std::string configuration variable.
   */
  inline std::string_view getString(Key key) const
  {
    const std::string& str = get<std::string>(key);
    return std::string_view{ str.c_str(), str.size() };
  }
  /** @brief Get an uint32 configuration variable.
   */
  inline uint32_t getUint32(Key key) const { return get<uint32_t>(key); }
  /** @brief Get an int32 configuration variable.
   */
  inline int32_t getInt32(Key key) const { return get<int32_t>(key); }
  /** @brief Get a string vector configuration variable.
   */
  inline const StringVector& getStringVector(Key key) const
  {
    return get<StringVector>(key);
  }

  /** @brief Set a configuration variable.
   */
  inline void set(Key key, ConfigVariant&& val) { m_config[key] = val; }

  /** @brief Number of target nodes, already checked to be in [1, MaxNodes]. */
  inline NodeIndex getNodeCount() const
  {
    return static_cast<NodeIndex>(getInt32(NodeCount));
  }

  /** @brief Check if a remote command was given. Command mode excludes file
   * distribution. */
  inline bool hasCommand() const { return m_hasCommand; }
  /** @brief Check if nodes should be powered on before distributing. */
  inline bool isPowerMode() const { return m_powerMode; }
  /** @brief Check if progress output is requested. */
  inline bool isVerboseMode() const { return m_verboseMode; }
  /** @brief Check if debug mode is active. */
  inline bool isDebugMode() const { return m_debugMode; }
  /** @brief Check if trace mode is active. */
  inline bool isTraceMode() const { return m_traceMode; }
  /** @brief Check if external programs should only be logged. */
  inline bool isDryRun() const { return m_dryRun; }
  /** @brief Check if STDERR should be used for logging instead of STDOUT. */
  inline bool useSTDERRForLogging() const { return m_useSTDERRForLogging; }

  private:
  Status processCommonParameters(
    const boost::program_options::variables_map& map);

  using ConfigArray =
    std::array<ConfigVariant, static_cast<std::size_t>(_KEY_COUNT)>;
  ConfigArray m_config;

  boost::program_options::options_description m_optionsCLI;
  boost::program_options::options_description m_optionsHidden;

  bool m_hasCommand = false;
  bool m_powerMode = false;
  bool m_verboseMode = false;
  bool m_debugMode = false;
  bool m_traceMode = false;
  bool m_dryRun = false;
  bool m_useSTDERRForLogging = false;
};

/** @brief Make a destination directory usable as a path prefix.
 *
 * An empty directory becomes the current working directory. A trailing '/' is
 * appended if absent, so applying this twice yields the same result as once.
 */
std::string
NormalizeDirectory(const std::string& directory);

constexpr const char*
GetConfigNameFromEnum(Config::Key key)
{
  switch(key) {
    case Config::NodeCount:
      return "number";
    case Config::Directory:
      return "directory";
    case Config::Command:
      return "command";
    case Config::Files:
      return "files";
    case Config::User:
      return "user";
    case Config::HostPrefix:
      return "host-prefix";
    case Config::HostSuffix:
      return "host-suffix";
    case Config::PowerProgram:
      return "power-program";
    case Config::ConnectTimeout:
      return "connect-timeout";
    default:
      return "";
  }
}
}

#endif
