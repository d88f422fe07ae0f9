#include "../include/clusterdist/config.hpp"
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <cstddef>
#include <cstdint>
#include <iostream>

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace clusterdist {
Config::Config()
  : m_optionsCLI("Options")
  , m_optionsHidden("Hidden options")
{
  set(NodeCount, static_cast<int32_t>(MaxNodes));
  set(Directory, NormalizeDirectory(""));
  set(Command, std::string());
  set(Files, StringVector());
  set(User, std::string("pi"));
  set(HostPrefix, std::string("p"));
  set(HostSuffix, std::string(".local"));
  set(PowerProgram, std::string("clusterhat"));
  set(ConnectTimeout, static_cast<uint32_t>(0));

  // clang-format off
  m_optionsCLI.add_options()
    ("help,h", "produce help message")
    ((std::string(GetConfigNameFromEnum(Config::NodeCount)) + ",n").c_str(),
         po::value<int64_t>()->default_value(MaxNodes)->value_name("int"),
         "number of nodes to distribute to (1 to 4)")
    ((std::string(GetConfigNameFromEnum(Config::Directory)) + ",d").c_str(),
         po::value<std::string>()->value_name("path"),
         "destination directory on the nodes, defaults to the current working directory")
    ((std::string(GetConfigNameFromEnum(Config::Command)) + ",c").c_str(),
         po::value<std::string>()->value_name("string"),
         "run the given command on all target nodes and exit, no files are distributed")
    ("power,p", po::bool_switch(&m_powerMode)->default_value(false)->value_name("bool"), "power on the target nodes before distributing")
    ("verbose,v", po::bool_switch(&m_verboseMode)->default_value(false)->value_name("bool"), "verbose mode (activate INFO output)")
    ("debug", po::bool_switch(&m_debugMode)->default_value(false)->value_name("bool"), "debug mode (activate DEBG output)")
    ("trace", po::bool_switch(&m_traceMode)->default_value(false)->value_name("bool"), "trace mode (activate TRCE output)")
    ("dry-run", po::bool_switch(&m_dryRun)->default_value(false)->value_name("bool"), "only log the external commands instead of running them")
    ("log-to-stderr", po::bool_switch(&m_useSTDERRForLogging)->default_value(false)->value_name("bool"), "use stderr for logging and progress output")
    (GetConfigNameFromEnum(Config::User),
         po::value<std::string>()->default_value("pi")->value_name("string"),
         "user to log in as on the nodes")
    (GetConfigNameFromEnum(Config::HostPrefix),
         po::value<std::string>()->default_value("p")->value_name("string"),
         "host name of a node before its index")
    (GetConfigNameFromEnum(Config::HostSuffix),
         po::value<std::string>()->default_value(".local")->value_name("string"),
         "host name of a node after its index")
    (GetConfigNameFromEnum(Config::PowerProgram),
         po::value<std::string>()->default_value("clusterhat")->value_name("string"),
         "program switching node power, called as '<program> on all|p<i>'")
    (GetConfigNameFromEnum(Config::ConnectTimeout),
         po::value<uint32_t>()->default_value(0)->value_name("int"),
         "ssh/scp connect timeout in seconds, 0 waits forever")
    ;

  m_optionsHidden.add_options()
    (GetConfigNameFromEnum(Config::Files),
         po::value<StringVector>()->value_name("string")->multitoken(),
         "files to distribute")
    ;
  // clang-format on
}

Config::~Config() {}

Status
Config::parseParameters(int argc, char** argv)
{
  static char* argv_default[] = { (char*)"", nullptr };
  if(argc == 0 && argv == nullptr) {
    argc = 1;
    argv = argv_default;
  }

  po::positional_options_description positionalOptions;
  positionalOptions.add(GetConfigNameFromEnum(Config::Files), -1);

  po::options_description cliGroup;
  cliGroup.add(m_optionsCLI).add(m_optionsHidden);
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                .options(cliGroup)
                .positional(positionalOptions)
                .run(),
              vm);
    po::notify(vm);
  } catch(const std::exception& e) {
    std::cerr << "Could not parse CLI Parameters! Error: " << e.what()
              << std::endl;
    return Status::ParseError;
  }

  if(vm.count("help")) {
    std::cout << "Usage: clusterdist [options] file..." << std::endl;
    std::cout << m_optionsCLI << std::endl;
    return Status::HelpRequested;
  }
  return processCommonParameters(vm);
}

template<typename T>
inline void
conditionallySetConfigOptionToArray(
  const boost::program_options::variables_map& vm,
  Config::ConfigVariant* arr,
  Config::Key key)
{
  if(vm.count(GetConfigNameFromEnum(key))) {
    arr[key] = vm[GetConfigNameFromEnum(key)].as<T>();
  }
}

Status
Config::processCommonParameters(const boost::program_options::variables_map& vm)
{
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::Directory);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::Command);
  conditionallySetConfigOptionToArray<StringVector>(
    vm, m_config.data(), Config::Files);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::User);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::HostPrefix);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::HostSuffix);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::PowerProgram);
  conditionallySetConfigOptionToArray<uint32_t>(
    vm, m_config.data(), Config::ConnectTimeout);

  // Counts too large for the stored int32 are out of range, not parse errors.
  int64_t nodeCount = vm[GetConfigNameFromEnum(NodeCount)].as<int64_t>();
  if(nodeCount < 1 || nodeCount > MaxNodes) {
    std::cerr << "Number of nodes must be between 1 and " << MaxNodes
              << ", got " << nodeCount << "!" << std::endl;
    return Status::NodeCountOutOfRange;
  }
  m_config[NodeCount] = static_cast<int32_t>(nodeCount);

  m_hasCommand = vm.count(GetConfigNameFromEnum(Config::Command)) > 0;

  // Dry runs only report through the log, so make sure it is visible.
  if(m_dryRun) {
    m_verboseMode = true;
  }

  m_config[Directory] = NormalizeDirectory(get<std::string>(Directory));

  return Status::Ok;
}

std::string
NormalizeDirectory(const std::string& directory)
{
  std::string normalized = directory;
  if(normalized.empty()) {
    normalized = fs::current_path().string();
  }
  if(normalized.back() != '/') {
    normalized += '/';
  }
  return normalized;
}
}
