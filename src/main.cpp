#include <cstdlib>
#include <iostream>
#include <memory>

#include <boost/exception/all.hpp>

#include <clusterdist/config.hpp>
#include <clusterdist/driver.hpp>
#include <clusterdist/dry_run_remote.hpp>
#include <clusterdist/log.hpp>
#include <clusterdist/process_remote.hpp>
#include <clusterdist/remote.hpp>
#include <clusterdist/status.hpp>

using namespace clusterdist;

int
main(int argc, char* argv[])
{
  std::shared_ptr<Config> config = std::make_shared<Config>();
  Status status = config->parseParameters(argc, argv);
  if(status != Status::Ok) {
    return StatusToExitCode(status);
  }

  std::shared_ptr<Log> log = std::make_shared<Log>(config);
  auto logger = log->createLogger("main");

  CLUSTERDIST_LOG(logger, Trace)
    << "Starting clusterdist for " << config->getNodeCount() << " node(s) in "
    << (config->hasCommand() ? "command mode" : "distribute mode")
    << (config->isDryRun() ? " (dry run)" : "");

  std::unique_ptr<RemoteExecutor> executor;
  std::unique_ptr<PowerSwitch> powerSwitch;
  std::unique_ptr<Pacer> pacer;

  if(config->isDryRun()) {
    executor = std::make_unique<DryRunRemoteExecutor>(config, log);
    powerSwitch = std::make_unique<DryRunPowerSwitch>(config, log);
    pacer = std::make_unique<DryRunPacer>(log);
  } else {
    executor = std::make_unique<ProcessRemoteExecutor>(config, log);
    powerSwitch = std::make_unique<ProcessPowerSwitch>(config, log);
    pacer = std::make_unique<ThreadPacer>();
  }

  try {
    Driver driver(config, log, *executor, *powerSwitch, *pacer);
    status = driver.run();
  } catch(const boost::exception& e) {
    CLUSTERDIST_LOG(logger, Fatal)
      << "Encountered boost exception which was not catched until main()! "
         "Diagnostics info: "
      << boost::diagnostic_information(e);
    return EXIT_FAILURE;
  } catch(std::exception& e) {
    CLUSTERDIST_LOG(logger, Fatal)
      << "Encountered exception which was not catched until main()! Message: "
      << e.what();
    return EXIT_FAILURE;
  }

  CLUSTERDIST_LOG(logger, Trace) << "Ending clusterdist with " << status;
  return StatusToExitCode(status);
}
