#include <catch2/catch.hpp>
#include <chrono>
#include <clusterdist/dry_run_remote.hpp>
#include <clusterdist/process_remote.hpp>

#include "mocks.hpp"

using namespace clusterdist;

TEST_CASE("Child processes report their exit code", "[process]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);
  auto logger = log->createLogger("ProcessTest");

  REQUIRE(RunProcess({ "true" }, logger).ok());

  RemoteStatus failed = RunProcess({ "false" }, logger);
  REQUIRE(!failed.ok());
  REQUIRE(failed.exitCode == 1);

  RemoteStatus exited = RunProcess({ "sh", "-c", "exit 3" }, logger);
  REQUIRE(exited.exitCode == 3);
}

TEST_CASE("Spawn failures become a failed status", "[process]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);
  auto logger = log->createLogger("ProcessTest");

  RemoteStatus missing;
  REQUIRE_NOTHROW(missing =
                    RunProcess({ "clusterdist-no-such-program" }, logger));
  REQUIRE(!missing.ok());
  REQUIRE(missing.exitCode == 127);

  RemoteStatus empty = RunProcess({}, logger);
  REQUIRE(!empty.ok());
}

TEST_CASE("Process power switch reports a failing power program",
          "[process]")
{
  auto [config, status] =
    ParseArgs({ "--power-program=false", "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  ProcessPowerSwitch powerSwitch(config, log);
  REQUIRE(powerSwitch.powerOnAll().exitCode == 1);
  REQUIRE(powerSwitch.powerOn(2).exitCode == 1);
}

TEST_CASE("Dry run primitives succeed without doing anything", "[dry-run]")
{
  auto [config, status] = ParseArgs({ "--dry-run", "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  NodeAddressing addressing(*config);
  NodeAddress node = addressing.address(1);

  DryRunRemoteExecutor executor(config, log);
  REQUIRE(executor.makeDirectory(node, "/home/pi/").ok());
  REQUIRE(executor.copyFile(node, "a.txt", "/home/pi/a.txt").ok());
  REQUIRE(executor.execute(node, "uptime").ok());

  DryRunPowerSwitch powerSwitch(config, log);
  REQUIRE(powerSwitch.powerOnAll().ok());
  REQUIRE(powerSwitch.powerOn(3).ok());

  DryRunPacer pacer(log);
  auto start = std::chrono::steady_clock::now();
  pacer.sleepFor(PowerOnSettleWindow);
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}
