#include <catch2/catch.hpp>
#include <clusterdist/driver.hpp>

#include "mocks.hpp"

using namespace clusterdist;

namespace {
struct DriverFixture
{
  Journal journal;
  RecordingRemoteExecutor executor{ journal };
  RecordingPowerSwitch powerSwitch{ journal };
  RecordingPacer pacer{ journal };
  TempDirectory cwd;

  Status run(std::vector<std::string> args)
  {
    auto [config, status] = ParseArgs(std::move(args));
    if(status != Status::Ok) {
      return status;
    }
    Driver driver(config,
                  MakeLog(config),
                  executor,
                  powerSwitch,
                  pacer,
                  cwd.path().string());
    return driver.run();
  }
};
}

TEST_CASE_METHOD(DriverFixture,
                 "Driver powers, waits and distributes",
                 "[driver]")
{
  cwd.createFile("a.txt");

  REQUIRE(run({ "-n", "3", "-p", "-d", "/home/pi/out", "a.txt" }) ==
          Status::Ok);

  std::string src = cwd.str() + "a.txt";
  REQUIRE(journal == Journal{ "power p1",
                              "sleep 200",
                              "power p2",
                              "sleep 200",
                              "power p3",
                              "sleep 30000",
                              "mkdir pi@p1.local /home/pi/out/",
                              "scp " + src + " pi@p1.local:/home/pi/out/a.txt",
                              "mkdir pi@p2.local /home/pi/out/",
                              "scp " + src + " pi@p2.local:/home/pi/out/a.txt",
                              "mkdir pi@p3.local /home/pi/out/",
                              "scp " + src +
                                " pi@p3.local:/home/pi/out/a.txt" });
}

TEST_CASE_METHOD(DriverFixture,
                 "Driver defaults to all nodes without power",
                 "[driver]")
{
  cwd.createFile("a.txt");
  cwd.createFile("b.txt");

  REQUIRE(run({ "-d", "/out/", "a.txt", "b.txt" }) == Status::Ok);
  REQUIRE(journal.size() == MaxNodes * 3);
  REQUIRE(journal.front() == "mkdir pi@p1.local /out/");
  REQUIRE(journal.back() ==
          "scp " + cwd.str() + "b.txt pi@p4.local:/out/b.txt");
}

TEST_CASE_METHOD(DriverFixture,
                 "Driver powers all nodes with the bulk directive",
                 "[driver]")
{
  cwd.createFile("a.txt");

  REQUIRE(run({ "-p", "-d", "/out/", "a.txt" }) == Status::Ok);
  REQUIRE(journal.at(0) == "power all");
  REQUIRE(journal.at(1) == "sleep 30000");
  REQUIRE(journal.at(2) == "mkdir pi@p1.local /out/");
}

TEST_CASE_METHOD(DriverFixture,
                 "Command mode only broadcasts the command",
                 "[driver]")
{
  REQUIRE(run({ "-c", "uptime", "-p" }) == Status::Ok);
  REQUIRE(journal == Journal{ "ssh pi@p1.local uptime",
                              "ssh pi@p2.local uptime",
                              "ssh pi@p3.local uptime",
                              "ssh pi@p4.local uptime" });
}

TEST_CASE_METHOD(DriverFixture,
                 "Command mode ignores file arguments",
                 "[driver]")
{
  REQUIRE(run({ "-n", "1", "-c", "ls", "missing.txt" }) == Status::Ok);
  REQUIRE(journal == Journal{ "ssh pi@p1.local ls" });
}

TEST_CASE_METHOD(DriverFixture,
                 "Driver requires file arguments without a command",
                 "[driver]")
{
  REQUIRE(run({ "-p" }) == Status::MissingFileArguments);
  REQUIRE(journal.empty());
}

TEST_CASE_METHOD(DriverFixture,
                 "Missing files abort before power and network",
                 "[driver]")
{
  cwd.createFile("a.txt");

  REQUIRE(run({ "-p", "a.txt", "missing.txt" }) == Status::FileNotFound);
  REQUIRE(journal.empty());
}

TEST_CASE_METHOD(DriverFixture,
                 "Invalid node count stops before anything else",
                 "[driver]")
{
  cwd.createFile("a.txt");

  REQUIRE(run({ "-n", "5", "-p", "a.txt" }) == Status::NodeCountOutOfRange);
  REQUIRE(run({ "-n", "5", "-c", "uptime" }) == Status::NodeCountOutOfRange);
  REQUIRE(journal.empty());
}

TEST_CASE_METHOD(DriverFixture,
                 "Driver copies files found in the destination directory",
                 "[driver]")
{
  TempDirectory target;
  target.createFile("only-there.txt");

  REQUIRE(run({ "-n", "1", "-d", target.path().string(), "only-there.txt" }) ==
          Status::Ok);
  REQUIRE(journal == Journal{ "mkdir pi@p1.local " + target.str(),
                              "scp " + target.str() + "only-there.txt pi@p1.local:" +
                                target.str() + "only-there.txt" });
}
