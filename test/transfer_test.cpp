#include <catch2/catch.hpp>
#include <clusterdist/broadcaster.hpp>
#include <clusterdist/transfer.hpp>

#include "mocks.hpp"

using namespace clusterdist;

TEST_CASE("Transfers are node-major and file-minor", "[transfer]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  Journal journal;
  RecordingRemoteExecutor executor(journal);
  NodeAddressing addressing("pi", "p", ".local");
  TransferOrchestrator transfer(log, addressing, executor);

  TransferFiles files = MakeTransferFiles({ "a.txt", "b.bin" },
                                          { "/src/a.txt", "/src/b.bin" });
  transfer.distribute(files, "/home/pi/out/", 2);

  REQUIRE(journal ==
          Journal{ "mkdir pi@p1.local /home/pi/out/",
                   "scp /src/a.txt pi@p1.local:/home/pi/out/a.txt",
                   "scp /src/b.bin pi@p1.local:/home/pi/out/b.bin",
                   "mkdir pi@p2.local /home/pi/out/",
                   "scp /src/a.txt pi@p2.local:/home/pi/out/a.txt",
                   "scp /src/b.bin pi@p2.local:/home/pi/out/b.bin" });
}

TEST_CASE("Transfer call counts for every node count", "[transfer]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);
  NodeAddressing addressing("pi", "p", ".local");

  TransferFiles files =
    MakeTransferFiles({ "1", "2", "3" }, { "l/1", "l/2", "l/3" });

  for(NodeIndex count = 1; count <= MaxNodes; ++count) {
    Journal journal;
    RecordingRemoteExecutor executor(journal);
    TransferOrchestrator(log, addressing, executor)
      .distribute(files, "d/", count);

    size_t mkdirs = 0, copies = 0;
    for(const auto& entry : journal) {
      if(entry.rfind("mkdir", 0) == 0)
        ++mkdirs;
      if(entry.rfind("scp", 0) == 0)
        ++copies;
    }
    REQUIRE(mkdirs == count);
    REQUIRE(copies == count * files.size());
  }
}

TEST_CASE("File names are appended to the directory as given", "[transfer]")
{
  auto [config, status] = ParseArgs({ "/tmp/a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  Journal journal;
  RecordingRemoteExecutor executor(journal);
  NodeAddressing addressing("pi", "p", ".local");

  TransferOrchestrator(log, addressing, executor)
    .distribute(MakeTransferFiles({ "/tmp/a.txt" }, { "/tmp/a.txt" }),
                "/home/pi/",
                1);

  REQUIRE(journal ==
          Journal{ "mkdir pi@p1.local /home/pi/",
                   "scp /tmp/a.txt pi@p1.local:/home/pi//tmp/a.txt" });
}

TEST_CASE("An unreachable node does not stop the transfer", "[transfer]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  Journal journal;
  RecordingRemoteExecutor executor(journal);
  executor.failNode(1);
  NodeAddressing addressing("pi", "p", ".local");

  TransferOrchestrator(log, addressing, executor)
    .distribute(MakeTransferFiles({ "a" }, { "./a" }), "/d/", 3);

  REQUIRE(journal == Journal{ "mkdir pi@p1.local /d/",
                              "scp ./a pi@p1.local:/d/a",
                              "mkdir pi@p2.local /d/",
                              "scp ./a pi@p2.local:/d/a",
                              "mkdir pi@p3.local /d/",
                              "scp ./a pi@p3.local:/d/a" });
}

TEST_CASE("Commands are broadcast to every target node in order",
          "[broadcast]")
{
  auto [config, status] = ParseArgs({ "-c", "uptime" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  Journal journal;
  RecordingRemoteExecutor executor(journal);
  executor.failNode(2);
  NodeAddressing addressing("pi", "p", ".local");

  CommandBroadcaster(log, addressing, executor).broadcast("uptime", 3);

  REQUIRE(journal == Journal{ "ssh pi@p1.local uptime",
                              "ssh pi@p2.local uptime",
                              "ssh pi@p3.local uptime" });
}
