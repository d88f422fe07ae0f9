#include <catch2/catch.hpp>
#include <clusterdist/preflight.hpp>

#include "mocks.hpp"

using namespace clusterdist;

TEST_CASE("Preflight finds all files in the current directory", "[preflight]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  TempDirectory cwd, target;
  cwd.createFile("a.txt");
  cwd.createFile("b.txt");
  target.createFile("a.txt");

  PreflightValidator validator(log, cwd.path().string());
  auto result = validator.validate({ "a.txt", "b.txt" }, target.str());

  REQUIRE(result.ok());
  REQUIRE(result.missing.empty());
  REQUIRE(result.resolvedPaths ==
          StringVector{ cwd.str() + "a.txt", cwd.str() + "b.txt" });
}

TEST_CASE("Preflight falls back to the destination directory for all files",
          "[preflight]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  TempDirectory cwd, target;
  // a.txt exists in both roots, b.txt only in the destination. The second
  // pass resolves every file against the destination.
  cwd.createFile("a.txt");
  target.createFile("a.txt");
  target.createFile("b.txt");

  PreflightValidator validator(log, cwd.path().string());
  auto result = validator.validate({ "a.txt", "b.txt" }, target.str());

  REQUIRE(result.ok());
  REQUIRE(result.resolvedPaths ==
          StringVector{ target.str() + "a.txt", target.str() + "b.txt" });
}

TEST_CASE("Preflight does not mix search roots", "[preflight]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  TempDirectory cwd, target;
  cwd.createFile("a.txt");
  target.createFile("b.txt");

  PreflightValidator validator(log, cwd.path().string());
  auto result = validator.validate({ "a.txt", "b.txt" }, target.str());

  REQUIRE(!result.ok());
  REQUIRE(result.status == Status::FileNotFound);
  REQUIRE(result.missing == StringVector{ "a.txt" });
  REQUIRE(result.resolvedPaths.empty());
}

TEST_CASE("Preflight reports every missing file", "[preflight]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  TempDirectory cwd, target;
  cwd.createFile("b.txt");
  target.createFile("b.txt");

  PreflightValidator validator(log, cwd.path().string());
  auto result = validator.validate({ "a.txt", "b.txt", "c.txt" }, target.str());

  REQUIRE(result.status == Status::FileNotFound);
  REQUIRE(result.missing == StringVector{ "a.txt", "c.txt" });
}

TEST_CASE("Preflight only accepts regular files", "[preflight]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  TempDirectory cwd, target;
  cwd.createDirectory("sub");
  target.createDirectory("sub");

  PreflightValidator validator(log, cwd.path().string());
  auto result = validator.validate({ "sub" }, target.str());
  REQUIRE(result.status == Status::FileNotFound);
}

TEST_CASE("Preflight checks absolute paths as given", "[preflight]")
{
  auto [config, status] = ParseArgs({ "a.txt" });
  REQUIRE(status == Status::Ok);
  auto log = MakeLog(config);

  TempDirectory cwd, elsewhere;
  elsewhere.createFile("abs.txt");

  PreflightValidator validator(log, cwd.path().string());
  std::string absolute = elsewhere.str() + "abs.txt";
  auto result = validator.validate({ absolute }, cwd.str());
  REQUIRE(result.ok());
  REQUIRE(result.resolvedPaths == StringVector{ absolute });
}
