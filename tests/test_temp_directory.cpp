#include "xdmcp/process/temp_directory.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

using namespace xdmcp::process;
namespace fs = std::filesystem;

TEST_CASE("TempDirectory creates a unique directory and removes it with its contents", "[process][temp_directory]") {
  std::string path;
  {
    auto created = TempDirectory::create("xdmcp-test-");
    REQUIRE(created.has_value());
    path = created.value().path();

    CHECK(fs::is_directory(path));
    CHECK(fs::path(path).filename().string().starts_with("xdmcp-test-"));

    std::ofstream(path + "/Foundation.symbols.json") << "{}";
    fs::create_directory(path + "/nested");
    CHECK(fs::exists(path + "/Foundation.symbols.json"));
  }
  CHECK_FALSE(fs::exists(path));
}

TEST_CASE("TempDirectory names never collide", "[process][temp_directory]") {
  const auto a = TempDirectory::create("xdmcp-test-");
  const auto b = TempDirectory::create("xdmcp-test-");

  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(a.value().path() != b.value().path());
}

TEST_CASE("Moving a TempDirectory transfers ownership", "[process][temp_directory]") {
  std::string path;
  {
    auto created = TempDirectory::create("xdmcp-test-");
    REQUIRE(created.has_value());
    path = created.value().path();

    auto moved = std::move(created);
    REQUIRE(moved.has_value());
    CHECK(moved.value().path() == path);
    CHECK(fs::is_directory(path));
  }
  CHECK_FALSE(fs::exists(path));
}
