#include "xdmcp/search/documentation_search.h"

#include "fake_providers.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace xdmcp;
using namespace xdmcp::search;

namespace {

constexpr const char* kFoundationDir = "/sdk/System/Library/Frameworks/Foundation.framework";
constexpr const char* kSwiftUIDir = "/sdk/System/Library/Frameworks/SwiftUI.framework";

std::vector<std::string> numbered_paths(int count) {
  std::vector<std::string> paths;
  for (int i = 0; i < count; ++i) {
    paths.push_back("/docs/Documentation/page" + std::to_string(i) + ".html");
  }
  return paths;
}

// The query parameter is gone by the time the caller runs the steps.
std::vector<DiscoveryStep> steps_for(const DocumentationSearch& searcher, std::string query) {
  return searcher.discovery_steps(query, 20);
}

}  // namespace

TEST_CASE("run_discovery_chain honours gates in order", "[search][discovery]") {
  std::vector<std::string> ran;
  const std::vector<DiscoveryStep> steps{
      {"first", nullptr,
       [&ran](DiscoveryResults& results) {
         ran.emplace_back("first");
         results.primary.push_back({"/a", 1});
       }},
      {"skipped", [](const DiscoveryResults& results) { return results.primary.empty(); },
       [&ran](DiscoveryResults&) { ran.emplace_back("skipped"); }},
      {"third", [](const DiscoveryResults& results) { return results.primary.size() == 1; },
       [&ran](DiscoveryResults&) { ran.emplace_back("third"); }},
  };

  const auto results = run_discovery_chain(steps);

  CHECK(results.primary.size() == 1);
  CHECK(ran == std::vector<std::string>{"first", "third"});
}

TEST_CASE("Content search only looks in roots that exist", "[search][discovery]") {
  testing::FakeHost host;
  host.file_system.existing = {"/Dev/Documentation"};
  const DocumentationSearch searcher(host.services,
                                     documentation_roots("/home/u", "/Dev"));

  (void)searcher.search("NSView", 20);

  CHECK(host.content_search.calls == 1);
  CHECK(host.content_search.last_roots == std::vector<std::string>{"/Dev/Documentation"});
  CHECK(host.content_search.last_expression == build_spotlight_query("NSView"));
}

TEST_CASE("Header search runs only while content results are below the limit", "[search][discovery]") {
  testing::FakeHost host;
  host.content_search.paths = numbered_paths(6);
  const DocumentationSearch searcher(host.services, {});

  SECTION("limit reached") {
    (void)searcher.search("page", 6);
    CHECK(host.header_search.list_calls == 0);
  }

  SECTION("limit not reached") {
    (void)searcher.search("page", 7);
    CHECK(host.header_search.list_calls == 1);
    CHECK(host.header_search.last_root == "/sdk/System/Library/Frameworks");
    CHECK(host.header_search.last_max_results == 7);
  }
}

TEST_CASE("Symbol search runs only for fewer than five content results", "[search][discovery]") {
  testing::FakeHost host;
  host.file_system.existing = {kFoundationDir};
  host.symbol_graphs.graphs["Foundation"] = {testing::make_symbol("URL", "swift.struct", "Structure")};
  const DocumentationSearch searcher(host.services, {});

  SECTION("five results skip it") {
    host.content_search.paths = numbered_paths(5);
    (void)searcher.search("URL", 20);
    CHECK(host.symbol_graphs.extracted.empty());
  }

  SECTION("four results run it") {
    host.content_search.paths = numbered_paths(4);
    (void)searcher.search("URL", 20);
    CHECK(host.symbol_graphs.extracted == std::vector<std::string>{"Foundation"});
  }
}

TEST_CASE("Symbol search skips absent frameworks and caps matches", "[search][discovery]") {
  testing::FakeHost host;
  host.file_system.existing = {kFoundationDir, kSwiftUIDir};

  std::vector<providers::SymbolRecord> records;
  for (int i = 0; i < 12; ++i) {
    records.push_back(testing::make_symbol("Thing" + std::to_string(i), "swift.class", "Class"));
  }
  host.symbol_graphs.graphs["Foundation"] = records;
  host.symbol_graphs.graphs["SwiftUI"] = records;

  const DocumentationSearch searcher(host.services, {});
  const std::string query = "thing";
  const auto results = run_discovery_chain(searcher.discovery_steps(query, 20));

  CHECK(results.symbol_matches.size() == kSymbolMatchCap);
  CHECK(host.symbol_graphs.extracted == std::vector<std::string>{"Foundation"});
  CHECK(results.symbol_matches.front().framework == "Foundation");
  CHECK(results.symbol_matches.front().kind == "Class");
}

TEST_CASE("Symbol search moves on when one framework fails to extract", "[search][discovery]") {
  testing::FakeHost host;
  host.file_system.existing = {kFoundationDir, kSwiftUIDir};
  host.symbol_graphs.graphs["SwiftUI"] = {testing::make_symbol("ViewBuilder", "swift.struct", "Structure")};

  const DocumentationSearch searcher(host.services, {});
  const std::string query = "viewbuilder";
  const auto results = run_discovery_chain(searcher.discovery_steps(query, 20));

  CHECK(host.symbol_graphs.extracted == std::vector<std::string>{"Foundation", "SwiftUI"});
  REQUIRE(results.symbol_matches.size() == 1);
  CHECK(results.symbol_matches[0].symbol == "ViewBuilder");
}

TEST_CASE("Discovery steps own their query", "[search][discovery]") {
  testing::FakeHost host;
  host.file_system.existing = {kSwiftUIDir};
  host.symbol_graphs.graphs["SwiftUI"] = {testing::make_symbol("ViewBuilder", "swift.struct", "Structure")};

  const DocumentationSearch searcher(host.services, {});
  const auto steps = steps_for(searcher, std::string("viewbuilder"));
  const auto results = run_discovery_chain(steps);

  CHECK(host.content_search.last_expression == build_spotlight_query("viewbuilder"));
  REQUIRE(results.symbol_matches.size() == 1);
  CHECK(results.symbol_matches[0].symbol == "ViewBuilder");
}

TEST_CASE("Nothing found anywhere gives suggestions", "[search][merge]") {
  testing::FakeHost host;
  const DocumentationSearch searcher(host.services, {});

  CHECK(searcher.search("Zzz", 20) ==
        "No documentation found for 'Zzz'.\n\n"
        "Suggestions:\n"
        "- Try searching for a more specific symbol name\n"
        "- Use get_symbol_info if you know the framework (e.g., Foundation, SwiftUI)\n"
        "- Use list_frameworks to see available frameworks");
}

TEST_CASE("Symbol matches win when content results are scarce", "[search][merge]") {
  DiscoveryResults results;
  results.primary = {{"/docs/a.html", 0}, {"/docs/b.html", 0}};
  results.symbol_matches = {{"Foundation", "URLSession", "Class"}};

  CHECK(merge_discovery_results(results, "URLSession", 20) ==
        "Found 1 symbol(s) matching 'URLSession' across frameworks:\n\n"
        "1. URLSession\n"
        "   Framework: Foundation - Kind: Class\n"
        "\n"
        "Tip: Use get_symbol_info with the module and symbol name for detailed information.");

  results.primary.push_back({"/docs/c.html", 0});
  CHECK(merge_discovery_results(results, "URLSession", 20)
            .starts_with("Documentation search results for 'URLSession':\n\n1. "));
}

TEST_CASE("Header text is appended after ranked content results", "[search][merge]") {
  DiscoveryResults results;
  results.primary = {{"/docs/low.html", 1}, {"/docs/high.html", 9}};
  results.header_text = "SDK header files containing 'x':\n  - AppKit.framework/Headers/x.h";
  results.symbol_matches = {{"Foundation", "X", "Structure"}};

  CHECK(merge_discovery_results(results, "x", 1) ==
        "Documentation search results for 'x':\n\n"
        "## Spotlight Results\n\n"
        "1. high.html\n"
        "   Path: /docs/high.html\n"
        "\n"
        "\n## SDK Header Results\n\n"
        "SDK header files containing 'x':\n  - AppKit.framework/Headers/x.h");

  results.primary.clear();
  CHECK(merge_discovery_results(results, "x", 1) ==
        "Documentation search results for 'x':\n\n"
        "\n## SDK Header Results\n\n"
        "SDK header files containing 'x':\n  - AppKit.framework/Headers/x.h");
}

TEST_CASE("Content results alone are ranked and limited", "[search][merge]") {
  testing::FakeHost host;
  host.content_search.paths = {
      "/docs/Documentation/overview.html",
      "/sdk/System/Library/Frameworks/AppKit.framework/Headers/NSWindow.h",
      "/docs/Documentation/more.html",
  };
  // Three content results with limit 2: header search is skipped, symbol search finds nothing.
  const DocumentationSearch searcher(host.services, {});

  const auto text = searcher.search("NSWindow", 2);
  CHECK(text ==
        "Documentation search results for 'NSWindow':\n\n"
        "1. [AppKit] - Objective-C Header - NSWindow.h\n"
        "   Path: /sdk/System/Library/Frameworks/AppKit.framework/Headers/NSWindow.h\n"
        "\n"
        "2. overview.html\n"
        "   Path: /docs/Documentation/overview.html\n"
        "\n");
}

TEST_CASE("Provider failures count as empty results", "[search][discovery]") {
  testing::FakeHost host;
  host.content_search.error = "mdfind exited with status 1";
  host.header_search.files = {"/sdk/System/Library/Frameworks/AppKit.framework/Headers/NSWindow.h"};
  const DocumentationSearch searcher(host.services, {});

  CHECK(searcher.search("NSWindow", 20) ==
        "Documentation search results for 'NSWindow':\n\n"
        "\n## SDK Header Results\n\n"
        "SDK header files containing 'NSWindow':\n  - AppKit.framework/Headers/NSWindow.h");

  host.header_search.error = "grep failed";
  CHECK(searcher.search("NSWindow", 20).starts_with("No documentation found for 'NSWindow'."));
}

TEST_CASE("build_spotlight_query escapes single quotes", "[search][query]") {
  const auto query = build_spotlight_query("it's");

  CHECK(query.find("kMDItemDisplayName == 'it\\'s'wc") != std::string::npos);
  CHECK(query.find("kMDItemFSName == '*it\\'s*.h'") != std::string::npos);
  CHECK(query.find("kMDItemFSName == '*it\\'s*.swift'") != std::string::npos);
  CHECK(query.find("kMDItemTextContent == '*it\\'s*'wcd") != std::string::npos);
  CHECK(query.find("'public.header'") != std::string::npos);
}

TEST_CASE("documentation_roots lists the per-user cache only with a home directory", "[search][query]") {
  CHECK(documentation_roots("/Users/me", "/Xcode/Developer") ==
        std::vector<std::string>{"/Users/me/Library/Developer/Xcode/DocumentationCache",
                                 "/Xcode/Developer/Documentation",
                                 "/Library/Developer/CommandLineTools/SDKs"});
  CHECK(documentation_roots("", "/Xcode/Developer").size() == 2);
}
