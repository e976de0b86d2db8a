#include "xdmcp/search/relevance.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace xdmcp::search;

TEST_CASE("relevance_score adds every applicable bonus", "[search][relevance]") {
  const std::string header =
      "/sdk/System/Library/Frameworks/AppKit.framework/Headers/NSWindow.h";
  // exact name 100 + header 50 + framework headers 30 + prefix 25 + contains 15
  CHECK(relevance_score(header, "NSWindow") == 220);
  CHECK(relevance_score(header, "nswindow") == 220);

  // framework directory named after the query: .h 50 + framework headers 30 + 40
  CHECK(relevance_score(header, "AppKit") == 120);
}

TEST_CASE("relevance_score prefers a header over the same path without the suffix", "[search][relevance]") {
  const std::string base = "/Frameworks/Foundation.framework/Headers/NSWindow";
  CHECK(relevance_score(base + ".h", "NSWindow") > relevance_score(base + ".txt", "NSWindow"));
  CHECK(relevance_score(base + ".h", "NSWindow") - relevance_score(base + ".txt", "NSWindow") == 50);
}

TEST_CASE("relevance_score rewards documentation locations", "[search][relevance]") {
  CHECK(relevance_score("/Developer/Documentation/guide.html", "nothing") == 20);
  CHECK(relevance_score("/cache/AppKit.docarchive/data/nswindow.json", "NSWindow") ==
        100 + 25 + 20 + 15);
  CHECK(relevance_score("/tmp/unrelated.txt", "NSWindow") == 0);
}

TEST_CASE("relevance_score only counts file name matches on the last component", "[search][relevance]") {
  // "Wind" is inside the file name but not at its start.
  CHECK(relevance_score("/x/NSWindow.swift", "Wind") == 50 + 15);
  // The directory mentions the query; the file name does not.
  CHECK(relevance_score("/x/NSWindow/readme.md", "NSWindow") == 0);
}

TEST_CASE("rank_paths sorts by score and keeps ties in discovery order", "[search][relevance]") {
  const std::vector<RankedPath> paths{
      {"/a", 10}, {"/b", 50}, {"/c", 10}, {"/d", 50}, {"/e", 0},
  };

  const auto ranked = rank_paths(paths, 10);
  REQUIRE(ranked.size() == 5);
  CHECK(ranked[0].path == "/b");
  CHECK(ranked[1].path == "/d");
  CHECK(ranked[2].path == "/a");
  CHECK(ranked[3].path == "/c");
  CHECK(ranked[4].path == "/e");

  const auto limited = rank_paths(paths, 2);
  REQUIRE(limited.size() == 2);
  CHECK(limited[1].path == "/d");
}

TEST_CASE("framework_name_from_path and file_type_label", "[search][relevance]") {
  CHECK(framework_name_from_path("/S/Frameworks/AppKit.framework/Headers/NSView.h") == "AppKit");
  CHECK(framework_name_from_path("/S/Frameworks/Loose/file.h") == "Loose");
  CHECK_FALSE(framework_name_from_path("/S/Frameworks/AppKit.framework").has_value());
  CHECK_FALSE(framework_name_from_path("/usr/include/stdio.h").has_value());

  CHECK(file_type_label("/a/NSView.h") == "Objective-C Header");
  CHECK(file_type_label("/a/View.swift") == "Swift Interface");
  CHECK(file_type_label("/a/SwiftUI.swiftinterface") == "Swift Interface");
  CHECK(file_type_label("/a/SwiftUI.docarchive/index.json") == "Documentation");
  CHECK_FALSE(file_type_label("/a/readme.md").has_value());
}

TEST_CASE("format_ranked_entries numbers each entry", "[search][relevance]") {
  const std::vector<RankedPath> ranked{
      {"/S/Frameworks/AppKit.framework/Headers/NSWindow.h", 220},
      {"/docs/notes.txt", 0},
  };

  CHECK(format_ranked_entries(ranked) ==
        "1. [AppKit] - Objective-C Header - NSWindow.h\n"
        "   Path: /S/Frameworks/AppKit.framework/Headers/NSWindow.h\n"
        "\n"
        "2. notes.txt\n"
        "   Path: /docs/notes.txt\n"
        "\n");
  CHECK(format_ranked_entries({}).empty());
}
