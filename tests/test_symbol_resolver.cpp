#include "xdmcp/symbols/symbol_resolver.h"

#include "fake_providers.h"

#include <catch2/catch.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace xdmcp;
using namespace xdmcp::symbols;

namespace {

constexpr const char* kSwiftModule =
    "/sdk/System/Library/Frameworks/Foundation.framework/Modules/Foundation.swiftmodule";
constexpr const char* kFoundationHeaders = "/sdk/System/Library/Frameworks/Foundation.framework/Headers";

providers::SymbolRecord documented(std::string title) {
  auto record = testing::make_symbol(std::move(title), "swift.struct", "Structure");
  record.declaration_text = "struct " + record.title;
  record.documentation_text = "A value that identifies a resource.";
  return record;
}

}  // namespace

TEST_CASE("format_symbol renders only the sections that are present", "[symbols][resolver]") {
  CHECK(format_symbol(documented("URL")) ==
        "# URL\n**Kind:** Structure\n\n**Declaration:**\n```swift\nstruct URL\n```"
        "\n\n**Documentation:**\nA value that identifies a resource.");

  CHECK(format_symbol(testing::make_symbol("Bare", "", "")) == "# Bare");
}

TEST_CASE("lookup_swift_symbol prefers a case-insensitive exact match", "[symbols][resolver]") {
  const std::vector<providers::SymbolRecord> records{documented("URLComponents"), documented("URL")};

  const auto lookup = lookup_swift_symbol(records, "Foundation", "url");
  CHECK(lookup.match == SwiftMatch::kExact);
  CHECK(lookup.text.starts_with("# URL\n"));
}

TEST_CASE("lookup_swift_symbol falls back to the first partial match", "[symbols][resolver]") {
  const std::vector<providers::SymbolRecord> records{documented("URLSessionTask"),
                                                     documented("URLSessionConfiguration")};

  const auto lookup = lookup_swift_symbol(records, "Foundation", "URLSession");
  CHECK(lookup.match == SwiftMatch::kPartial);
  CHECK(lookup.text.starts_with("# URLSessionTask\n"));
}

TEST_CASE("lookup_swift_symbol suggests titles sharing a prefix", "[symbols][resolver]") {
  std::vector<providers::SymbolRecord> records;
  for (int i = 0; i < 12; ++i) {
    records.push_back(testing::make_symbol("Dat" + std::to_string(i), "swift.struct", "Structure"));
  }
  records.push_back(testing::make_symbol("Unrelated", "swift.struct", "Structure"));

  const auto lookup = lookup_swift_symbol(records, "Foundation", "DataFormatter");
  CHECK(lookup.match == SwiftMatch::kSuggestions);
  CHECK(lookup.text.starts_with(
      "Symbol 'DataFormatter' not found in Foundation. Did you mean one of these?\n  - Dat0"));
  CHECK(lookup.text.find("Dat9") != std::string::npos);
  CHECK(lookup.text.find("Dat10") == std::string::npos);
  CHECK(lookup.text.find("Unrelated") == std::string::npos);
}

TEST_CASE("lookup_swift_symbol reports a miss", "[symbols][resolver]") {
  const std::vector<providers::SymbolRecord> records{documented("URL")};

  const auto lookup = lookup_swift_symbol(records, "Foundation", "Zebra");
  CHECK(lookup.match == SwiftMatch::kNone);
  CHECK(lookup.text == "Symbol 'Zebra' not found in module 'Foundation'.");
}

TEST_CASE("format_header_hit truncates long context", "[symbols][resolver]") {
  CHECK(format_header_hit("NSObject", "Foundation", "@interface NSObject") ==
        "Found 'NSObject' in Foundation headers:\n\n```objc\n@interface NSObject\n```");

  const std::string long_context(kHeaderContextLimit + 10, 'x');
  const auto text = format_header_hit("X", "M", long_context);
  CHECK(text.find(std::string(kHeaderContextLimit, 'x') + "\n... (truncated)\n```") !=
        std::string::npos);
  CHECK(text.find(std::string(kHeaderContextLimit + 1, 'x')) == std::string::npos);
}

TEST_CASE("An exact Swift match answers without searching headers", "[symbols][resolver]") {
  testing::FakeHost host;
  host.file_system.existing = {kSwiftModule, kFoundationHeaders};
  host.symbol_graphs.graphs["Foundation"] = {documented("URL")};
  host.header_search.context = "URL.h-1-@interface URL";

  const SymbolResolver resolver(host.services);
  const auto text = resolver.get_symbol_info("Foundation", "URL");

  CHECK(text.starts_with("# URL\n**Kind:** Structure"));
  CHECK(host.header_search.context_calls == 0);
}

TEST_CASE("A header hit replaces an inexact Swift answer", "[symbols][resolver]") {
  testing::FakeHost host;
  host.file_system.existing = {kSwiftModule, kFoundationHeaders};
  host.symbol_graphs.graphs["Foundation"] = {documented("NSObjectProtocol")};
  host.header_search.context = "NSObject.h:10:@interface NSObject";

  const SymbolResolver resolver(host.services);
  const auto text = resolver.get_symbol_info("Foundation", "NSObject");

  CHECK(text == "Found 'NSObject' in Foundation headers:\n\n```objc\nNSObject.h:10:@interface NSObject\n```");
  CHECK(host.header_search.context_calls == 1);
  CHECK(host.header_search.last_root == kFoundationHeaders);
}

TEST_CASE("The Swift answer stands when headers have nothing", "[symbols][resolver]") {
  testing::FakeHost host;
  host.file_system.existing = {kSwiftModule, kFoundationHeaders};
  host.symbol_graphs.graphs["Foundation"] = {documented("URL")};

  const SymbolResolver resolver(host.services);
  CHECK(resolver.get_symbol_info("Foundation", "Zebra") ==
        "Symbol 'Zebra' not found in module 'Foundation'.");
  CHECK(host.header_search.context_calls == 1);
}

TEST_CASE("Failed extraction falls through to the headers", "[symbols][resolver]") {
  testing::FakeHost host;
  host.file_system.existing = {kSwiftModule, kFoundationHeaders};

  const SymbolResolver resolver(host.services);

  SECTION("header hit") {
    host.header_search.context = "@interface NSString";
    CHECK(resolver.get_symbol_info("Foundation", "NSString")
              .starts_with("Found 'NSString' in Foundation headers:"));
  }

  SECTION("header miss") {
    CHECK(resolver.get_symbol_info("Foundation", "NSString") ==
          "Symbol 'NSString' not found in Foundation headers.");
  }

  SECTION("header search error") {
    host.header_search.error = "grep exited with status 2";
    CHECK(resolver.get_symbol_info("Foundation", "NSString") ==
          "Symbol 'NSString' not found in Foundation headers.");
  }
}

TEST_CASE("Header-only modules skip symbol extraction", "[symbols][resolver]") {
  testing::FakeHost host;
  host.file_system.existing = {"/sdk/System/Library/Frameworks/IOKit.framework/Headers"};
  host.header_search.context = "IOKitLib.h:5:io_service_get_matching";

  const SymbolResolver resolver(host.services);
  const auto text = resolver.get_symbol_info("IOKit", "io_service_get_matching");

  CHECK(text.starts_with("Found 'io_service_get_matching' in IOKit headers:"));
  CHECK(host.symbol_graphs.extracted.empty());
}

TEST_CASE("An unknown module points at list_frameworks", "[symbols][resolver]") {
  testing::FakeHost host;

  const SymbolResolver resolver(host.services);
  CHECK(resolver.get_symbol_info("Nope", "X") ==
        "Module 'Nope' not found in SDK. Use list_frameworks to see available modules.");
  CHECK(host.symbol_graphs.extracted.empty());
  CHECK(host.header_search.context_calls == 0);
}

TEST_CASE("Module directory helpers", "[symbols][resolver]") {
  CHECK(swift_module_dir("/sdk", "Foundation") == kSwiftModule);
  CHECK(header_dir("/sdk", "Foundation") == kFoundationHeaders);
}
