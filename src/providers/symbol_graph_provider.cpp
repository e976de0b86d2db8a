#include "xdmcp/providers/symbol_graph_provider.h"

#include "xdmcp/process/temp_directory.h"

#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace xdmcp::providers {

namespace {

std::string string_member(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return "";
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

std::optional<std::string> declaration_of(const nlohmann::json& symbol) {
  auto fragments = symbol.find("declarationFragments");
  if (fragments == symbol.end() || !fragments->is_array()) {
    return std::nullopt;
  }
  std::string text;
  for (const auto& fragment : *fragments) {
    text += string_member(fragment, "spelling");
  }
  return text;
}

std::optional<std::string> documentation_of(const nlohmann::json& symbol) {
  auto doc = symbol.find("docComment");
  if (doc == symbol.end() || !doc->is_object()) {
    return std::nullopt;
  }
  auto lines = doc->find("lines");
  if (lines == doc->end() || !lines->is_array()) {
    return std::nullopt;
  }
  std::string text;
  bool first = true;
  for (const auto& line : *lines) {
    if (!line.is_object() || !line.contains("text") || !line["text"].is_string()) {
      continue;
    }
    if (!first) {
      text += "\n";
    }
    text += line["text"].get<std::string>();
    first = false;
  }
  return text;
}

}  // namespace

std::vector<SymbolRecord> parse_symbol_graph(const nlohmann::json& document) {
  std::vector<SymbolRecord> records;
  if (!document.is_object()) {
    return records;
  }
  auto symbols = document.find("symbols");
  if (symbols == document.end() || !symbols->is_array()) {
    return records;
  }

  records.reserve(symbols->size());
  for (const auto& symbol : *symbols) {
    if (!symbol.is_object()) {
      continue;
    }
    auto names = symbol.find("names");
    if (names == symbol.end() || !names->is_object()) {
      continue;
    }
    auto title = names->find("title");
    if (title == names->end() || !title->is_string()) {
      continue;
    }

    SymbolRecord record;
    record.title = title->get<std::string>();
    if (auto kind = symbol.find("kind"); kind != symbol.end()) {
      record.kind_identifier = string_member(*kind, "identifier");
      record.kind_display_name = string_member(*kind, "displayName");
    }
    record.declaration_text = declaration_of(symbol);
    record.documentation_text = documentation_of(symbol);
    records.push_back(std::move(record));
  }

  return records;
}

SymbolGraphExtractProvider::SymbolGraphExtractProvider(const process::IProcessRunner& runner,
                                                       std::string target_triple)
    : runner_(runner), target_triple_(std::move(target_triple)) {}

SymbolGraph SymbolGraphExtractProvider::extract(const std::string& module,
                                                const std::string& sdk_root) const {
  if (module.empty() || module.find('/') != std::string::npos) {
    return SymbolGraph::err(ProviderError{"invalid module name '" + module + "'"});
  }

  const auto scratch = process::TempDirectory::create("xdmcp-symbolgraph-");
  if (!scratch.has_value()) {
    return SymbolGraph::err(ProviderError{scratch.error().message});
  }
  const std::string& output_dir = scratch.value().path();

  const auto run = runner_.run({"/usr/bin/xcrun",
                                {"swift-symbolgraph-extract", "-module-name", module, "-target",
                                 target_triple_, "-sdk", sdk_root, "-output-dir", output_dir,
                                 "-minimum-access-level", "public"},
                                process::OutputMode::kDiscard});
  if (!run.has_value()) {
    return SymbolGraph::err(ProviderError{run.error().message});
  }

  const std::string graph_path = output_dir + "/" + module + ".symbols.json";
  std::ifstream in(graph_path);
  if (!in) {
    return SymbolGraph::err(ProviderError{"swift-symbolgraph-extract exited with status " +
                                          std::to_string(run.value().exit_status) +
                                          " and wrote no symbol graph for " + module});
  }

  try {
    const auto document = nlohmann::json::parse(in);
    return SymbolGraph::ok(parse_symbol_graph(document));
  } catch (const nlohmann::json::exception& e) {
    return SymbolGraph::err(ProviderError{"unreadable symbol graph for " + module + ": " +
                                          e.what()});
  }
}

}  // namespace xdmcp::providers
