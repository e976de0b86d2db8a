#pragma once

// One subcommand per MCP tool. Each parses its own flags from argv[2..] and prints the
// same text the tool returns. Exit code 0 on success, 1 on usage or configuration errors.
int cmd_search(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_symbol(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_frameworks(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_symbols(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
