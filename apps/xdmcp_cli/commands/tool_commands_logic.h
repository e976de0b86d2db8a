#pragma once

#include "xdmcp/core/services.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

// execute_* run one tool body against the given collaborators and print its text.
// They take only interface types, so tests drive them with fakes.
int execute_search(const std::string& query, std::size_t limit,
                   const std::vector<std::string>& documentation_roots,
                   const xdmcp::core::Services& services, std::ostream& out);
int execute_symbol(const std::string& module, const std::string& symbol,
                   const xdmcp::core::Services& services, std::ostream& out);
int execute_frameworks(const std::string& filter, const xdmcp::core::Services& services,
                       std::ostream& out);
int execute_symbols(const std::string& module, const std::string& kind,
                    const xdmcp::core::Services& services, std::ostream& out);
