// Validation of emission blocks before any code is generated.
#pragma once

#include "model.hpp"

#include <functional>
#include <string>
#include <vector>

namespace jsonconf::codegen {

// Names of the test functions rendered for `block`: `<id>` for Y/N,
// `flexible_<id>` and `strict_<id>` for I.
std::vector<std::string> procedure_names(const EmissionBlock &block);

// Check that every identifier is a valid C++ identifier and that no two
// rendered test functions share a name.
// Args:
//  - blocks: classified fixtures, in emission order
//  - report: callback for each diagnostic message
// Returns: true when no diagnostic was reported.
bool validate_blocks(const std::vector<EmissionBlock> &blocks, const std::function<void(const std::string &)> &report);

} // namespace jsonconf::codegen
