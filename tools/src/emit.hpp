// Template-based emission of the conformance suite.
#pragma once

#include "model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace jsonconf::codegen {

// Order blocks by fixture path so output is reproducible across file systems.
void sort_for_emission(std::vector<EmissionBlock> &blocks);

// Render the generated suite as a single C++ translation unit.
// Args:
//  - options: suite name, optional external template path, input directory
//  - blocks: classified and validated fixtures, in emission order
// Returns: the generated source as a string (or nullopt on error)
auto render_suite(const GeneratorOptions &options, const std::vector<EmissionBlock> &blocks) -> std::optional<std::string>;

// Write the rendered content to `options.output_path`, or stdout when it is
// empty. Returns 0 on success.
int emit(const GeneratorOptions &options, const std::vector<EmissionBlock> &blocks);

} // namespace jsonconf::codegen
