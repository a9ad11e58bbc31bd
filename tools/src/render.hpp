// Rendering helpers for template partials used by the emitter.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jsonconf::codegen::render {

// Read a main template from disk if provided via CLI. Returns an empty string
// when the file cannot be read; the emitter then falls back to the built-in one.
std::string read_template_file(const std::filesystem::path &path);

// Render the test functions for one fixture: one for Y/N, two for I.
// `tpl_accept`/`tpl_reject` are fmt partials taking name, path and options.
std::string render_block(const EmissionBlock &block, const std::string &tpl_accept, const std::string &tpl_reject);

// Render all blocks in order, concatenated.
std::string render_blocks(const std::vector<EmissionBlock> &blocks, const std::string &tpl_accept, const std::string &tpl_reject);

// Number of test functions `render_blocks` produces for `blocks`.
std::size_t count_procedures(const std::vector<EmissionBlock> &blocks);

// Utility for escaping string literals in generated C++.
std::string escape_string(std::string_view value);

} // namespace jsonconf::codegen::render
