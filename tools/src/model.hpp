// Shared model types for jsonconf codegen
//
// These types are passed among scanning, classification, validation and
// emission components to describe fixtures and the tests rendered for them.
#pragma once

#include <filesystem>
#include <string>

namespace jsonconf::codegen {

// Conformance class encoded in a fixture's file name prefix.
// - Y: must parse under strict options
// - N: must be rejected under strict options
// - I: implementation-defined; accepted by flexible, rejected by strict
enum class Category { Y, N, I };

// A file found directly inside the fixture directory.
struct FixtureFile {
    std::filesystem::path path;
    std::string           base_name;
};

// One fixture's worth of rendered output.
// - identifier: sanitized procedure name (without flexible_/strict_ prefixes)
// - category: determines how many procedures are emitted and what they assert
// - file_path: path literal embedded into the generated test
struct EmissionBlock {
    std::string identifier;
    Category    category = Category::Y;
    std::string file_path;
};

// Options consumed by the generator tool entry point.
// - input_dir: directory scanned for fixtures
// - output_path: file to write the generated source into; stdout when empty
// - template_path: optional external template path; if empty, built-in used
// - suite: gentest suite name and enclosing namespace of the generated tests
// - path_prefix: directory written into embedded fixture paths; input_dir when empty
// - check_only: classify and validate without emitting any output
// - verbose: log per-category counts to stderr
struct GeneratorOptions {
    std::filesystem::path input_dir = "tests/inputs";
    std::filesystem::path output_path;
    std::filesystem::path template_path;
    std::string           suite = "conformance";
    std::filesystem::path path_prefix;
    bool                  check_only = false;
    bool                  verbose    = false;
};

} // namespace jsonconf::codegen
