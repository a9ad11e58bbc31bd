// File name classification for conformance fixtures.
#pragma once

#include "model.hpp"

#include <optional>
#include <string_view>

namespace jsonconf::codegen {

// Classify a fixture base name of the form `{y|n|i}_<rest>.json`.
// Matching is case-sensitive and must consume the whole name; anything else
// yields nullopt and is not an error.
auto classify(std::string_view base_name) -> std::optional<Category>;

// Base name without the `.json` suffix for a name accepted by `classify`.
std::string_view fixture_stem(std::string_view base_name);

// Classify a scanned file and build its emission block. The embedded path is
// `path_prefix / base_name` when a prefix is given, else the scanned path.
// Returns nullopt for unclassified files.
auto classify_fixture(const FixtureFile &file, const std::filesystem::path &path_prefix = {}) -> std::optional<EmissionBlock>;

} // namespace jsonconf::codegen
