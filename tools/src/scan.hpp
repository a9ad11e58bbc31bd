// Fixture directory enumeration.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jsonconf::codegen {

// List the regular files directly inside `dir` (no recursion).
// Entries are returned in the order the file system reports them.
// Returns nullopt and reports a diagnostic if the directory is missing,
// is not a directory, or cannot be read.
auto scan_fixtures(const std::filesystem::path &dir, const std::function<void(const std::string &)> &report)
    -> std::optional<std::vector<FixtureFile>>;

} // namespace jsonconf::codegen
