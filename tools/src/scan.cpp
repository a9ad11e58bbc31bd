// Implementation of fixture directory enumeration

#include "scan.hpp"

#include <fmt/core.h>
#include <system_error>

namespace jsonconf::codegen {

namespace fs = std::filesystem;

auto scan_fixtures(const fs::path &dir, const std::function<void(const std::string &)> &report)
    -> std::optional<std::vector<FixtureFile>> {
    std::error_code ec;
    const bool exists = fs::exists(dir, ec);
    if (ec) {
        report(fmt::format("failed to access fixture directory '{}': {}", dir.string(), ec.message()));
        return std::nullopt;
    }
    if (!exists) {
        report(fmt::format("fixture directory '{}' does not exist", dir.string()));
        return std::nullopt;
    }
    const bool is_dir = fs::is_directory(dir, ec);
    if (ec) {
        report(fmt::format("failed to access fixture directory '{}': {}", dir.string(), ec.message()));
        return std::nullopt;
    }
    if (!is_dir) {
        report(fmt::format("fixture path '{}' is not a directory", dir.string()));
        return std::nullopt;
    }

    fs::directory_iterator it{dir, ec};
    if (ec) {
        report(fmt::format("failed to read fixture directory '{}': {}", dir.string(), ec.message()));
        return std::nullopt;
    }

    std::vector<FixtureFile> files;
    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec)
            break;
        const auto &entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || type_ec)
            continue;
        files.push_back(FixtureFile{entry.path(), entry.path().filename().string()});
    }
    if (ec) {
        report(fmt::format("failed to read fixture directory '{}': {}", dir.string(), ec.message()));
        return std::nullopt;
    }
    return files;
}

} // namespace jsonconf::codegen
