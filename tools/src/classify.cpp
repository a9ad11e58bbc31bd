// Implementation of fixture file name classification

#include "classify.hpp"

#include "sanitize.hpp"

#include <string>

namespace jsonconf::codegen {

namespace {
constexpr std::string_view kSuffix = ".json";
constexpr std::size_t      kPrefixLength = 2; // "y_", "n_", "i_"
} // namespace

auto classify(std::string_view base_name) -> std::optional<Category> {
    if (base_name.size() < kPrefixLength + kSuffix.size())
        return std::nullopt;
    if (base_name[1] != '_' || !base_name.ends_with(kSuffix))
        return std::nullopt;

    switch (base_name[0]) {
    case 'y': return Category::Y;
    case 'n': return Category::N;
    case 'i': return Category::I;
    default: return std::nullopt;
    }
}

std::string_view fixture_stem(std::string_view base_name) {
    if (base_name.ends_with(kSuffix))
        base_name.remove_suffix(kSuffix.size());
    return base_name;
}

auto classify_fixture(const FixtureFile &file, const std::filesystem::path &path_prefix) -> std::optional<EmissionBlock> {
    const auto category = classify(file.base_name);
    if (!category)
        return std::nullopt;

    EmissionBlock block;
    block.category   = *category;
    block.identifier = sanitize_identifier(fixture_stem(file.base_name));
    block.file_path  = path_prefix.empty() ? file.path.generic_string() : (path_prefix / file.base_name).generic_string();
    return block;
}

} // namespace jsonconf::codegen
