// Implementation of emission block validation

#include "validate.hpp"

#include "sanitize.hpp"

#include <fmt/core.h>
#include <map>
#include <utility>

namespace jsonconf::codegen {

std::vector<std::string> procedure_names(const EmissionBlock &block) {
    if (block.category == Category::I)
        return {"flexible_" + block.identifier, "strict_" + block.identifier};
    return {block.identifier};
}

bool validate_blocks(const std::vector<EmissionBlock> &blocks, const std::function<void(const std::string &)> &report) {
    bool                               ok = true;
    std::map<std::string, std::string> owners; // procedure name -> fixture path

    for (const auto &block : blocks) {
        if (!is_valid_identifier(block.identifier)) {
            ok = false;
            report(fmt::format("fixture '{}' yields invalid test name '{}'", block.file_path, block.identifier));
            continue;
        }
        for (auto &name : procedure_names(block)) {
            auto [it, inserted] = owners.emplace(std::move(name), block.file_path);
            if (!inserted) {
                ok = false;
                report(fmt::format("test name '{}' for fixture '{}' collides with fixture '{}'", it->first, block.file_path,
                                   it->second));
            }
        }
    }
    return ok;
}

} // namespace jsonconf::codegen
