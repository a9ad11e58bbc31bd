#include "classify.hpp"
#include "validate.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using jsonconf::codegen::Category;
using jsonconf::codegen::EmissionBlock;
using jsonconf::codegen::procedure_names;
using jsonconf::codegen::validate_blocks;

struct Run {
    int failures = 0;
    void expect(bool ok, std::string_view msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    }
};

int main() {
    Run t;

    {
        t.expect(procedure_names({"y_a", Category::Y, "y_a.json"}) == std::vector<std::string>{"y_a"}, "Y has one procedure");
        t.expect(procedure_names({"n_a", Category::N, "n_a.json"}) == std::vector<std::string>{"n_a"}, "N has one procedure");
        t.expect(procedure_names({"i_a", Category::I, "i_a.json"}) == std::vector<std::string>{"flexible_i_a", "strict_i_a"},
                 "I has flexible and strict procedures");
    }

    {
        const std::vector<EmissionBlock> blocks{
            {"y_structure_500_nested_arrays", Category::Y, "in/y_structure_500_nested_arrays.json"},
            {"n_structure_u2060_word_joined", Category::N, "in/n_structure_U+2060_word_joined.json"},
            {"i_string_utf8_invalid_sequence", Category::I, "in/i_string_UTF-8_invalid_sequence.json"},
        };
        std::vector<std::string> diags;
        t.expect(validate_blocks(blocks, [&](const std::string &m) { diags.push_back(m); }), "distinct identifiers validate");
        t.expect(diags.empty(), "distinct identifiers report nothing");
    }

    // Different file names can sanitize to the same identifier
    {
        std::vector<EmissionBlock> blocks;
        for (const char *name : {"n_number_1.0.json", "n_number_1#0.json"}) {
            if (auto block = jsonconf::codegen::classify_fixture({std::string("in/") + name, name}))
                blocks.push_back(*block);
        }
        t.expect(blocks.size() == 2, "both fixtures classified");
        std::vector<std::string> diags;
        t.expect(!validate_blocks(blocks, [&](const std::string &m) { diags.push_back(m); }), "collision fails validation");
        t.expect(diags.size() == 1, "collision reported once");
        if (!diags.empty()) {
            t.expect(diags.front().find("in/n_number_1.0.json") != std::string::npos &&
                         diags.front().find("in/n_number_1#0.json") != std::string::npos,
                     "collision names both fixtures");
        }
    }

    {
        const std::vector<EmissionBlock> blocks{{"space in name", Category::Y, "in/y_space in name.json"},
                                                {"y_ok", Category::Y, "in/y_ok.json"}};
        std::vector<std::string> diags;
        t.expect(!validate_blocks(blocks, [&](const std::string &m) { diags.push_back(m); }), "invalid identifier fails validation");
        t.expect(diags.size() == 1, "only the invalid identifier is reported");
    }

    if (t.failures) {
        std::cerr << "Total failures: " << t.failures << "\n";
        return 1;
    }
    return 0;
}
