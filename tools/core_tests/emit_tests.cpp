#include "emit.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

using jsonconf::codegen::Category;
using jsonconf::codegen::EmissionBlock;
using jsonconf::codegen::GeneratorOptions;

namespace fs = std::filesystem;

static std::size_t count_of(std::string_view haystack, std::string_view needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string_view::npos; pos = haystack.find(needle, pos + needle.size()))
        ++count;
    return count;
}

int main() {
    int  failures = 0;
    auto expect   = [&](bool ok, const char *msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    };

    const fs::path root = fs::temp_directory_path() / "jsonconf_emit_tests";
    std::error_code ec;
    fs::remove_all(root, ec);

    const std::vector<EmissionBlock> blocks{{"i_a", Category::I, "tests/inputs/i_a.json"},
                                            {"n_b", Category::N, "tests/inputs/n_b.json"},
                                            {"y_c", Category::Y, "tests/inputs/y_c.json"}};

    {
        GeneratorOptions options;
        options.output_path = root / "nested" / "generated" / "conformance_cases.cpp";
        expect(jsonconf::codegen::emit(options, blocks) == 0, "emit to a fresh nested path succeeds");
        expect(fs::is_directory(root / "nested" / "generated"), "parent directories created");

        std::ifstream     in(options.output_path, std::ios::binary);
        const std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        expect(count_of(content, "[[using gentest: test(") == 4, "written file holds every test");
        expect(count_of(content, "Outcome parse_fixture(") == 1, "written file holds the preamble once");
        expect(content.find("3 fixtures, 4 test cases") != std::string::npos, "written file carries counts");
    }

    {
        GeneratorOptions options;
        options.output_path = root / "nested" / "generated" / "conformance_cases.cpp";
        options.suite       = "bad-suite";
        std::ifstream     in(options.output_path, std::ios::binary);
        const std::string before{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        expect(jsonconf::codegen::emit(options, blocks) == 1, "render failure returns nonzero");
        std::ifstream     again(options.output_path, std::ios::binary);
        const std::string after{std::istreambuf_iterator<char>(again), std::istreambuf_iterator<char>()};
        expect(before == after, "render failure leaves existing output untouched");
    }

    {
        GeneratorOptions options;
        options.output_path = root / "is_a_directory";
        fs::create_directories(options.output_path, ec);
        expect(jsonconf::codegen::emit(options, blocks) == 1, "unopenable output file returns nonzero");
    }

    {
        const fs::path blocker = root / "blocker";
        {
            std::ofstream out(blocker);
            out << "file\n";
        }
        GeneratorOptions options;
        options.output_path = blocker / "sub" / "out.cpp";
        expect(jsonconf::codegen::emit(options, blocks) == 1, "uncreatable parent directory returns nonzero");
    }

    fs::remove_all(root, ec);

    if (failures) {
        std::cerr << "Total failures: " << failures << "\n";
        return 1;
    }
    return 0;
}
