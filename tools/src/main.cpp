#include "classify.hpp"
#include "emit.hpp"
#include "log.hpp"
#include "model.hpp"
#include "scan.hpp"
#include "validate.hpp"

#include <filesystem>
#include <llvm/Support/CommandLine.h>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using jsonconf::codegen::Category;
using jsonconf::codegen::EmissionBlock;
using jsonconf::codegen::GeneratorOptions;
using jsonconf::codegen::log_err;

#ifndef JSONCONF_TEMPLATE_DIR
#define JSONCONF_TEMPLATE_DIR ""
#endif
static constexpr std::string_view kTemplateDir = JSONCONF_TEMPLATE_DIR;

namespace {

GeneratorOptions parse_arguments(int argc, const char **argv) {
    static llvm::cl::OptionCategory   category{"jsonconf codegen"};
    static llvm::cl::opt<std::string> input_option{"input", llvm::cl::desc("Directory containing {y,n,i}_*.json fixtures"),
                                                   llvm::cl::init("tests/inputs"), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> output_option{"output", llvm::cl::desc("Path to the output source file (default: stdout)"),
                                                    llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> template_option{"template", llvm::cl::desc("Path to the template file used for code generation"),
                                                      llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> suite_option{"suite", llvm::cl::desc("Suite name and namespace of the generated tests"),
                                                   llvm::cl::init("conformance"), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> prefix_option{"path-prefix",
                                                    llvm::cl::desc("Directory written into fixture paths (default: --input)"),
                                                    llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::opt<bool> check_option{"check", llvm::cl::desc("Classify and validate fixtures only; do not emit code"),
                                            llvm::cl::init(false), llvm::cl::cat(category)};
    static llvm::cl::opt<bool> verbose_option{"verbose", llvm::cl::desc("Report fixture counts on stderr"), llvm::cl::init(false),
                                              llvm::cl::cat(category)};

    llvm::cl::HideUnrelatedOptions(category);
    llvm::cl::ParseCommandLineOptions(argc, argv, "jsonconf conformance suite generator\n");

    GeneratorOptions opts;
    opts.input_dir   = std::filesystem::path{input_option.getValue()};
    opts.output_path = std::filesystem::path{output_option.getValue()};
    opts.suite       = suite_option.getValue();
    opts.path_prefix = std::filesystem::path{prefix_option.getValue()};
    opts.check_only  = check_option.getValue();
    opts.verbose     = verbose_option.getValue();
    if (!template_option.getValue().empty()) {
        opts.template_path = std::filesystem::path{template_option.getValue()};
    } else if (!kTemplateDir.empty()) {
        const auto candidate = std::filesystem::path{std::string(kTemplateDir)} / "conformance_suite.cpp.tpl";
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec))
            opts.template_path = candidate;
    }
    return opts;
}

auto collect_blocks(const GeneratorOptions &options) -> std::optional<std::vector<EmissionBlock>> {
    const auto files = jsonconf::codegen::scan_fixtures(
        options.input_dir, [](const std::string &message) { log_err("jsonconf_codegen: {}\n", message); });
    if (!files) {
        return std::nullopt;
    }

    std::vector<EmissionBlock> blocks;
    std::size_t                counts[3] = {0, 0, 0};
    std::size_t                skipped   = 0;
    for (const auto &file : *files) {
        auto block = jsonconf::codegen::classify_fixture(file, options.path_prefix);
        if (!block) {
            ++skipped;
            continue;
        }
        ++counts[static_cast<int>(block->category)];
        blocks.push_back(std::move(*block));
    }

    if (options.verbose) {
        log_err("jsonconf_codegen: {} fixtures in '{}' (y: {}, n: {}, i: {}), {} files skipped\n", blocks.size(),
                options.input_dir.string(), counts[static_cast<int>(Category::Y)], counts[static_cast<int>(Category::N)],
                counts[static_cast<int>(Category::I)], skipped);
    }
    return blocks;
}

} // namespace

int main(int argc, const char **argv) {
    auto options = parse_arguments(argc, argv);
    if (options.path_prefix.empty()) {
        options.path_prefix = options.input_dir;
    }

    auto blocks = collect_blocks(options);
    if (!blocks) {
        return 1;
    }

    jsonconf::codegen::sort_for_emission(*blocks);

    const bool valid = jsonconf::codegen::validate_blocks(
        *blocks, [](const std::string &message) { log_err("jsonconf_codegen: {}\n", message); });
    if (!valid) {
        return 1;
    }

    if (options.check_only) {
        return 0;
    }
    return jsonconf::codegen::emit(options, *blocks);
}
