// Implementation of template-based emission for the conformance suite

#include "emit.hpp"

#include "log.hpp"
#include "render.hpp"
#include "sanitize.hpp"
#include "templates.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <string_view>

namespace jsonconf::codegen {

namespace {
// The input directory lands in a `//` comment; line breaks would end it.
std::string single_line(std::string text) {
    std::replace_if(text.begin(), text.end(), [](char ch) { return ch == '\n' || ch == '\r'; }, ' ');
    return text;
}
} // namespace

void sort_for_emission(std::vector<EmissionBlock> &blocks) {
    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const EmissionBlock &lhs, const EmissionBlock &rhs) { return lhs.file_path < rhs.file_path; });
}

auto render_suite(const GeneratorOptions &options, const std::vector<EmissionBlock> &blocks) -> std::optional<std::string> {
    if (!is_valid_identifier(options.suite)) {
        log_err("jsonconf_codegen: suite name '{}' is not a valid identifier\n", options.suite);
        return std::nullopt;
    }

    std::string template_content;
    if (!options.template_path.empty()) {
        template_content = render::read_template_file(options.template_path);
        if (template_content.empty()) {
            log_err("jsonconf_codegen: failed to load template file '{}', using built-in template.\n", options.template_path.string());
        }
    }
    if (template_content.empty())
        template_content = std::string(tpl::suite_main);
    if (template_content.find("{{CASES}}") == std::string::npos) {
        log_err("jsonconf_codegen: template file '{}' has no {{{{CASES}}}} placeholder\n", options.template_path.string());
        return std::nullopt;
    }

    const auto tpl_accept = std::string(tpl::case_accept);
    const auto tpl_reject = std::string(tpl::case_reject);

    std::string cases;
    if (blocks.empty()) {
        cases = std::string(tpl::no_cases);
    } else {
        cases = render::render_blocks(blocks, tpl_accept, tpl_reject);
    }

    std::string output = template_content;
    replace_all(output, "{{INPUT_DIR}}", single_line(options.input_dir.generic_string()));
    replace_all(output, "{{FIXTURE_COUNT}}", std::to_string(blocks.size()));
    replace_all(output, "{{CASE_COUNT}}", std::to_string(render::count_procedures(blocks)));
    replace_all(output, "{{SUITE}}", options.suite);
    // Last, so fixture paths containing placeholder text are left alone.
    replace_all(output, "{{CASES}}", cases);
    return output;
}

int emit(const GeneratorOptions &opts, const std::vector<EmissionBlock> &blocks) {
    namespace fs = std::filesystem;

    const auto content = render_suite(opts, blocks);
    if (!content) {
        return 1;
    }

    if (opts.output_path.empty()) {
        llvm::outs() << *content;
        llvm::outs().flush();
        if (llvm::outs().has_error()) {
            log_err("jsonconf_codegen: failed to write to stdout: {}\n", llvm::outs().error().message());
            llvm::outs().clear_error();
            return 1;
        }
        return 0;
    }

    const fs::path out_path = opts.output_path;
    if (out_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            log_err("jsonconf_codegen: failed to create directory '{}': {}\n", out_path.parent_path().string(), ec.message());
            return 1;
        }
    }

    std::ofstream file(out_path, std::ios::binary);
    if (!file) {
        log_err("jsonconf_codegen: failed to open output file '{}'\n", out_path.string());
        return 1;
    }
    file << *content;
    file.close();
    if (!file) {
        log_err("jsonconf_codegen: failed to write output file '{}'\n", out_path.string());
        return 1;
    }
    return 0;
}

} // namespace jsonconf::codegen
