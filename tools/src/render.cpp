// Implementation of rendering helpers for templates

#include "render.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iterator>

namespace jsonconf::codegen::render {

std::string read_template_file(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return {};
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string escape_string(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const char ch : value) {
        switch (ch) {
        case '\\': escaped += "\\\\"; break;
        case '\"': escaped += "\\\""; break;
        case '\n': escaped += "\\n"; break;
        case '\r': escaped += "\\r"; break;
        case '\t': escaped += "\\t"; break;
        default:
            // Fixed-width octal so a following digit cannot extend the escape.
            if (static_cast<unsigned char>(ch) < 0x20 || ch == '\x7f')
                escaped += fmt::format("\\{:03o}", static_cast<unsigned char>(ch));
            else
                escaped.push_back(ch);
            break;
        }
    }
    return escaped;
}

namespace {
enum class Expect { Accept, Reject };

std::string format_case(const std::string &tpl, const std::string &name, const std::string &path, std::string_view options) {
    return fmt::format(fmt::runtime(tpl), fmt::arg("name", name), fmt::arg("path", path), fmt::arg("options", options));
}

std::string format_expect(Expect expect, const std::string &tpl_accept, const std::string &tpl_reject, const std::string &name,
                          const std::string &path, std::string_view options) {
    return format_case(expect == Expect::Accept ? tpl_accept : tpl_reject, name, path, options);
}
} // namespace

std::string render_block(const EmissionBlock &block, const std::string &tpl_accept, const std::string &tpl_reject) {
    const std::string path = escape_string(block.file_path);
    switch (block.category) {
    case Category::Y: return format_expect(Expect::Accept, tpl_accept, tpl_reject, block.identifier, path, "strict");
    case Category::N: return format_expect(Expect::Reject, tpl_accept, tpl_reject, block.identifier, path, "strict");
    case Category::I:
        return format_expect(Expect::Accept, tpl_accept, tpl_reject, "flexible_" + block.identifier, path, "flexible") +
               format_expect(Expect::Reject, tpl_accept, tpl_reject, "strict_" + block.identifier, path, "strict");
    }
    return {};
}

std::string render_blocks(const std::vector<EmissionBlock> &blocks, const std::string &tpl_accept, const std::string &tpl_reject) {
    std::string out;
    for (const auto &block : blocks)
        out += render_block(block, tpl_accept, tpl_reject);
    return out;
}

std::size_t count_procedures(const std::vector<EmissionBlock> &blocks) {
    std::size_t count = 0;
    for (const auto &block : blocks)
        count += block.category == Category::I ? 2 : 1;
    return count;
}

} // namespace jsonconf::codegen::render
