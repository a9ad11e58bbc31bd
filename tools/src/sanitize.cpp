// Implementation of fixture name to identifier conversion

#include "sanitize.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace jsonconf::codegen {

namespace {
std::string collapse_underscores(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        if (ch == '_' && !out.empty() && out.back() == '_')
            continue;
        out.push_back(ch);
    }
    return out;
}
} // namespace

std::string sanitize_identifier(std::string_view text) {
    std::string out{text};
    replace_all(out, "UTF-8", "utf8");
    replace_all(out, "U+", "u");
    replace_all(out, "+", "_plus_");
    replace_all(out, "-", "_minus_");
    std::replace_if(out.begin(), out.end(), [](char ch) { return ch == '.' || ch == '#'; }, '_');
    return ascii_lower_copy(collapse_underscores(out));
}

bool is_valid_identifier(std::string_view text) {
    if (text.empty())
        return false;
    const auto is_word = [](unsigned char ch) { return std::isalnum(ch) != 0 || ch == '_'; };
    if (std::isdigit(static_cast<unsigned char>(text.front())) != 0)
        return false;
    return std::all_of(text.begin(), text.end(), [&](char ch) {
        const auto uch = static_cast<unsigned char>(ch);
        return uch < 0x80 && is_word(uch);
    });
}

} // namespace jsonconf::codegen
