// Common string helpers for jsonconf codegen.
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace jsonconf::codegen {

inline std::string ascii_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline void replace_all(std::string &inout, std::string_view needle, std::string_view replacement) {
    if (needle.empty())
        return;
    std::size_t pos = 0;
    while ((pos = inout.find(needle, pos)) != std::string::npos) {
        inout.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
}

} // namespace jsonconf::codegen
