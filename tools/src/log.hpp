// stderr logging for jsonconf_codegen.
#pragma once

#include <fmt/format.h>
#include <llvm/Support/raw_ostream.h>

#include <iterator>
#include <utility>

namespace jsonconf::codegen {

template <typename... Args>
void log_err(fmt::format_string<Args...> format_string, Args &&...args) {
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    llvm::errs() << fmt::to_string(buffer);
}

} // namespace jsonconf::codegen
