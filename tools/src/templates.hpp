// Built-in templates for the generated conformance suite.
//
// `suite_main` is substituted with {{PLACEHOLDER}} tokens, since the C++ it
// contains is full of braces. The per-case partials are fmt format strings
// with named arguments: name, path, options.
#pragma once

#include <string_view>

namespace jsonconf::codegen::tpl {

inline constexpr std::string_view suite_main = R"(// Generated by jsonconf_codegen from {{INPUT_DIR}}. Do not edit.
// {{FIXTURE_COUNT}} fixtures, {{CASE_COUNT}} test cases.

#include "gentest/attributes.h"
#include "gentest/runner.h"
using namespace gentest::asserts;

#include <json_syntax/decoded_chars.hpp>
#include <json_syntax/parse.hpp>
#include <json_syntax/utf8.hpp>

#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace [[using gentest: suite("{{SUITE}}")]] {{SUITE}} {

namespace {

using json_syntax::parse::Options;

enum class Outcome { Accepted, Rejected };

// Read, decode and parse one fixture. Invalid UTF-8 under strict options and
// parser errors count as rejection; an unreadable fixture fails the test.
Outcome parse_fixture(std::string_view path, const Options &options) {
    std::ifstream file(std::string(path), std::ios::binary);
    if (!file)
        gentest::fail("cannot read fixture '" + std::string(path) + "'");
    const std::string buffer{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

    std::optional<std::string> text;
    if (options.accept_invalid_codepoints)
        text = json_syntax::utf8::decode_lossy(buffer);
    else
        text = json_syntax::utf8::decode_strict(buffer);
    if (!text)
        return Outcome::Rejected;

    const auto result = json_syntax::Value::parse_with(path, json_syntax::decoded_chars(*text), options);
    return result ? Outcome::Accepted : Outcome::Rejected;
}

} // namespace
{{CASES}}
} // namespace {{SUITE}}
)";

inline constexpr std::string_view case_accept = R"(
[[using gentest: test("{name}")]]
void {name}() {{
    EXPECT_TRUE(parse_fixture("{path}", Options::{options}()) == Outcome::Accepted, "{options} options must accept the fixture");
}}
)";

inline constexpr std::string_view case_reject = R"(
[[using gentest: test("{name}")]]
void {name}() {{
    EXPECT_TRUE(parse_fixture("{path}", Options::{options}()) == Outcome::Rejected, "{options} options must reject the fixture");
}}
)";

inline constexpr std::string_view no_cases = "\n// No fixtures matched y_*.json, n_*.json or i_*.json.\n";

} // namespace jsonconf::codegen::tpl
