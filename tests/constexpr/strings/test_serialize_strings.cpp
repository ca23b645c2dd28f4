#include "../test_helpers.hpp"
#include <array>
#include <string>
#include <string_view>
using namespace TestHelpers;

// ============================================================================
// Basic String Serialization
// ============================================================================

struct Config_string {
    std::string value;
};

static_assert(TestSerialize(std::string{}, R"("")"));
static_assert(TestSerialize(std::string{"hello"}, R"("hello")"));
static_assert(TestSerialize(std::string_view{"Hello, World!"}, R"("Hello, World!")"));
static_assert(TestSerialize("literal", R"("literal")"));
static_assert(TestSerialize(Config_string{"hello"}, R"({["value"]="hello"})"));

// Fixed buffers stop at the first terminator
static_assert(TestSerialize(std::array<char, 8>{'a', 'b', 'c'}, R"("abc")"));
static_assert(TestSerialize(std::array<char, 3>{'x', 'y', 'z'}, R"("xyz")"));

// ============================================================================
// Delimiter and escape character
// ============================================================================

static_assert(TestSerialize(std::string{R"(say "hi")"}, R"("say \"hi\"")"));
static_assert(TestSerialize(std::string{R"(path\to\file)"}, R"("path\\to\\file")"));
static_assert(TestSerialize(std::string{R"(\")"}, R"("\\\"")"));

// ============================================================================
// Control characters: short escapes where Lua has one
// ============================================================================

static_assert(TestSerialize(std::string{"line1\nline2"}, R"("line1\nline2")"));
static_assert(TestSerialize(std::string{"col1\tcol2"}, R"("col1\tcol2")"));
static_assert(TestSerialize(std::string{"\a\b\t\n\v\f\r"}, R"("\a\b\t\n\v\f\r")"));

// ...and a three digit decimal escape otherwise
static_assert(TestSerialize(std::string{"\x01"}, R"("\001")"));
static_assert(TestSerialize(std::string{"\x1b[0m"}, R"("\027[0m")"));
static_assert(TestSerialize(std::string{"\x1f"}, R"("\031")"));
static_assert(TestSerialize(std::string{"\x7f"}, R"("\127")"));
static_assert(TestSerialize(std::string("a\0b", 3), R"("a\000b")"));

// A digit right after a numeric escape is not absorbed into it
static_assert(TestSerialize(std::string{"\x01" "23"}, R"("\00123")"));

// Delimiter and control character in the same string
static_assert(TestSerialize(std::string{"\"\x02\""}, R"("\"\002\"")"));

// ============================================================================
// Multi-byte sequences pass through untouched
// ============================================================================

static_assert(TestSerialize(std::string{"caf\xC3\xA9"}, "\"caf\xC3\xA9\""));
static_assert(TestSerialize(std::string{"\xE6\x97\xA5\xE6\x9C\xAC"}, "\"\xE6\x97\xA5\xE6\x9C\xAC\""));
// Not re-validated either
static_assert(TestSerialize(std::string{"\xFF\xFE"}, "\"\xFF\xFE\""));

// ============================================================================
// The body escaper works without the delimiters
// ============================================================================

constexpr bool test_body_escaper_without_delimiters() {
    std::string out;
    LuaFusion::StringSink sink(out);
    LuaFusion::CompactFormatter fmt;
    if (!LuaFusion::format_escaped_str_contents(sink, fmt, "a\"b\nc")) {
        return false;
    }
    return out == R"(a\"b\nc)";
}
static_assert(test_body_escaper_without_delimiters());

constexpr bool test_body_escaper_plain_run_is_one_fragment() {
    std::string out;
    LuaFusion::StringSink sink(out);
    LuaFusion::PrettyFormatter fmt;
    if (!LuaFusion::format_escaped_str_contents(sink, fmt, "plain text")) {
        return false;
    }
    return out == "plain text" && sink.bytes_written() == 10;
}
static_assert(test_body_escaper_plain_run_is_one_fragment());

// Escaping every byte once gives back the original characters when unescaped
constexpr bool test_escape_is_faithful() {
    std::string raw;
    for (int c = 0; c < 128; ++c) {
        raw.push_back(static_cast<char>(c));
    }
    std::string out = ToLua(raw);

    // Minimal Lua-style unescape of the produced literal
    std::string back;
    for (std::size_t i = 1; i + 1 < out.size(); ++i) {
        char c = out[i];
        if (c != '\\') {
            back.push_back(c);
            continue;
        }
        char e = out[++i];
        switch (e) {
        case 'a': back.push_back('\a'); break;
        case 'b': back.push_back('\b'); break;
        case 't': back.push_back('\t'); break;
        case 'n': back.push_back('\n'); break;
        case 'v': back.push_back('\v'); break;
        case 'f': back.push_back('\f'); break;
        case 'r': back.push_back('\r'); break;
        case '"': back.push_back('"'); break;
        case '\\': back.push_back('\\'); break;
        default: {
            int v = (e - '0') * 100 + (out[i + 1] - '0') * 10 + (out[i + 2] - '0');
            i += 2;
            back.push_back(static_cast<char>(v));
        }
        }
    }
    return back == raw;
}
static_assert(test_escape_is_faithful());
