#include "../test_helpers.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
using namespace TestHelpers;

// ============================================================================
// Dynamic sequences
// ============================================================================

static_assert(TestSerialize(std::vector<int>{}, "{}"));
static_assert(TestSerialize(std::vector<int>{1}, "{1}"));
static_assert(TestSerialize(std::vector<int>{1, 2, 3}, "{1,2,3}"));
static_assert(TestSerialize(std::vector<std::string>{"a", "b"}, R"({"a","b"})"));
static_assert(TestSerialize(std::vector<bool>{true, false}, "{true,false}"));
static_assert(TestSerialize(std::vector<std::optional<int>>{1, std::nullopt, 3}, "{1,nil,3}"));

// Nested, with an empty one in the middle
static_assert(TestSerialize(std::vector<std::vector<int>>{{1, 2}, {}, {3}}, "{{1,2},{},{3}}"));

// Length learned only while iterating: still {} when nothing came
static_assert(TestSerialize(UnsizedRange<int>{}, "{}"));
static_assert(TestSerialize(UnsizedRange<int>{{4, 5}}, "{4,5}"));

// N elements, N-1 separators, nothing after the last one
constexpr bool test_separator_count() {
    for (std::size_t n = 1; n < 12; ++n) {
        std::vector<int> v(n, 7);
        std::string out = ToLua(v);
        if (CountStructural(out, ',') != n - 1) return false;
        if (out[out.size() - 2] != '7' || out.back() != '}') return false;
    }
    return true;
}
static_assert(test_separator_count());

// ============================================================================
// Tuples: std::array, C arrays, std::tuple, std::pair
// ============================================================================

static_assert(TestSerialize(std::array<int, 3>{1, 2, 3}, "{1,2,3}"));
static_assert(TestSerialize(std::array<int, 0>{}, "{}"));
static_assert(TestSerialize(std::tuple<int, std::string, bool>{1, "x", true}, R"({1,"x",true})"));
static_assert(TestSerialize(std::pair<int, int>{1, 2}, "{1,2}"));
static_assert(TestSerialize(std::tuple<>{}, "{}"));
static_assert(TestSerialize(std::tuple<std::vector<int>, std::optional<int>>{{}, std::nullopt}, "{{},nil}"));

constexpr bool test_c_array_is_tuple() {
    int values[3] = {7, 8, 9};
    return ToLua(values) == "{7,8,9}";
}
static_assert(test_c_array_is_tuple());

// ============================================================================
// Bytes: a sequence of small integers
// ============================================================================

static_assert(TestSerialize(std::vector<std::byte>{std::byte{1}, std::byte{255}, std::byte{0}}, "{1,255,0}"));
static_assert(TestSerialize(std::array<std::byte, 2>{std::byte{16}, std::byte{32}}, "{16,32}"));
static_assert(TestSerialize(std::vector<std::byte>{}, "{}"));
