#include "../test_helpers.hpp"
#include <array>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
using namespace TestHelpers;

struct Point_pretty {
    int x;
    int y;
};

struct Scene_pretty {
    std::string name;
    std::vector<Point_pretty> points;
    std::optional<int> layer;
    std::vector<int> empty;
};

// ============================================================================
// Scalars are unchanged
// ============================================================================

static_assert(TestSerializePretty(42, "42"));
static_assert(TestSerializePretty(std::string("a b"), R"("a b")"));
static_assert(TestSerializePretty(std::optional<int>{}, "nil"));

// ============================================================================
// One entry per line, two spaces per level
// ============================================================================

static_assert(TestSerializePretty(std::vector<int>{}, "{}"));
static_assert(TestSerializePretty(std::vector<int>{1}, "{\n  1\n}"));
static_assert(TestSerializePretty(std::vector<int>{1, 2}, "{\n  1,\n  2\n}"));

static_assert(TestSerializePretty(
    InsertionOrderMap<std::string, int>{{"a", 1}, {"b", 2}},
    "{\n  [\"a\"] = 1,\n  [\"b\"] = 2\n}"
));

static_assert(TestSerializePretty(
    std::vector<std::vector<int>>{{1, 2}, {}, {3}},
    "{\n"
    "  {\n"
    "    1,\n"
    "    2\n"
    "  },\n"
    "  {},\n"
    "  {\n"
    "    3\n"
    "  }\n"
    "}"
));

static_assert(TestSerializePretty(
    Scene_pretty{"s", {{1, 2}}, std::nullopt, {}},
    "{\n"
    "  [\"name\"] = \"s\",\n"
    "  [\"points\"] = {\n"
    "    {\n"
    "      [\"x\"] = 1,\n"
    "      [\"y\"] = 2\n"
    "    }\n"
    "  },\n"
    "  [\"layer\"] = nil,\n"
    "  [\"empty\"] = {}\n"
    "}"
));

// An empty table in last position does not disturb the closing brace
static_assert(TestSerializePretty(
    InsertionOrderMap<int, std::vector<int>>{{1, {}}},
    "{\n  [1] = {}\n}"
));

// ============================================================================
// Indent width
// ============================================================================

static_assert(TestSerializePretty(std::vector<int>{1, 2}, "{\n    1,\n    2\n}", 4));
static_assert(TestSerializePretty(std::vector<std::vector<int>>{{1}}, "{\n{\n1\n}\n}", 0));
static_assert(TestSerializePretty(
    std::vector<std::vector<int>>{{7}},
    "{\n"
    "                    {\n"
    "                                        7\n"
    "                    }\n"
    "}",
    20
));

// ============================================================================
// Only whitespace differs from compact output
// ============================================================================

static_assert(PrettyMatchesCompact(std::vector<int>{1, 2, 3}));
static_assert(PrettyMatchesCompact(std::vector<std::vector<int>>{{}, {1}, {}}));
static_assert(PrettyMatchesCompact(Scene_pretty{"two words", {{1, 2}, {3, 4}}, 5, {9}}));
static_assert(PrettyMatchesCompact(InsertionOrderMap<std::string, std::vector<std::string>>{{"k v", {"a = b", " "}}}));
static_assert(PrettyMatchesCompact(std::tuple<int, std::array<int, 2>, std::optional<int>>{1, {2, 3}, std::nullopt}));

// Strings with whitespace are untouched
static_assert(TestSerializePretty(
    std::vector<std::string>{" a\n"},
    "{\n  \" a\\n\"\n}"
));
