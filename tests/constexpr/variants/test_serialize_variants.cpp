#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
using namespace TestHelpers;
using LuaFusion::SerializeError;

enum class Color_var { Red, Green, Blue };
enum class Raw_var : std::uint8_t { A = 3, B = 200 };

struct Point_var {
    int x;
    int y;
};

using Shape_var = std::variant<std::monostate, int, std::vector<int>, Point_var>;
using Loose_var = std::variant<int, std::string, std::vector<int>>;

// Command carrying every variant form
struct Command_var {
    enum class Kind { Quit, Echo, Move, Rename, Stop } kind;
    std::string text;
    int dx = 0;
    int dy = 0;
};

namespace LuaFusion {
template<> struct EnumNames<Color_var> {
    static constexpr std::array names{"Red", "Green", "Blue"};
};
template<> struct VariantNames<Shape_var> {
    static constexpr std::array names{"Nothing", "Circle", "Poly", "At"};
};
template<> struct Describe<Command_var> {
    template<class S>
    static constexpr bool serialize(const Command_var & c, S & ser) {
        using Kind = Command_var::Kind;
        switch(c.kind) {
        case Kind::Quit:
            return ser.serialize_unit_variant("Command", 0, "Quit");
        case Kind::Echo:
            return ser.serialize_newtype_variant("Command", 1, "Echo", c.text);
        case Kind::Move: {
            auto tv = ser.serialize_tuple_variant("Command", 2, "Move", 2);
            if(!tv || !tv->serialize_element(c.dx) || !tv->serialize_element(c.dy)) {
                return false;
            }
            return std::move(*tv).end();
        }
        case Kind::Rename: {
            auto sv = ser.serialize_struct_variant("Command", 3, "Rename", 1);
            if(!sv || !sv->serialize_field("to", c.text)) {
                return false;
            }
            return std::move(*sv).end();
        }
        case Kind::Stop: {
            auto tv = ser.serialize_tuple_variant("Command", 4, "Stop", 0);
            if(!tv) {
                return false;
            }
            return std::move(*tv).end();
        }
        }
        return ser.custom_error("unknown command kind");
    }
};
} // namespace LuaFusion

// ============================================================================
// Unit variants: the bare name as a string
// ============================================================================

static_assert(TestSerialize(Color_var::Green, R"("Green")"));
static_assert(TestSerialize(std::vector<Color_var>{Color_var::Blue, Color_var::Red}, R"({"Blue","Red"})"));
static_assert(TestSerializeFails(static_cast<Color_var>(7), SerializeError::CUSTOM_ERROR));

constexpr bool test_unnamed_enum_message() {
    std::string out;
    auto res = LuaFusion::Serialize(static_cast<Color_var>(3), out);
    return !res && res.message() == "enum value has no name" && out.empty();
}
static_assert(test_unnamed_enum_message());

// Without names an enum is its underlying integer
static_assert(TestSerialize(Raw_var::B, "200"));
static_assert(TestSerialize(std::vector<Raw_var>{Raw_var::A, Raw_var::B}, "{3,200}"));

// ============================================================================
// std::variant with names: {["Name"]=payload}
// ============================================================================

static_assert(TestSerialize(Shape_var{}, R"("Nothing")"));
static_assert(TestSerialize(Shape_var{5}, R"({["Circle"]=5})"));
static_assert(TestSerialize(Shape_var{std::vector<int>{1, 2}}, R"({["Poly"]={1,2}})"));
static_assert(TestSerialize(Shape_var{std::vector<int>{}}, R"({["Poly"]={}})"));
static_assert(TestSerialize(Shape_var{Point_var{3, 4}}, R"({["At"]={["x"]=3,["y"]=4}})"));

static_assert(TestSerialize(
    std::vector<Shape_var>{Shape_var{}, Shape_var{1}},
    R"({"Nothing",{["Circle"]=1}})"
));

static_assert(TestSerializePretty(Shape_var{5}, "{\n  [\"Circle\"] = 5\n}"));
static_assert(TestSerializePretty(Shape_var{std::vector<int>{}}, "{\n  [\"Poly\"] = {}\n}"));

// Without names only the active alternative is written
static_assert(TestSerialize(Loose_var{42}, "42"));
static_assert(TestSerialize(Loose_var{std::string("s")}, R"("s")"));
static_assert(TestSerialize(Loose_var{std::vector<int>{1}}, "{1}"));

// ============================================================================
// Hand-written variants through Describe
// ============================================================================

using Kind_var = Command_var::Kind;

static_assert(TestSerialize(Command_var{Kind_var::Quit, ""}, R"("Quit")"));
static_assert(TestSerialize(Command_var{Kind_var::Echo, "hi"}, R"({["Echo"]="hi"})"));
static_assert(TestSerialize(Command_var{Kind_var::Move, "", 1, 2}, R"({["Move"]={1,2}})"));
static_assert(TestSerialize(Command_var{Kind_var::Rename, "b"}, R"({["Rename"]={["to"]="b"}})"));
static_assert(TestSerialize(Command_var{Kind_var::Stop, ""}, R"({["Stop"]={}})"));

static_assert(TestSerializePretty(
    Command_var{Kind_var::Move, "", 1, 2},
    "{\n  [\"Move\"] = {\n    1,\n    2\n  }\n}"
));
static_assert(TestSerializePretty(
    Command_var{Kind_var::Rename, "b"},
    "{\n  [\"Rename\"] = {\n    [\"to\"] = \"b\"\n  }\n}"
));
static_assert(TestSerializePretty(Command_var{Kind_var::Stop, ""}, "{\n  [\"Stop\"] = {}\n}"));

static_assert(TestSerialize(
    std::vector<Command_var>{{Kind_var::Quit, ""}, {Kind_var::Move, "", -1, 0}},
    R"({"Quit",{["Move"]={-1,0}}})"
));

static_assert(PrettyMatchesCompact(Command_var{Kind_var::Rename, "a b"}));
static_assert(PrettyMatchesCompact(Shape_var{Point_var{1, 2}}));
