#include "../test_helpers.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
using namespace TestHelpers;

// ============================================================================
// Aggregates: field names are the keys, declaration order is kept
// ============================================================================

struct Point_structs {
    int x;
    int y;
};

struct Line_structs {
    Point_structs from;
    Point_structs to;
    std::string label;
};

struct Optional_structs {
    int id;
    std::optional<std::string> name;
};

struct Containers_structs {
    std::vector<int> values;
    std::vector<Point_structs> points;
};

struct Empty_structs {};

struct HoldsEmpty_structs {
    Empty_structs marker;
    bool flag;
};

static_assert(TestSerialize(Point_structs{1, 2}, R"({["x"]=1,["y"]=2})"));
static_assert(TestSerialize(Point_structs{-1, 0}, R"({["x"]=-1,["y"]=0})"));

static_assert(TestSerialize(
    Line_structs{{1, 2}, {3, 4}, "l"},
    R"({["from"]={["x"]=1,["y"]=2},["to"]={["x"]=3,["y"]=4},["label"]="l"})"
));

static_assert(TestSerialize(Optional_structs{1, std::nullopt}, R"({["id"]=1,["name"]=nil})"));
static_assert(TestSerialize(Optional_structs{1, "ann"}, R"({["id"]=1,["name"]="ann"})"));

static_assert(TestSerialize(Containers_structs{}, R"({["values"]={},["points"]={}})"));
static_assert(TestSerialize(
    Containers_structs{{1, 2}, {{0, 0}}},
    R"({["values"]={1,2},["points"]={{["x"]=0,["y"]=0}}})"
));

// Zero-field structs are unit structs
static_assert(TestSerialize(Empty_structs{}, "nil"));
static_assert(TestSerialize(HoldsEmpty_structs{{}, true}, R"({["marker"]=nil,["flag"]=true})"));

// Structs inside other containers
static_assert(TestSerialize(
    InsertionOrderMap<std::string, Point_structs>{{"origin", {0, 0}}},
    R"({["origin"]={["x"]=0,["y"]=0}})"
));
static_assert(TestSerialize(
    std::vector<std::optional<Point_structs>>{Point_structs{1, 1}, std::nullopt},
    R"({{["x"]=1,["y"]=1},nil})"
));

// Local types work the same way
constexpr bool test_local_struct() {
    struct Local {
        int a;
        bool b;
    };
    return ToLua(Local{5, false}) == R"({["a"]=5,["b"]=false})";
}
static_assert(test_local_struct());

// ============================================================================
// External field lists for classes pfr cannot see into
// ============================================================================

class Account_structs {
    int m_id = 0;
    std::string m_owner;
    std::string m_password;
public:
    constexpr Account_structs(int id, std::string owner, std::string password)
        : m_id(id), m_owner(std::move(owner)), m_password(std::move(password)) {}

    friend struct LuaFusion::StructMeta<Account_structs>;
};

namespace LuaFusion {
template<> struct StructMeta<Account_structs> {
    using Fields = StructFields<
        Field<&Account_structs::m_id, "id">,
        Field<&Account_structs::m_owner, "owner">,
        Field<&Account_structs::m_password, "password", options::exclude>
        >;
};
} // namespace LuaFusion

static_assert(LuaFusion::introspection::has_external_meta<Account_structs>);
static_assert(LuaFusion::introspection::structureElementsCount<Account_structs> == 3);
static_assert(TestSerialize(Account_structs{7, "ann", "secret"}, R"({["id"]=7,["owner"]="ann"})"));
static_assert(TestSerialize(
    std::vector<Account_structs>{Account_structs{1, "a", ""}, Account_structs{2, "b", ""}},
    R"({{["id"]=1,["owner"]="a"},{["id"]=2,["owner"]="b"}})"
));
