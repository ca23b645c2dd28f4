// Enums, std::variant and hand-written descriptions
// Compile: g++ -std=c++23 -I../include tagged_variants.cpp -o tagged_variants

#include <LuaFusion/serializer.hpp>
#include <LuaFusion/error_formatting.hpp>
#include <array>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class Level { Debug, Info, Warn };

struct Circle { double radius; };
struct Rect   { double w, h; };
using Shape = std::variant<std::monostate, Circle, Rect>;

// Money keeps cents internally but is written as a {units, cents} tuple variant
struct Money {
    long long cents;
    std::string currency;
};

template<> struct LuaFusion::EnumNames<Level> {
    static constexpr std::array names{"Debug", "Info", "Warn"};
};

template<> struct LuaFusion::VariantNames<Shape> {
    static constexpr std::array names{"Empty", "Circle", "Rect"};
};

template<> struct LuaFusion::Describe<Money> {
    template<class S>
    static constexpr bool serialize(const Money & m, S & ser) {
        if (m.currency.empty()) {
            return ser.custom_error("currency is required");
        }
        auto tv = ser.serialize_tuple_variant("Money", 0, m.currency, 2);
        if (!tv) {
            return false;
        }
        if (!tv->serialize_element(m.cents / 100) || !tv->serialize_element(m.cents % 100)) {
            return false;
        }
        return std::move(*tv).end();
    }
};

struct Report {
    Level level;
    std::vector<Shape> shapes;
    std::map<Level, int> counts;
    Money total;
};

int main() {
    Report r{
        Level::Warn,
        {Shape{}, Circle{1.5}, Rect{2, 3}},
        {{Level::Info, 3}, {Level::Warn, 1}},
        {1999, "EUR"}
    };

    std::string out;
    auto res = LuaFusion::SerializePretty(r, out);
    if (!res) {
        std::cerr << LuaFusion::SerializeResultToString(res) << std::endl;
        return 1;
    }
    std::cout << out << std::endl;
    /*
    {
      ["level"] = "Warn",
      ["shapes"] = {
        "Empty",
        {
          ["Circle"] = {
            ["radius"] = 1.5
          }
        },
        {
          ["Rect"] = {
            ["w"] = 2.0,
            ["h"] = 3.0
          }
        }
      },
      ["counts"] = {
        ["Info"] = 3,
        ["Warn"] = 1
      },
      ["total"] = {
        ["EUR"] = {
          19,
          99
        }
      }
    }
    */

    r.total.currency.clear();
    res = LuaFusion::Serialize(r, out);
    std::cout << LuaFusion::SerializeResultToString(res) << std::endl;
    /* LuaFusion serialize error: CUSTOM_ERROR: currency is required after ... bytes */
    return res ? 1 : 0;
}
