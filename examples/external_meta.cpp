#include <LuaFusion/serializer.hpp>
using LuaFusion::Annotated;
using LuaFusion::options::as_array, LuaFusion::options::exclude, LuaFusion::options::key;
#include <iostream>
#include <string>
#include <utility>
using std::cout;
using std::endl;


struct Vec {
    float x = 1, y = 2, z = 3;
};

template<> struct LuaFusion::AnnotatedField<Vec, 1> {
    using Options = OptionsPack<
        exclude
        >;
};

template<> struct LuaFusion::AnnotatedField<Vec, 2> {
    using Options = OptionsPack<
        key<"Z">
        >;
};

// Private members: listed by hand
class Account {
    int m_id;
    std::string m_name;
    std::string m_token;
public:
    Account(int id, std::string name, std::string token):
        m_id(id), m_name(std::move(name)), m_token(std::move(token)) {}

    friend struct LuaFusion::StructMeta<Account>;
};

template<> struct LuaFusion::StructMeta<Account> {
    using Fields = StructFields<
        Field<&Account::m_id, "id">,
        Field<&Account::m_name, "name">,
        Field<&Account::m_token, "token", exclude>
        >;
};


int main() {
    struct TopLevel {
        struct VecInner {
            float x = 4, y = 5, z = 6;
        };
        Annotated<VecInner, as_array> vec1;
        Vec vec2;
    };
    std::string out;
    if (!LuaFusion::Serialize(TopLevel{}, out)) {
        return 1;
    }
    cout << out << endl;
    /* {["vec1"]={4.0,5.0,6.0},["vec2"]={["x"]=1.0,["Z"]=3.0}} */

    if (!LuaFusion::Serialize(Account{7, "ann", "secret"}, out)) {
        return 1;
    }
    cout << out << endl;
    /* {["id"]=7,["name"]="ann"} */
    return 0;
}
