// Basic LuaFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <LuaFusion/serializer.hpp>
#include <LuaFusion/error_formatting.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace LuaFusion;

struct Config {
    std::string app_name;
    int version;
    bool debug_mode;

    struct Server {
        std::string host;
        int port;
    };
    Server server;
    std::vector<std::string> plugins;
    std::optional<double> timeout;
};

int main() {
    Config config{"MyApp", 1, true, {"localhost", 8080}, {"auth", "cache"}, 2.5};

    std::string lua;
    auto result = Serialize(config, lua);
    if (!result) {
        std::cout << SerializeResultToString(result) << std::endl;
        return 1;
    }
    std::cout << lua << std::endl;
    /* {["app_name"]="MyApp",["version"]=1,["debug_mode"]=true,["server"]={["host"]="localhost",["port"]=8080},["plugins"]={"auth","cache"},["timeout"]=2.5} */

    // A config file Lua can load with dofile()
    std::cout << "return ";
    result = SerializePrettyToStream(config, std::cout);
    std::cout << std::endl;
    if (!result) {
        std::cout << SerializeResultToString(result) << std::endl;
        return 1;
    }
    /*
    return {
      ["app_name"] = "MyApp",
      ["version"] = 1,
      ["debug_mode"] = true,
      ["server"] = {
        ["host"] = "localhost",
        ["port"] = 8080
      },
      ["plugins"] = {
        "auth",
        "cache"
      },
      ["timeout"] = 2.5
    }
    */

    return 0;
}
