#pragma once
#include <cstddef>
#include <string_view>

namespace LuaFusion {

/// Compile-time string passed as a template argument: key<"id">, Field<&T::m, "id">.
/// Lua strings are byte strings, so only char literals are accepted; any byte
/// is allowed because keys are escaped when written.
template <std::size_t N>
struct ConstString {
    char m_data[N + 1] = {};
    static constexpr std::size_t Length = N;

    constexpr ConstString(const char (&text)[N + 1]) {
        for(std::size_t i = 0; i <= N; i ++) {
            m_data[i] = text[i];
        }
    }
    constexpr std::string_view toStringView() const {
        return {m_data, Length};
    }
};
template <std::size_t N>
ConstString(const char (&text)[N]) -> ConstString<N - 1>;

} // namespace LuaFusion
