#pragma once

#include <concepts>
#include <cstdint>
#include <string_view>

#include "sink.hpp"

namespace LuaFusion {

/// What happens to NaN and +/-infinity, which have no Lua literal.
enum class NonFinitePolicy : std::uint8_t {
    Reject,     // serializer fails with NON_FINITE_FLOAT
    Expression  // 0/0, 1/0, -1/0
};

namespace formatter {

template<typename F, typename S>
concept FormatterLike = SinkLike<S> && requires(F formatter,
                                               const F& const_formatter,
                                               S& sink,
                                               bool first,
                                               std::int8_t i8, std::int16_t i16, std::int32_t i32, std::int64_t i64,
                                               std::uint8_t u8, std::uint16_t u16, std::uint32_t u32, std::uint64_t u64,
                                               float f32, double f64,
                                               std::string_view fragment,
                                               char byte
                                              ) {

    // ========== Policy ==========
    { const_formatter.non_finite_policy() } -> std::same_as<NonFinitePolicy>;

    // ========== Scalars ==========
    { formatter.write_null(sink) } -> std::same_as<bool>;
    { formatter.write_bool(sink, first) } -> std::same_as<bool>;

    { formatter.write_i8(sink, i8) } -> std::same_as<bool>;
    { formatter.write_i16(sink, i16) } -> std::same_as<bool>;
    { formatter.write_i32(sink, i32) } -> std::same_as<bool>;
    { formatter.write_i64(sink, i64) } -> std::same_as<bool>;
    { formatter.write_u8(sink, u8) } -> std::same_as<bool>;
    { formatter.write_u16(sink, u16) } -> std::same_as<bool>;
    { formatter.write_u32(sink, u32) } -> std::same_as<bool>;
    { formatter.write_u64(sink, u64) } -> std::same_as<bool>;
    { formatter.write_f32(sink, f32) } -> std::same_as<bool>;
    { formatter.write_f64(sink, f64) } -> std::same_as<bool>;

    // ========== Strings ==========
    // Delimiters and body are separate so the body escaper can be reused
    { formatter.begin_string(sink) } -> std::same_as<bool>;
    { formatter.end_string(sink) } -> std::same_as<bool>;
    { formatter.write_string_fragment(sink, fragment) } -> std::same_as<bool>;
    { formatter.write_char_escape(sink, byte) } -> std::same_as<bool>;

    // ========== Sequences ==========
    { formatter.begin_array(sink) } -> std::same_as<bool>;
    { formatter.end_array(sink) } -> std::same_as<bool>;
    { formatter.begin_array_value(sink, first) } -> std::same_as<bool>;
    { formatter.end_array_value(sink) } -> std::same_as<bool>;

    // ========== Mappings ==========
    { formatter.begin_object(sink) } -> std::same_as<bool>;
    { formatter.end_object(sink) } -> std::same_as<bool>;
    { formatter.begin_object_key(sink, first) } -> std::same_as<bool>;
    { formatter.end_object_key(sink) } -> std::same_as<bool>;
    { formatter.begin_object_value(sink) } -> std::same_as<bool>;
    { formatter.end_object_value(sink) } -> std::same_as<bool>;
  };

/// Type trait to check if a type satisfies FormatterLike at compile time
template<typename F, typename S>
constexpr bool is_formatter_like_v = FormatterLike<F, S>;


} // namespace formatter

} // namespace LuaFusion
