#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "formatter_concept.hpp"
#include "sink.hpp"

namespace LuaFusion {

namespace formatter_details {

#ifndef LUAFUSION_NUMBER_BUF_SIZE
constexpr std::size_t NumberBufSize = 64;
#else
constexpr std::size_t NumberBufSize = LUAFUSION_NUMBER_BUF_SIZE;
#endif

// -------------------------
//  Format decimal integer
// -------------------------
// Writes base-10 representation of value into [first, last).
// Returns pointer one past last written char.
// Caller guarantees buffer is large enough (e.g. NumberBufSize).
template <class Int>
constexpr char* format_decimal_integer(Int value,
                                       char* first,
                                       char* last) noexcept {
    static_assert(std::is_integral_v<Int>, "[[[ LuaFusion ]]] Int must be an integral type");

    // Digits are generated into the end of the buffer, then moved forward.
    char* p = last;

    using Unsigned = std::make_unsigned_t<Int>;
    Unsigned u;
    bool negative = false;

    if constexpr (std::is_signed_v<Int>) {
        if (value < 0) {
            negative = true;
            // min() handled in the unsigned domain
            u = Unsigned(-(value + 1)) + 1u;
        } else {
            u = static_cast<Unsigned>(value);
        }
    } else {
        u = static_cast<Unsigned>(value);
    }

    do {
        unsigned digit = static_cast<unsigned>(u % 10u);
        u /= 10u;
        *--p = static_cast<char>('0' + digit);
    } while (u != 0);

    if (negative) {
        *--p = '-';
    }

    std::size_t len = static_cast<std::size_t>(last - p);
    for (std::size_t i = 0; i < len; ++i)
        first[i] = p[i];
    return first + len;
}

template<class Float>
constexpr bool is_finite(Float v) {
    return v == v
           && v != std::numeric_limits<Float>::infinity()
           && v != -std::numeric_limits<Float>::infinity();
}

// Shortest representation that reads back to the same bits.
template<class Float>
inline char* format_floating(char* first, char* last, Float value) {
    auto [p, ec] = std::to_chars(first, last, value);
    if (ec != std::errc{}) {
        return first;
    }
    // "1" would read back as a Lua integer
    bool integral_looking = true;
    for (const char* it = first; it != p; ++it) {
        if (*it != '-' && (*it < '0' || *it > '9')) {
            integral_looking = false;
            break;
        }
    }
    if (integral_looking && last - p >= 2) {
        *p++ = '.';
        *p++ = '0';
    }
    return p;
}

} // namespace formatter_details


/// Scalar and string writers shared by CompactFormatter and PrettyFormatter.
/// Structural tokens are supplied by the derived formatter.
class BasicFormatter {
    NonFinitePolicy m_nonFinite = NonFinitePolicy::Reject;

protected:
    template<SinkLike S>
    constexpr bool write_literal(S & sink, std::string_view lit) {
        return sink.write(lit.data(), lit.size());
    }

    template<SinkLike S, class Int>
    constexpr bool write_integer(S & sink, Int v) {
        char buf[formatter_details::NumberBufSize];
        char* p = formatter_details::format_decimal_integer<Int>(v, buf, buf + sizeof(buf));
        return sink.write(buf, static_cast<std::size_t>(p - buf));
    }

    template<SinkLike S, class Float>
    bool write_floating(S & sink, Float v) {
        if (!formatter_details::is_finite(v)) {
            // Only reachable with NonFinitePolicy::Expression, the serializer rejects otherwise
            if (v != v) return write_literal(sink, "0/0");
            if (v > 0)  return write_literal(sink, "1/0");
            return write_literal(sink, "-1/0");
        }
        char buf[formatter_details::NumberBufSize];
        char* p = formatter_details::format_floating(buf, buf + sizeof(buf), v);
        if (p == buf) {
            return false;
        }
        return sink.write(buf, static_cast<std::size_t>(p - buf));
    }

public:
    constexpr BasicFormatter() = default;
    constexpr explicit BasicFormatter(NonFinitePolicy policy): m_nonFinite(policy) {}

    constexpr NonFinitePolicy non_finite_policy() const {
        return m_nonFinite;
    }

    template<SinkLike S>
    constexpr bool write_null(S & sink) {
        return write_literal(sink, "nil");
    }
    template<SinkLike S>
    constexpr bool write_bool(S & sink, bool v) {
        if (v) {
            return write_literal(sink, "true");
        } else {
            return write_literal(sink, "false");
        }
    }

    template<SinkLike S> constexpr bool write_i8 (S & sink, std::int8_t v)   { return write_integer(sink, v); }
    template<SinkLike S> constexpr bool write_i16(S & sink, std::int16_t v)  { return write_integer(sink, v); }
    template<SinkLike S> constexpr bool write_i32(S & sink, std::int32_t v)  { return write_integer(sink, v); }
    template<SinkLike S> constexpr bool write_i64(S & sink, std::int64_t v)  { return write_integer(sink, v); }
    template<SinkLike S> constexpr bool write_u8 (S & sink, std::uint8_t v)  { return write_integer(sink, v); }
    template<SinkLike S> constexpr bool write_u16(S & sink, std::uint16_t v) { return write_integer(sink, v); }
    template<SinkLike S> constexpr bool write_u32(S & sink, std::uint32_t v) { return write_integer(sink, v); }
    template<SinkLike S> constexpr bool write_u64(S & sink, std::uint64_t v) { return write_integer(sink, v); }

    template<SinkLike S> bool write_f32(S & sink, float v)  { return write_floating(sink, v); }
    template<SinkLike S> bool write_f64(S & sink, double v) { return write_floating(sink, v); }

    template<SinkLike S>
    constexpr bool begin_string(S & sink) {
        return sink.put('"');
    }
    template<SinkLike S>
    constexpr bool end_string(S & sink) {
        return sink.put('"');
    }
    template<SinkLike S>
    constexpr bool write_string_fragment(S & sink, std::string_view fragment) {
        return sink.write(fragment.data(), fragment.size());
    }

    /// Writes the escape sequence for one byte the body escaper flagged.
    template<SinkLike S>
    constexpr bool write_char_escape(S & sink, char ch) {
        const unsigned char uc = static_cast<unsigned char>(ch);
        switch (uc) {
        case '"':  return write_literal(sink, "\\\"");
        case '\\': return write_literal(sink, "\\\\");
        case '\a': return write_literal(sink, "\\a");
        case '\b': return write_literal(sink, "\\b");
        case '\t': return write_literal(sink, "\\t");
        case '\n': return write_literal(sink, "\\n");
        case '\v': return write_literal(sink, "\\v");
        case '\f': return write_literal(sink, "\\f");
        case '\r': return write_literal(sink, "\\r");
        default: {
            // Always three digits, a following source digit is never absorbed
            char buf[4] = {
                '\\',
                static_cast<char>('0' + uc / 100),
                static_cast<char>('0' + (uc / 10) % 10),
                static_cast<char>('0' + uc % 10)
            };
            return sink.write(buf, sizeof(buf));
        }
        }
    }
};


namespace formatter_details {

constexpr bool needs_escape(unsigned char uc) {
    return uc == '"' || uc == '\\' || uc < 0x20 || uc == 0x7F;
}

} // namespace formatter_details

/// Escapes the body of a string literal; delimiters are not written.
/// Bytes >= 0x80 are passed through as they are: UTF-8 input is not re-validated.
template<SinkLike S, class Formatter>
constexpr bool format_escaped_str_contents(S & sink, Formatter & formatter, std::string_view value) {
    const char* p = value.data();
    const char* e = value.data() + value.size();

    while (p < e) {
        const char* run = p;
        while (run < e && !formatter_details::needs_escape(static_cast<unsigned char>(*run))) {
            ++run;
        }
        if (run != p) {
            if (!formatter.write_string_fragment(sink, std::string_view(p, static_cast<std::size_t>(run - p)))) {
                return false;
            }
            p = run;
        }
        if (p == e) break;

        if (!formatter.write_char_escape(sink, *p++)) {
            return false;
        }
    }
    return true;
}

template<SinkLike S, class Formatter>
constexpr bool format_escaped_str(S & sink, Formatter & formatter, std::string_view value) {
    if (!formatter.begin_string(sink)) return false;
    if (!format_escaped_str_contents(sink, formatter, value)) return false;
    return formatter.end_string(sink);
}

} // namespace LuaFusion
