#pragma once

#include <cstddef>

#include "formatter.hpp"

namespace LuaFusion {

/// Writes an indented Lua table constructor:
///   {
///     ["key"] = {
///       1,
///       2
///     }
///   }
/// Empty tables stay "{}".
class PrettyFormatter : public BasicFormatter {
    std::size_t m_indent_level = 0;  // Current indentation level
    std::size_t m_indent_size = 2;   // Spaces per indent level
    bool m_has_value = false;        // Current table received at least one entry

    // Helper to write newline + indentation
    template<SinkLike S>
    constexpr bool write_indent(S & sink) {
        if (!sink.put('\n')) return false;
        constexpr char spaces[] = "                ";
        constexpr std::size_t chunk = sizeof(spaces) - 1;
        std::size_t remaining = m_indent_level * m_indent_size;
        while (remaining > 0) {
            std::size_t n = remaining < chunk ? remaining : chunk;
            if (!sink.write(spaces, n)) return false;
            remaining -= n;
        }
        return true;
    }

    template<SinkLike S>
    constexpr bool begin_table(S & sink) {
        m_indent_level++;
        m_has_value = false;
        return sink.put('{');
    }

    template<SinkLike S>
    constexpr bool end_table(S & sink) {
        m_indent_level--;
        if (m_has_value) {
            if (!write_indent(sink)) return false;
        }
        return sink.put('}');
    }

    template<SinkLike S>
    constexpr bool begin_entry(S & sink, bool first) {
        if (!first && !sink.put(',')) {
            return false;
        }
        return write_indent(sink);
    }

public:
    constexpr PrettyFormatter() = default;
    constexpr explicit PrettyFormatter(std::size_t indent_size, NonFinitePolicy policy = NonFinitePolicy::Reject)
        : BasicFormatter(policy), m_indent_size(indent_size) {}

    constexpr std::size_t depth() const {
        return m_indent_level;
    }

    template<SinkLike S>
    constexpr bool begin_array(S & sink) {
        return begin_table(sink);
    }
    template<SinkLike S>
    constexpr bool end_array(S & sink) {
        return end_table(sink);
    }
    template<SinkLike S>
    constexpr bool begin_array_value(S & sink, bool first) {
        return begin_entry(sink, first);
    }
    template<SinkLike S>
    constexpr bool end_array_value(S &) {
        m_has_value = true;
        return true;
    }

    template<SinkLike S>
    constexpr bool begin_object(S & sink) {
        return begin_table(sink);
    }
    template<SinkLike S>
    constexpr bool end_object(S & sink) {
        return end_table(sink);
    }
    template<SinkLike S>
    constexpr bool begin_object_key(S & sink, bool first) {
        if (!begin_entry(sink, first)) return false;
        return sink.put('[');
    }
    template<SinkLike S>
    constexpr bool end_object_key(S & sink) {
        return sink.put(']');
    }
    template<SinkLike S>
    constexpr bool begin_object_value(S & sink) {
        return sink.write(" = ", 3);
    }
    template<SinkLike S>
    constexpr bool end_object_value(S &) {
        m_has_value = true;
        return true;
    }
};

static_assert(formatter::FormatterLike<PrettyFormatter, StringSink>);
static_assert(formatter::FormatterLike<PrettyFormatter, IteratorSink<char*, char*>>);

} // namespace LuaFusion
