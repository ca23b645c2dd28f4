#pragma once

#include "formatter.hpp"

namespace LuaFusion {

/// Writes a Lua table constructor with no extra whitespace:
///   {1,2,{["key"]="value"}}
class CompactFormatter : public BasicFormatter {
public:
    using BasicFormatter::BasicFormatter;

    template<SinkLike S>
    constexpr bool begin_array(S & sink) {
        return sink.put('{');
    }
    template<SinkLike S>
    constexpr bool end_array(S & sink) {
        return sink.put('}');
    }
    template<SinkLike S>
    constexpr bool begin_array_value(S & sink, bool first) {
        if (first) {
            return true;
        }
        return sink.put(',');
    }
    template<SinkLike S>
    constexpr bool end_array_value(S &) {
        return true;
    }

    template<SinkLike S>
    constexpr bool begin_object(S & sink) {
        return sink.put('{');
    }
    template<SinkLike S>
    constexpr bool end_object(S & sink) {
        return sink.put('}');
    }
    template<SinkLike S>
    constexpr bool begin_object_key(S & sink, bool first) {
        if (!first && !sink.put(',')) {
            return false;
        }
        return sink.put('[');
    }
    template<SinkLike S>
    constexpr bool end_object_key(S & sink) {
        return sink.put(']');
    }
    template<SinkLike S>
    constexpr bool begin_object_value(S & sink) {
        return sink.put('=');
    }
    template<SinkLike S>
    constexpr bool end_object_value(S &) {
        return true;
    }
};

static_assert(formatter::FormatterLike<CompactFormatter, StringSink>);
static_assert(formatter::FormatterLike<CompactFormatter, IteratorSink<char*, char*>>);

} // namespace LuaFusion
