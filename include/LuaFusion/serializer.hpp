#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "compact_formatter.hpp"
#include "compound.hpp"
#include "describe.hpp"
#include "errors.hpp"
#include "formatter.hpp"
#include "formatter_concept.hpp"
#include "io.hpp"
#include "map_key_serializer.hpp"
#include "options.hpp"
#include "pretty_formatter.hpp"
#include "sink.hpp"

#ifndef LUAFUSION_MAX_NESTING_DEPTH
#define LUAFUSION_MAX_NESTING_DEPTH 256
#endif

namespace LuaFusion {

namespace serializer_details {

// Returns the number of bytes written, 0 for surrogates and values past U+10FFFF
constexpr std::size_t encode_utf8(char32_t codepoint, char (&utf8)[4]) {
    const std::uint32_t cp = static_cast<std::uint32_t>(codepoint);
    if (cp <= 0x7Fu) {
        utf8[0] = static_cast<char>(cp);
        return 1;
    } else if (cp <= 0x7FFu) {
        utf8[0] = static_cast<char>(0xC0 | (cp >> 6));
        utf8[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    } else if (cp >= 0xD800u && cp <= 0xDFFFu) {
        return 0;
    } else if (cp <= 0xFFFFu) {
        utf8[0] = static_cast<char>(0xE0 | (cp >> 12));
        utf8[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        utf8[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    } else if (cp <= 0x10FFFFu) {
        utf8[0] = static_cast<char>(0xF0 | (cp >> 18));
        utf8[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        utf8[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        utf8[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

} // namespace serializer_details


/// Walks one value into a sink through a formatter.
///
/// Scalars are written immediately. Sequences, mappings and tagged variants
/// return a Compound that the caller fills and then ends. Every call returns
/// false once something failed, and the first failure is the one reported.
template<SinkLike Sink, class Formatter = CompactFormatter>
    requires formatter::FormatterLike<Formatter, Sink>
class Serializer {
public:
    using sink_type = Sink;
    using formatter_type = Formatter;
    using compound_type = Compound<Serializer>;

private:
    Sink m_sink;
    Formatter m_formatter;
    SerializeError m_error = SerializeError::NO_ERROR;
    std::string m_message;
    std::size_t m_depth = 0;
    std::size_t m_maxDepth = LUAFUSION_MAX_NESTING_DEPTH;
    // Open compounds, and how many of them are inside their own element or value slot.
    // Writes are only legal while every open compound is lending its slot.
    std::size_t m_open = 0;
    std::size_t m_lent = 0;

    template<class> friend class Compound;
    template<class> friend class MapKeySerializer;

    constexpr bool failed() const {
        return m_error != SerializeError::NO_ERROR;
    }
    constexpr bool fail(SerializeError err) {
        if(m_error == SerializeError::NO_ERROR) {
            m_error = err;
        }
        return false;
    }
    constexpr bool sink_failed() {
        return fail(SerializeError::SINK_ERROR);
    }
    constexpr bool ready() {
        if(failed()) {
            return false;
        }
        if(m_open != m_lent) {
            return fail(SerializeError::INTERLEAVED_COMPOUND);
        }
        return true;
    }

    constexpr bool enter() {
        if(m_depth >= m_maxDepth) {
            return fail(SerializeError::MAX_DEPTH_EXCEEDED);
        }
        m_depth ++;
        return true;
    }
    constexpr void leave() {
        m_depth --;
    }

    constexpr std::optional<compound_type> open_compound(serializer_details::CompoundKind kind, std::optional<std::size_t> len) {
        const bool asArray = serializer_details::isArrayKind(kind);
        const bool opened = asArray ? m_formatter.begin_array(m_sink) : m_formatter.begin_object(m_sink);
        if(!opened) {
            sink_failed();
            return std::nullopt;
        }
        if(len && *len == 0) {
            const bool closed = asArray ? m_formatter.end_array(m_sink) : m_formatter.end_object(m_sink);
            if(!closed) {
                sink_failed();
                return std::nullopt;
            }
            m_open ++;
            return compound_type(*this, kind, serializer_details::State::Empty);
        }
        m_open ++;
        return compound_type(*this, kind, serializer_details::State::First);
    }

    // {["variant"]= ... the payload and the closing brace are written by the caller
    constexpr bool begin_variant(std::string_view variant) {
        if(!m_formatter.begin_object(m_sink)) {
            return sink_failed();
        }
        if(!m_formatter.begin_object_key(m_sink, true)) {
            return sink_failed();
        }
        if(!serialize_str(variant)) {
            return false;
        }
        if(!m_formatter.end_object_key(m_sink)) {
            return sink_failed();
        }
        if(!m_formatter.begin_object_value(m_sink)) {
            return sink_failed();
        }
        return true;
    }

public:
    constexpr explicit Serializer(Sink sink, Formatter formatter = Formatter{},
                                  std::size_t maxDepth = LUAFUSION_MAX_NESTING_DEPTH):
        m_sink(std::move(sink)), m_formatter(std::move(formatter)), m_maxDepth(maxDepth) {}

    /// Serializes a complete value through its description
    template<class T>
    constexpr bool serialize(const T & value) {
        if(!ready()) {
            return false;
        }
        const std::size_t depth = m_depth;
        if(!serializer_details::SerializeValue<options::detail::no_options>(value, *this)) {
            // A description may decline without saying why
            return fail(SerializeError::CUSTOM_ERROR);
        }
        if(m_depth != depth) {
            // a compound was dropped without end()
            return fail(SerializeError::INTERLEAVED_COMPOUND);
        }
        return true;
    }

    constexpr bool serialize_bool(bool v) {
        if(!ready()) {
            return false;
        }
        if(!m_formatter.write_bool(m_sink, v)) {
            return sink_failed();
        }
        return true;
    }

    constexpr bool serialize_i8(std::int8_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_i8(m_sink, v)) return sink_failed();
        return true;
    }
    constexpr bool serialize_i16(std::int16_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_i16(m_sink, v)) return sink_failed();
        return true;
    }
    constexpr bool serialize_i32(std::int32_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_i32(m_sink, v)) return sink_failed();
        return true;
    }
    constexpr bool serialize_i64(std::int64_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_i64(m_sink, v)) return sink_failed();
        return true;
    }
    constexpr bool serialize_u8(std::uint8_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_u8(m_sink, v)) return sink_failed();
        return true;
    }
    constexpr bool serialize_u16(std::uint16_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_u16(m_sink, v)) return sink_failed();
        return true;
    }
    constexpr bool serialize_u32(std::uint32_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_u32(m_sink, v)) return sink_failed();
        return true;
    }
    constexpr bool serialize_u64(std::uint64_t v) {
        if(!ready()) return false;
        if(!m_formatter.write_u64(m_sink, v)) return sink_failed();
        return true;
    }

    bool serialize_f32(float v) {
        if(!ready()) {
            return false;
        }
        if(m_formatter.non_finite_policy() == NonFinitePolicy::Reject && !formatter_details::is_finite(v)) {
            return fail(SerializeError::NON_FINITE_FLOAT);
        }
        if(!m_formatter.write_f32(m_sink, v)) {
            return sink_failed();
        }
        return true;
    }
    bool serialize_f64(double v) {
        if(!ready()) {
            return false;
        }
        if(m_formatter.non_finite_policy() == NonFinitePolicy::Reject && !formatter_details::is_finite(v)) {
            return fail(SerializeError::NON_FINITE_FLOAT);
        }
        if(!m_formatter.write_f64(m_sink, v)) {
            return sink_failed();
        }
        return true;
    }

    /// Written as the UTF-8 string of one code point
    constexpr bool serialize_char(char32_t v) {
        char utf8[4] = {};
        const std::size_t len = serializer_details::encode_utf8(v, utf8);
        if(len == 0) {
            return custom_error("character is not a Unicode scalar value");
        }
        return serialize_str(std::string_view(utf8, len));
    }

    constexpr bool serialize_str(std::string_view v) {
        if(!ready()) {
            return false;
        }
        if(!format_escaped_str(m_sink, m_formatter, v)) {
            return sink_failed();
        }
        return true;
    }

    /// Raw bytes have no literal of their own: {1,2,3}
    constexpr bool serialize_bytes(std::span<const std::byte> v) {
        auto seq = serialize_seq(v.size());
        if(!seq) {
            return false;
        }
        for(std::byte b : v) {
            if(!seq->serialize_element(std::to_integer<std::uint8_t>(b))) {
                return false;
            }
        }
        return std::move(*seq).end();
    }

    constexpr bool serialize_none() {
        return serialize_unit();
    }
    template<class T>
    constexpr bool serialize_some(const T & value) {
        return serialize(value);
    }
    constexpr bool serialize_unit() {
        if(!ready()) {
            return false;
        }
        if(!m_formatter.write_null(m_sink)) {
            return sink_failed();
        }
        return true;
    }
    constexpr bool serialize_unit_struct(std::string_view) {
        return serialize_unit();
    }
    constexpr bool serialize_unit_variant(std::string_view, std::uint32_t, std::string_view variant) {
        return serialize_str(variant);
    }
    template<class T>
    constexpr bool serialize_newtype_struct(std::string_view, const T & value) {
        return serialize(value);
    }

    /// {["variant"]=value}
    template<class T>
    constexpr bool serialize_newtype_variant(std::string_view, std::uint32_t, std::string_view variant, const T & value) {
        if(!ready()) {
            return false;
        }
        if(!enter()) {
            return false;
        }
        if(!begin_variant(variant)) {
            return false;
        }
        if(!serialize(value)) {
            return false;
        }
        if(!m_formatter.end_object_value(m_sink)) {
            return sink_failed();
        }
        if(!m_formatter.end_object(m_sink)) {
            return sink_failed();
        }
        leave();
        return true;
    }

    constexpr std::optional<compound_type> serialize_seq(std::optional<std::size_t> len) {
        if(!ready() || !enter()) {
            return std::nullopt;
        }
        return open_compound(serializer_details::CompoundKind::Sequence, len);
    }
    constexpr std::optional<compound_type> serialize_tuple(std::size_t len) {
        return serialize_seq(len);
    }
    constexpr std::optional<compound_type> serialize_tuple_struct(std::string_view, std::size_t len) {
        return serialize_seq(len);
    }
    constexpr std::optional<compound_type> serialize_tuple_variant(std::string_view, std::uint32_t, std::string_view variant, std::size_t len) {
        if(!ready() || !enter()) {
            return std::nullopt;
        }
        if(!begin_variant(variant)) {
            return std::nullopt;
        }
        return open_compound(serializer_details::CompoundKind::TupleVariant, len);
    }
    constexpr std::optional<compound_type> serialize_map(std::optional<std::size_t> len) {
        if(!ready() || !enter()) {
            return std::nullopt;
        }
        return open_compound(serializer_details::CompoundKind::Map, len);
    }
    constexpr std::optional<compound_type> serialize_struct(std::string_view, std::size_t len) {
        return serialize_map(len);
    }
    constexpr std::optional<compound_type> serialize_struct_variant(std::string_view, std::uint32_t, std::string_view variant, std::size_t len) {
        if(!ready() || !enter()) {
            return std::nullopt;
        }
        if(!begin_variant(variant)) {
            return std::nullopt;
        }
        return open_compound(serializer_details::CompoundKind::StructVariant, len);
    }

    /// Fails the walk with CUSTOM_ERROR; for descriptions that reject their own value
    constexpr bool custom_error(std::string_view message) {
        if(m_error == SerializeError::NO_ERROR) {
            m_error = SerializeError::CUSTOM_ERROR;
            m_message.assign(message.data(), message.size());
        }
        return false;
    }

    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr std::string_view message() const {
        return m_message;
    }
    constexpr std::size_t depth() const {
        return m_depth;
    }
    constexpr Sink & sink() {
        return m_sink;
    }
    constexpr const Sink & sink() const {
        return m_sink;
    }
    constexpr Formatter & formatter() {
        return m_formatter;
    }
    constexpr Sink into_sink() && {
        return std::move(m_sink);
    }

    /// A compound still open at this point is reported as INTERLEAVED_COMPOUND
    constexpr SerializeResult result() const {
        const SerializeError err = (m_error == SerializeError::NO_ERROR && m_open != 0)
                                       ? SerializeError::INTERLEAVED_COMPOUND
                                       : m_error;
        return SerializeResult(err, m_sink.getError(), m_message, m_sink.bytes_written());
    }
};


template<SinkLike Sink>
constexpr Serializer<Sink, CompactFormatter> MakeSerializer(Sink sink) {
    return Serializer<Sink, CompactFormatter>(std::move(sink));
}

template<SinkLike Sink>
constexpr Serializer<Sink, PrettyFormatter> MakePrettySerializer(Sink sink) {
    return Serializer<Sink, PrettyFormatter>(std::move(sink));
}


template <class InputObjectT, SinkLike Sink, class Formatter>
constexpr SerializeResult SerializeWithSerializer(const InputObjectT & obj, Serializer<Sink, Formatter> & serializer) {
    serializer.serialize(obj);
    return serializer.result();
}

template <class InputObjectT, CharOutputIterator It, CharSentinelForOut<It> Sent, class Formatter = CompactFormatter>
constexpr SerializeResult Serialize(const InputObjectT & obj, It & begin, const Sent & end, Formatter formatter = Formatter{}) {
    Serializer<IteratorSink<It, Sent>, Formatter> serializer(IteratorSink<It, Sent>(begin, end), std::move(formatter));
    serializer.serialize(obj);
    begin = serializer.sink().current();
    return serializer.result();
}

template <class InputObjectT, class Formatter = CompactFormatter>
constexpr SerializeResult Serialize(const InputObjectT & obj, std::string & out, Formatter formatter = Formatter{}) {
    out.clear();
    Serializer<StringSink, Formatter> serializer(StringSink(out), std::move(formatter));
    serializer.serialize(obj);
    return serializer.result();
}

template <class InputObjectT>
constexpr SerializeResult SerializePretty(const InputObjectT & obj, std::string & out, std::size_t indentSize = 2) {
    return Serialize(obj, out, PrettyFormatter(indentSize));
}

template <class InputObjectT, class Formatter = CompactFormatter>
constexpr SerializeResult SerializeToVector(const InputObjectT & obj, std::vector<std::uint8_t> & out, Formatter formatter = Formatter{}) {
    out.clear();
    Serializer<VectorSink, Formatter> serializer(VectorSink(out), std::move(formatter));
    serializer.serialize(obj);
    return serializer.result();
}

template <class InputObjectT, class Formatter = CompactFormatter>
SerializeResult SerializeToStream(const InputObjectT & obj, std::ostream & os, Formatter formatter = Formatter{}) {
    Serializer<StreamSink, Formatter> serializer(StreamSink(os), std::move(formatter));
    serializer.serialize(obj);
    return serializer.result();
}

template <class InputObjectT>
SerializeResult SerializePrettyToStream(const InputObjectT & obj, std::ostream & os, std::size_t indentSize = 2) {
    return SerializeToStream(obj, os, PrettyFormatter(indentSize));
}

} // namespace LuaFusion
