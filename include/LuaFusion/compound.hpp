#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "map_key_serializer.hpp"

namespace LuaFusion {

namespace serializer_details {

enum class State : std::uint8_t {
    Empty,  // opened with known length 0, already closed
    First,  // next element gets no leading separator
    Rest    // next element gets a leading separator
};

enum class CompoundKind : std::uint8_t {
    Sequence,       // seq, tuple, tuple struct
    Map,            // map, struct
    TupleVariant,   // {["Name"]={...}}
    StructVariant   // {["Name"]={[k]=v}}
};

constexpr bool isArrayKind(CompoundKind k) {
    return k == CompoundKind::Sequence || k == CompoundKind::TupleVariant;
}

constexpr bool isVariantKind(CompoundKind k) {
    return k == CompoundKind::TupleVariant || k == CompoundKind::StructVariant;
}

} // namespace serializer_details


/// Cursor over one open sequence or mapping.
///
/// Only the Serializer creates compounds. The caller feeds elements through
/// the compound, then consumes it with std::move(c).end(). Only the innermost
/// open compound accepts writes: opening a sibling, writing to an outer
/// compound before the inner one ended, or dropping one without end() fails
/// the walk with INTERLEAVED_COMPOUND.
template<class Ser>
class Compound {
    using State = serializer_details::State;
    using CompoundKind = serializer_details::CompoundKind;

    Ser * m_ser;
    CompoundKind m_kind;
    State m_state;
    std::size_t m_level;  // serializer depth while this compound is the innermost one

    friend Ser;

    constexpr Compound(Ser & ser, CompoundKind kind, State state):
        m_ser(&ser), m_kind(kind), m_state(state), m_level(ser.m_depth) {}

    template<class F>
    constexpr bool token(F && write) {
        if(!write(m_ser->m_formatter, m_ser->m_sink)) {
            return m_ser->sink_failed();
        }
        return true;
    }

    constexpr bool innermost() {
        if(m_ser->failed()) {
            return false;
        }
        if(m_level != m_ser->m_depth || m_ser->m_open != m_ser->m_lent + 1) {
            return m_ser->fail(SerializeError::INTERLEAVED_COMPOUND);
        }
        return true;
    }

    // Writes one nested value with the serializer lent to it
    template<class F>
    constexpr bool lend(F && write) {
        m_ser->m_lent ++;
        const bool ok = write();
        m_ser->m_lent --;
        return ok;
    }

    constexpr bool admit() {
        if(!innermost()) {
            return false;
        }
        if(m_state == State::Empty) {
            return m_ser->fail(SerializeError::LENGTH_MISMATCH);
        }
        return true;
    }
public:
    Compound(const Compound &) = delete;
    Compound & operator=(const Compound &) = delete;
    constexpr Compound(Compound && other) noexcept:
        m_ser(std::exchange(other.m_ser, nullptr)), m_kind(other.m_kind), m_state(other.m_state), m_level(other.m_level) {}
    Compound & operator=(Compound &&) = delete;

    constexpr State state() const {
        return m_state;
    }

    // Sequence, tuple and tuple variant elements
    template<class T>
    constexpr bool serialize_element(const T & value) {
        if(!admit()) {
            return false;
        }
        const bool first = m_state == State::First;
        if(!token([&](auto & f, auto & s) { return f.begin_array_value(s, first); })) {
            return false;
        }
        m_state = State::Rest;
        if(!lend([&] { return m_ser->serialize(value); })) {
            return false;
        }
        return token([](auto & f, auto & s) { return f.end_array_value(s); });
    }

    // Mapping keys: the only call that advances the separator state of a mapping
    template<class K>
    constexpr bool serialize_key(const K & key) {
        if(!admit()) {
            return false;
        }
        const bool first = m_state == State::First;
        if(!token([&](auto & f, auto & s) { return f.begin_object_key(s, first); })) {
            return false;
        }
        m_state = State::Rest;
        MapKeySerializer<Ser> keySerializer(*m_ser);
        if(!lend([&] { return keySerializer.serialize(key); })) {
            return false;
        }
        return token([](auto & f, auto & s) { return f.end_object_key(s); });
    }

    template<class V>
    constexpr bool serialize_value(const V & value) {
        if(!innermost()) {
            return false;
        }
        if(!token([](auto & f, auto & s) { return f.begin_object_value(s); })) {
            return false;
        }
        if(!lend([&] { return m_ser->serialize(value); })) {
            return false;
        }
        return token([](auto & f, auto & s) { return f.end_object_value(s); });
    }

    template<class K, class V>
    constexpr bool serialize_entry(const K & key, const V & value) {
        return serialize_key(key) && serialize_value(value);
    }

    // Struct fields: the field name is the key
    template<class V>
    constexpr bool serialize_field(std::string_view name, const V & value) {
        return serialize_entry(name, value);
    }

    constexpr bool end() && {
        if(!innermost()) {
            return false;
        }
        if(m_state != State::Empty) {
            const bool closed = serializer_details::isArrayKind(m_kind)
                                    ? m_ser->m_formatter.end_array(m_ser->m_sink)
                                    : m_ser->m_formatter.end_object(m_ser->m_sink);
            if(!closed) {
                return m_ser->sink_failed();
            }
        }
        if(serializer_details::isVariantKind(m_kind)) {
            if(!token([](auto & f, auto & s) { return f.end_object_value(s); })) {
                return false;
            }
            if(!token([](auto & f, auto & s) { return f.end_object(s); })) {
                return false;
            }
        }
        m_ser->m_open --;
        m_ser->leave();
        return true;
    }
};

} // namespace LuaFusion
