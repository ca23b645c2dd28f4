#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "describe.hpp"
#include "errors.hpp"
#include "options.hpp"

namespace LuaFusion {

/// Stand-in compound for a serializer that can never open one.
/// Only its std::nullopt is ever observed; the members exist so that
/// descriptions written against Serializer also compile against MapKeySerializer.
class ImpossibleCompound {
    constexpr ImpossibleCompound() = default;
public:
    template<class T>
    constexpr bool serialize_element(const T &) { return false; }
    template<class K>
    constexpr bool serialize_key(const K &) { return false; }
    template<class V>
    constexpr bool serialize_value(const V &) { return false; }
    template<class K, class V>
    constexpr bool serialize_entry(const K &, const V &) { return false; }
    template<class V>
    constexpr bool serialize_field(std::string_view, const V &) { return false; }
    constexpr bool end() && { return false; }
};


/// Serializer view used while a mapping key is written.
/// Integers, characters, strings and unit variant names go through to the
/// parent serializer; everything else fails with INVALID_KEY_KIND before a byte is written.
template<class Ser>
class MapKeySerializer {
    Ser * m_ser;

    constexpr bool reject() {
        return m_ser->fail(SerializeError::INVALID_KEY_KIND);
    }
    constexpr std::optional<ImpossibleCompound> reject_compound() {
        reject();
        return std::nullopt;
    }
public:
    using compound_type = ImpossibleCompound;

    constexpr explicit MapKeySerializer(Ser & ser): m_ser(&ser) {}

    template<class K>
    constexpr bool serialize(const K & key) {
        if(!serializer_details::SerializeValue<options::detail::no_options>(key, *this)) {
            return m_ser->fail(SerializeError::CUSTOM_ERROR);
        }
        return true;
    }

    constexpr bool serialize_bool(bool) { return reject(); }

    constexpr bool serialize_i8 (std::int8_t v)   { return m_ser->serialize_i8(v); }
    constexpr bool serialize_i16(std::int16_t v)  { return m_ser->serialize_i16(v); }
    constexpr bool serialize_i32(std::int32_t v)  { return m_ser->serialize_i32(v); }
    constexpr bool serialize_i64(std::int64_t v)  { return m_ser->serialize_i64(v); }
    constexpr bool serialize_u8 (std::uint8_t v)  { return m_ser->serialize_u8(v); }
    constexpr bool serialize_u16(std::uint16_t v) { return m_ser->serialize_u16(v); }
    constexpr bool serialize_u32(std::uint32_t v) { return m_ser->serialize_u32(v); }
    constexpr bool serialize_u64(std::uint64_t v) { return m_ser->serialize_u64(v); }

    // A float key would be ambiguous with the integer it rounds to
    constexpr bool serialize_f32(float)  { return reject(); }
    constexpr bool serialize_f64(double) { return reject(); }

    constexpr bool serialize_char(char32_t v)      { return m_ser->serialize_char(v); }
    constexpr bool serialize_str(std::string_view v) { return m_ser->serialize_str(v); }
    constexpr bool serialize_bytes(std::span<const std::byte>) { return reject(); }

    constexpr bool serialize_none() { return reject(); }
    template<class T>
    constexpr bool serialize_some(const T &) { return reject(); }
    constexpr bool serialize_unit() { return reject(); }
    constexpr bool serialize_unit_struct(std::string_view) { return reject(); }

    constexpr bool serialize_unit_variant(std::string_view, std::uint32_t, std::string_view variant) {
        return m_ser->serialize_str(variant);
    }

    template<class T>
    constexpr bool serialize_newtype_struct(std::string_view, const T & value) {
        return serialize(value);
    }
    template<class T>
    constexpr bool serialize_newtype_variant(std::string_view, std::uint32_t, std::string_view, const T &) {
        return reject();
    }

    constexpr std::optional<ImpossibleCompound> serialize_seq(std::optional<std::size_t>) {
        return reject_compound();
    }
    constexpr std::optional<ImpossibleCompound> serialize_tuple(std::size_t) {
        return reject_compound();
    }
    constexpr std::optional<ImpossibleCompound> serialize_tuple_struct(std::string_view, std::size_t) {
        return reject_compound();
    }
    constexpr std::optional<ImpossibleCompound> serialize_tuple_variant(std::string_view, std::uint32_t, std::string_view, std::size_t) {
        return reject_compound();
    }
    constexpr std::optional<ImpossibleCompound> serialize_map(std::optional<std::size_t>) {
        return reject_compound();
    }
    constexpr std::optional<ImpossibleCompound> serialize_struct(std::string_view, std::size_t) {
        return reject_compound();
    }
    constexpr std::optional<ImpossibleCompound> serialize_struct_variant(std::string_view, std::uint32_t, std::string_view, std::size_t) {
        return reject_compound();
    }

    constexpr bool custom_error(std::string_view message) {
        return m_ser->custom_error(message);
    }
};

} // namespace LuaFusion
