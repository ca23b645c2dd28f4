#pragma once
#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "annotated.hpp"
#include "struct_introspection.hpp"

namespace LuaFusion {

/// Customization point: how a type describes itself to a serializer.
///
///   template<> struct Describe<Money> {
///       template<class S>
///       static constexpr bool serialize(const Money & m, S & ser) {
///           return ser.serialize_newtype_struct("Money", m.cents);
///       }
///   };
///
/// S is either a Serializer or a MapKeySerializer, so a description must only
/// use the serialize_* calls and forward their result.
template<class T>
struct Describe {
    using undescribed = void;
};

/// Variant names for an enum, indexed by its underlying value:
///   template<> struct EnumNames<Color> { static constexpr std::array names{"Red", "Green"}; };
/// With names the enum is written as a unit variant, without them as its underlying integer.
template<class E>
struct EnumNames {
    using unnamed = void;
};

/// Variant names for a std::variant, indexed by alternative:
///   template<> struct VariantNames<Shape> { static constexpr std::array names{"Circle", "Rect"}; };
/// With names the active alternative is written as a tagged variant {["Circle"]=...},
/// without them it is written as the bare alternative.
template<class V>
struct VariantNames {
    using unnamed = void;
};

namespace static_schema {

namespace detail {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T>
struct is_std_array : std::false_type {};

template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T>
struct always_false : std::false_type {};

} // namespace detail

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    detail::is_specialization_of<std::remove_cvref_t<T>, Template>::value;


template<class T>
concept Described = !requires { typename Describe<T>::undescribed; };

template<class E>
concept NamedEnum = std::is_enum_v<E> && !requires { typename EnumNames<E>::unnamed; };

template<class V>
concept NamedVariant = is_specialization_of_v<V, std::variant> && !requires { typename VariantNames<V>::unnamed; };


/* ######## Annotated ######## */
template<class C>
concept LuaAnnotated = is_specialization_of_v<C, Annotated>;

/* ######## Bool type detection ######## */
template<class C>
concept LuaBool = std::same_as<C, bool>;

/* ######## Character type detection ######## */
// Plain char is a byte and is written as a one-byte string; the others are code points
template<class C>
concept LuaByteChar = std::same_as<C, char>;

template<class C>
concept LuaCodePoint =
    std::same_as<C, char8_t> || std::same_as<C, char16_t> || std::same_as<C, char32_t>;

/* ######## Number type detection ######## */
template<class C>
concept LuaInteger =
    std::is_integral_v<C> && !LuaBool<C> && !LuaByteChar<C> && !LuaCodePoint<C> && !std::same_as<C, wchar_t>;

template<class C>
concept LuaFloat = std::is_floating_point_v<C>;

/* ######## String type detection ######## */
template<class T>
struct static_string_traits {
    static constexpr bool is_static = false;
};

// Fixed buffers hold a null-terminated string; the terminator is optional when the buffer is full
template<std::size_t N>
struct static_string_traits<std::array<char, N>> {
    static constexpr bool is_static = true;
    static constexpr std::string_view view(const std::array<char, N>& s) {
        std::size_t len = 0;
        while (len < N && s[len] != '\0') ++len;
        return {s.data(), len};
    }
};

template<std::size_t N>
struct static_string_traits<char[N]> {
    static constexpr bool is_static = true;
    static constexpr std::string_view view(const char (&s)[N]) {
        std::size_t len = 0;
        while (len < N && s[len] != '\0') ++len;
        return {s, len};
    }
};

template<class C>
concept LuaStaticString = static_string_traits<C>::is_static;

template<class C>
concept LuaString =
    std::same_as<C, std::string> ||
    std::same_as<C, std::string_view> ||
    LuaStaticString<C>;

/* ######## Bytes ######## */
template<class C>
concept LuaBytes =
    std::ranges::contiguous_range<C> &&
    std::ranges::sized_range<C> &&
    std::same_as<std::remove_cv_t<std::ranges::range_value_t<C>>, std::byte>;

/* ######## Nullable ######## */
template<class C>
concept LuaNullable =
    is_specialization_of_v<C, std::optional> ||
    is_specialization_of_v<C, std::unique_ptr> ||
    is_specialization_of_v<C, std::shared_ptr>;

template <LuaNullable Field>
constexpr bool isNull(const Field &f) {
    if constexpr (is_specialization_of_v<Field, std::optional>) {
        return !f.has_value();
    } else {
        return f.get() == nullptr;
    }
}

/* ######## Unit ######## */
template<class C>
concept LuaUnit = std::same_as<C, std::monostate> || std::same_as<C, std::nullptr_t>;

/* ######## Tuples ######## */
// Fixed-length heterogeneous or homogeneous positional values
template<class C>
concept LuaTuple =
    is_specialization_of_v<C, std::tuple> ||
    is_specialization_of_v<C, std::pair> ||
    (detail::is_std_array<C>::value && !LuaStaticString<C> && !LuaBytes<C>) ||
    (std::is_bounded_array_v<C> && !LuaStaticString<C> && !LuaBytes<C>);

/* ######## Map type detection ######## */
template<class C>
concept LuaMap = std::ranges::input_range<const C> && requires {
    typename C::key_type;
    typename C::mapped_type;
};

/* ######## Sequence type detection ######## */
template<class C>
concept LuaSequence =
    std::ranges::input_range<const C> &&
    !LuaString<C> && !LuaBytes<C> && !LuaMap<C> && !LuaTuple<C>;

/* ######## Variants ######## */
template<class C>
concept LuaVariant = is_specialization_of_v<C, std::variant>;

/* ######## Struct (object) type detection ######## */
template<typename T>
struct is_lua_struct {
    static constexpr bool value = [] {
        if constexpr (introspection::has_external_meta<T>) {
            return true;
        } else if constexpr (LuaBool<T> || LuaString<T> || LuaInteger<T> || LuaFloat<T>) {
            return false;
        } else if constexpr (std::ranges::range<T>) {
            return false;
        } else if constexpr (LuaAnnotated<T> || LuaNullable<T> || LuaUnit<T> || LuaTuple<T> || LuaVariant<T>) {
            return false;
        } else if constexpr (!std::is_class_v<T>) {
            return false;
        } else if constexpr (!std::is_aggregate_v<T>) {
            return false;
        } else {
            // Aggregate class, non-scalar, non-string, non-range -> reflected with pfr
            return true;
        }
    }();
};

template<class C>
concept LuaStruct = is_lua_struct<C>::value;

} // namespace static_schema

} // namespace LuaFusion
