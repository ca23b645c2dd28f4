#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

namespace LuaFusion {

namespace serializer_details {

// Drives one value through S, which is a Serializer or a MapKeySerializer.
// Returns false on failure; the failure itself is recorded by S.
template <class Opts, class ObjT, class S>
constexpr bool SerializeValue(const ObjT & obj, S & ser);

// A value handed to a Compound together with the options of the field or
// Annotated<> it came from, so they survive the trip through Serializer::serialize
template <class Opts, class T>
struct OptionsRef {
    using options = Opts;
    const T & value;
};

template <class T>
struct is_options_ref : std::false_type {};
template <class Opts, class T>
struct is_options_ref<OptionsRef<Opts, T>> : std::true_type {};


template <class Opts, class ObjT, class S>
    requires static_schema::LuaBool<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    return ser.serialize_bool(obj);
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaInteger<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    static_assert(sizeof(ObjT) <= 8, "[[[ LuaFusion ]]] integers wider than 64 bits are not supported");
    if constexpr (std::is_signed_v<ObjT>) {
        if constexpr (sizeof(ObjT) == 1) {
            return ser.serialize_i8(static_cast<std::int8_t>(obj));
        } else if constexpr (sizeof(ObjT) == 2) {
            return ser.serialize_i16(static_cast<std::int16_t>(obj));
        } else if constexpr (sizeof(ObjT) == 4) {
            return ser.serialize_i32(static_cast<std::int32_t>(obj));
        } else {
            return ser.serialize_i64(static_cast<std::int64_t>(obj));
        }
    } else {
        if constexpr (sizeof(ObjT) == 1) {
            return ser.serialize_u8(static_cast<std::uint8_t>(obj));
        } else if constexpr (sizeof(ObjT) == 2) {
            return ser.serialize_u16(static_cast<std::uint16_t>(obj));
        } else if constexpr (sizeof(ObjT) == 4) {
            return ser.serialize_u32(static_cast<std::uint32_t>(obj));
        } else {
            return ser.serialize_u64(static_cast<std::uint64_t>(obj));
        }
    }
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaFloat<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    if constexpr (std::is_same_v<ObjT, float>) {
        return ser.serialize_f32(obj);
    } else {
        return ser.serialize_f64(static_cast<double>(obj));
    }
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaByteChar<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    return ser.serialize_str(std::string_view(&obj, 1));
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaCodePoint<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    return ser.serialize_char(static_cast<char32_t>(obj));
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaString<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    if constexpr (static_schema::LuaStaticString<ObjT>) {
        return ser.serialize_str(static_schema::static_string_traits<ObjT>::view(obj));
    } else {
        return ser.serialize_str(std::string_view(obj));
    }
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaBytes<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    return ser.serialize_bytes(std::span<const std::byte>(std::ranges::data(obj), std::ranges::size(obj)));
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaUnit<ObjT>
constexpr bool SerializeNonNullValue(const ObjT &, S & ser) {
    return ser.serialize_unit();
}

template <class Opts, class ObjT, class S>
    requires static_schema::NamedEnum<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    constexpr auto & names = EnumNames<ObjT>::names;
    const auto index = static_cast<std::size_t>(static_cast<std::underlying_type_t<ObjT>>(obj));
    if(index >= std::size(names)) {
        return ser.custom_error("enum value has no name");
    }
    return ser.serialize_unit_variant({}, static_cast<std::uint32_t>(index), std::string_view(names[index]));
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaVariant<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    if(obj.valueless_by_exception()) {
        return ser.custom_error("variant is valueless");
    }
    if constexpr (static_schema::NamedVariant<ObjT>) {
        constexpr auto & names = VariantNames<ObjT>::names;
        static_assert(std::size(names) == std::variant_size_v<ObjT>,
                      "[[[ LuaFusion ]]] VariantNames must name every alternative");
        const std::size_t index = obj.index();
        const std::string_view name(names[index]);
        return std::visit([&](const auto & alt) -> bool {
            using Alt = std::remove_cvref_t<decltype(alt)>;
            if constexpr (std::is_same_v<Alt, std::monostate>) {
                return ser.serialize_unit_variant({}, static_cast<std::uint32_t>(index), name);
            } else {
                return ser.serialize_newtype_variant({}, static_cast<std::uint32_t>(index), name, alt);
            }
        }, obj);
    } else {
        return std::visit([&](const auto & alt) -> bool {
            return SerializeValue<options::detail::no_options>(alt, ser);
        }, obj);
    }
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaTuple<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    if constexpr (std::is_bounded_array_v<ObjT>) {
        auto tup = ser.serialize_tuple(std::extent_v<ObjT>);
        if(!tup) {
            return false;
        }
        for(const auto & el : obj) {
            if(!tup->serialize_element(el)) {
                return false;
            }
        }
        return std::move(*tup).end();
    } else {
        constexpr std::size_t N = std::tuple_size_v<ObjT>;
        auto tup = ser.serialize_tuple(N);
        if(!tup) {
            return false;
        }
        const bool ok = [&]<std::size_t... I>(std::index_sequence<I...>) {
            return (tup->serialize_element(std::get<I>(obj)) && ...);
        }(std::make_index_sequence<N>{});
        if(!ok) {
            return false;
        }
        return std::move(*tup).end();
    }
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaSequence<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    std::optional<std::size_t> len;
    if constexpr (std::ranges::sized_range<const ObjT>) {
        len = static_cast<std::size_t>(std::ranges::size(obj));
    }
    auto seq = ser.serialize_seq(len);
    if(!seq) {
        return false;
    }
    for(const auto & el : obj) {
        if(!seq->serialize_element(el)) {
            return false;
        }
    }
    return std::move(*seq).end();
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaMap<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    std::optional<std::size_t> len;
    if constexpr (std::ranges::sized_range<const ObjT>) {
        len = static_cast<std::size_t>(std::ranges::size(obj));
    }
    auto map = ser.serialize_map(len);
    if(!map) {
        return false;
    }
    for(const auto & [key, value] : obj) {
        if(!map->serialize_entry(key, value)) {
            return false;
        }
    }
    return std::move(*map).end();
}


template<class ObjT, std::size_t... StructIndex>
constexpr std::size_t includedFieldsCount(std::index_sequence<StructIndex...>) {
    return (std::size_t{0} + ... +
            std::size_t(!options::detail::aggregate_field_opts_getter<ObjT, StructIndex>::template has_option<options::detail::exclude_tag>));
}

template <bool AsArray, bool SkipNulls, std::size_t StructIndex, class Comp, class ObjT>
constexpr bool SerializeOneStructField(Comp & compound, const ObjT & structObj) {
    using FieldOpts = options::detail::aggregate_field_opts_getter<ObjT, StructIndex>;
    if constexpr (FieldOpts::template has_option<options::detail::exclude_tag>) {
        return true;
    } else {
        using Field = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
        using Meta  = options::detail::annotation_meta_getter<Field>;
        const auto & value = introspection::getStructElementByIndex<StructIndex>(structObj);

        if constexpr (SkipNulls && static_schema::LuaNullable<typename Meta::value_t>) {
            if(static_schema::isNull(Meta::getRef(value))) {
                return true;
            }
        }
        // External AnnotatedField / Field<> options apply to the value as well
        const OptionsRef<FieldOpts, typename Meta::value_t> fieldValue{Meta::getRef(value)};
        if constexpr (AsArray) {
            return compound.serialize_element(fieldValue);
        } else if constexpr (FieldOpts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename FieldOpts::template get_option<options::detail::key_tag>;
            return compound.serialize_field(KeyOpt::desc.toStringView(), fieldValue);
        } else {
            return compound.serialize_field(introspection::structureElementNameByIndex<StructIndex, ObjT>, fieldValue);
        }
    }
}

template <bool AsArray, bool SkipNulls, class Comp, class ObjT, std::size_t... StructIndex>
constexpr bool SerializeStructFields(Comp & compound, const ObjT & structObj, std::index_sequence<StructIndex...>) {
    return (
        SerializeOneStructField<AsArray, SkipNulls, StructIndex>(compound, structObj)
        && ...
        );
}

template <class Opts, class ObjT, class S>
    requires static_schema::LuaStruct<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, S & ser) {
    constexpr std::size_t total = introspection::structureElementsCount<ObjT>;
    if constexpr (total == 0) {
        return ser.serialize_unit_struct({});
    } else {
        constexpr std::size_t count = includedFieldsCount<ObjT>(std::make_index_sequence<total>{});
        if constexpr (Opts::template has_option<options::detail::as_array_tag>) {
            auto tup = ser.serialize_tuple_struct({}, count);
            if(!tup) {
                return false;
            }
            if(!SerializeStructFields<true, false>(*tup, obj, std::make_index_sequence<total>{})) {
                return false;
            }
            return std::move(*tup).end();
        } else {
            auto st = ser.serialize_struct({}, count);
            if(!st) {
                return false;
            }
            if(!SerializeStructFields<false, Opts::template has_option<options::detail::skip_nulls_tag>>(
                    *st, obj, std::make_index_sequence<total>{})) {
                return false;
            }
            return std::move(*st).end();
        }
    }
}


template <class Opts, class ObjT, class S>
constexpr bool SerializeValue(const ObjT & obj, S & ser) {
    if constexpr (is_options_ref<ObjT>::value) {
        return SerializeValue<typename ObjT::options>(obj.value, ser);
    } else if constexpr (static_schema::Described<ObjT>) {
        return Describe<ObjT>::serialize(obj, ser);
    } else if constexpr (static_schema::LuaAnnotated<ObjT>) {
        using Meta = options::detail::annotation_meta_getter<ObjT>;
        return SerializeValue<typename Meta::options>(Meta::getRef(obj), ser);
    } else if constexpr (static_schema::LuaNullable<ObjT>) {
        if(static_schema::isNull(obj)) {
            return ser.serialize_none();
        }
        using Inner = std::remove_cvref_t<decltype(*obj)>;
        if constexpr (std::is_same_v<Opts, options::detail::no_options>) {
            return ser.serialize_some(*obj);
        } else {
            return ser.serialize_some(OptionsRef<Opts, Inner>{*obj});
        }
    } else if constexpr (std::is_enum_v<ObjT> && !static_schema::NamedEnum<ObjT>) {
        return SerializeValue<Opts>(static_cast<std::underlying_type_t<ObjT>>(obj), ser);
    } else {
        return SerializeNonNullValue<Opts>(obj, ser);
    }
}

} // namespace serializer_details

} // namespace LuaFusion
