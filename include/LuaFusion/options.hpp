#pragma once
#include <cstddef>
#include <string_view>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace LuaFusion {


namespace options {


namespace detail {

struct key_tag{};
struct exclude_tag{};
struct skip_nulls_tag{};
struct as_array_tag {};
}

/// Field is written under a different key than its C++ name
template<ConstString Desc>
struct key {
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

/// Field is never written
struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

/// On a struct: fields holding an empty optional are left out instead of written as nil
struct skip_nulls {
    using tag = detail::skip_nulls_tag;
    static constexpr std::string_view to_string() {
        return "skip_nulls";
    }
};

/// On a struct: written as a positional sequence {a,b,c} instead of a keyed table
struct as_array {
    using tag = detail::as_array_tag;
    static constexpr std::string_view to_string() {
        return "as_array";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


// === find_option_by_tag ===

template<class Tag, class... Opts>
struct find_option_by_tag;

// Base case: no options -> void
template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

// Recursive case: check First::tag (if present), otherwise continue
template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};


// Base: non-annotated
template<class T>
struct annotation_meta {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr const T & getRef(const T & f) {
        return f;
    }
};

// Annotated<T, Opts...>
template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;
    using value_t = T;
    using options      = field_options<OptionsPack<Opts...>>;

    static constexpr const T & getRef(const Annotated<T, Opts...> & f) {
        return f.value;
    }
    // StructMeta fields are stored bare, their options live in Field<...>
    static constexpr const T & getRef(const T & f) {
        return f;
    }
};

// Entry point with decay
template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};

template<class T, std::size_t I, class = void>
struct has_field_annotation_specialization_impl : std::false_type {
    using Options = OptionsPack<>;
};

template<class T, std::size_t I>
struct has_field_annotation_specialization_impl<T, I,
                                          std::void_t<typename AnnotatedField<T, I>::Options>
                                          > : std::true_type {
    using Options = typename AnnotatedField<T, I>::Options;
};

// Options of field #Index of an aggregate: external AnnotatedField first, then the field's own Annotated<>
template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using Meta = annotation_meta_getter<Field>;
    using ExternalOpts = typename has_field_annotation_specialization_impl<AggregateT, Index>::Options;
    using options      = field_options<
        typename merge_options<ExternalOpts, typename Meta::OptionsP>::type
    >;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter = typename aggregate_field_opts<std::remove_cvref_t<AggregateT>, Index>::options;


} // namespace detail


} //namespace options


} // namespace LuaFusion
