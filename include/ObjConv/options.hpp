#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"

namespace ObjConv {


namespace options {


namespace detail {

struct key_tag{};
struct exclude_tag{};
struct omitempty_tag{};
struct omitzero_tag{};

struct max_nesting_tag{};
struct skip_nulls_tag{};
}

// ---- Field options ----

template<ConstString Desc>
struct key {
    static_assert(Desc.printable(), "[[[ ObjConv ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Field never appears in the record's map view.
struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

// Omit null wrappers, empty strings/bytes/sequences/maps, false and zero numbers.
struct omitempty {
    using tag = detail::omitempty_tag;
    static constexpr std::string_view to_string() {
        return "omitempty";
    }
};

// Omit the field when it equals its value-initialized state.
struct omitzero {
    using tag = detail::omitzero_tag;
    static constexpr std::string_view to_string() {
        return "omitzero";
    }
};

// ---- Parser options ----

template<std::size_t N>
struct max_nesting {
    using tag = detail::max_nesting_tag;
    static constexpr std::size_t value = N;
    static constexpr std::string_view to_string() {
        return "max_nesting";
    }
};

// Omit every record field whose value dereferences to nil.
struct skip_nulls {
    using tag = detail::skip_nulls_tag;
    static constexpr std::string_view to_string() {
        return "skip_nulls";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

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



template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;


template<class T, class = void>
struct has_annotation_specialization_impl : std::false_type {};

template<class T>
struct has_annotation_specialization_impl<T,
                                          std::void_t<typename Annotated<T>::Options>
                                          > : std::bool_constant<
                                                                 is_options_pack_v<typename Annotated<T>::Options>
                                                                    && (Annotated<T>::Options::Count > 0)
                                                                 > {};

template<class T>
inline constexpr bool has_annotation_specialization =
    has_annotation_specialization_impl<T>::value;

template<class Field>
struct annotation_meta{};

// Base: non-annotated
template<class T>
    requires (!has_annotation_specialization<T>)
struct annotation_meta<T> {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};


// Annotated<T, Opts...>
template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = T;
    using options      = field_options<
        OptionsPack<Opts...>
        >;

    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};


// Externally Annotated<T>
template<class T> requires has_annotation_specialization<T>
struct annotation_meta<T> {
    using value_t = T;
    using options      = field_options<typename Annotated<T>::Options>;

    using OptionsP = typename Annotated<T>::Options;

    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }

};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};



template<class T, std::size_t I, class = void>
struct has_field_annotation_specialization_impl : std::false_type {
    using Options = OptionsPack<>;
};

template<class T, std::size_t I>
struct has_field_annotation_specialization_impl<T, I,
                                          std::void_t<typename AnnotatedField<T, I>::Options>
                                          > : std::bool_constant<
                                                  is_options_pack_v<typename AnnotatedField<T, I>::Options>
                                                  && (AnnotatedField<T, I>::Options::Count > 0)
                                                  > {
    using Options = typename AnnotatedField<T, I>::Options;
};

// Parser-level pack with defaults.
template<class... Opts>
struct parser_options {
    using options = field_options<OptionsPack<Opts...>>;

    static constexpr std::size_t MaxNesting = [] {
        if constexpr (options::template has_option<max_nesting_tag>) {
            return options::template get_option<max_nesting_tag>::value;
        } else {
            return std::size_t{512};
        }
    }();

    static constexpr bool SkipNulls = options::template has_option<skip_nulls_tag>;
};

} // namespace detail


} //namespace options


} // namespace ObjConv
