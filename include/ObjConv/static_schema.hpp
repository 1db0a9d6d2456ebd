#pragma once
#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "annotated.hpp"

namespace ObjConv {

enum class stream_read_result : std::uint8_t {
    value,  // one value produced; keep going
    end,    // normal end-of-stream
    error   // unrecoverable error; abort
};

namespace static_schema {

namespace detail {
template<class T>
struct always_false : std::false_type {};
}

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cv_t<T>, Template>::value;


template<class V>
inline constexpr bool is_fixed_extent_v = std::is_bounded_array_v<V>;

template<class T, std::size_t N>
inline constexpr bool is_fixed_extent_v<std::array<T, N>> = true;

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T>
concept hasStructMeta = requires { typename StructMeta<T>::Fields; }
    && is_fields_pack<typename StructMeta<T>::Fields>::value;


/* ######## Domain types, matched by identity ######## */

template<class T>
struct is_system_time : std::false_type {};

template<class D>
struct is_system_time<std::chrono::time_point<std::chrono::system_clock, D>> : std::true_type {};

template<class T>
struct is_duration : std::false_type {};

template<class R, class P>
struct is_duration<std::chrono::duration<R, P>> : std::true_type {};

template<class C>
concept TimeLike = is_system_time<C>::value;

template<class C>
concept DurationLike = is_duration<C>::value;

template<class C>
concept ErrorLike =
    std::same_as<C, std::error_code> ||
    std::derived_from<C, std::exception>;

template<class C>
concept DomainLike = TimeLike<C> || DurationLike<C> || ErrorLike<C>;


/* ######## Scalars ######## */

template<class C>
concept BoolLike = std::same_as<C, bool>;

template<class C>
struct integer_traits {
    static constexpr bool is_signed   = false;
    static constexpr bool is_unsigned = false;
};

template<class C>
    requires (std::is_integral_v<C> && !std::is_same_v<C, bool>)
struct integer_traits<C> {
    static constexpr bool is_signed   = std::is_signed_v<C>;
    static constexpr bool is_unsigned = std::is_unsigned_v<C>;
};

// Enums classify by their underlying type.
template<class C>
    requires std::is_enum_v<C>
struct integer_traits<C> : integer_traits<std::underlying_type_t<C>> {};

template<class C>
concept IntLike = integer_traits<C>::is_signed;

template<class C>
concept UintLike = integer_traits<C>::is_unsigned;

template<class C>
concept FloatLike = std::is_floating_point_v<C>;


/* ######## Strings and bytes ######## */

template<class C>
concept StringLike =
    std::same_as<C, std::string>      ||
    std::same_as<C, std::string_view> ||
    (std::ranges::contiguous_range<const C> &&
     std::same_as<std::remove_cv_t<std::ranges::range_value_t<const C>>, char>);

template<class T>
struct is_byte : std::bool_constant<
    std::is_same_v<T, std::byte> ||
    std::is_same_v<T, unsigned char>> {};

// Variable-length only: a fixed byte array is an ordinary Array.
template<class C>
concept BytesLike =
    !StringLike<C> && !is_fixed_extent_v<C> &&
    std::ranges::contiguous_range<const C> &&
    is_byte<std::remove_cv_t<std::ranges::range_value_t<const C>>>::value;

template<class T>
struct static_string_traits {
    static constexpr bool is_static = false;
};

template<std::size_t N>
struct static_string_traits<std::array<char, N>> {
    static constexpr bool is_static = true;
    static constexpr std::size_t capacity = N;
    static constexpr const char* data(const std::array<char, N>& s)  { return s.data(); }
};

template<std::size_t N>
struct static_string_traits<char[N]> {
    static constexpr bool is_static = true;
    static constexpr std::size_t capacity = N;
    static constexpr const char* data(const char (&s)[N]) { return s; }
};

// Fixed char buffers are NUL terminated or fully used.
template<StringLike C>
constexpr std::string_view string_view_of(const C& s) {
    if constexpr (static_string_traits<C>::is_static) {
        const char* d = static_string_traits<C>::data(s);
        std::size_t len = 0;
        while(len < static_string_traits<C>::capacity && d[len] != '\0') {
            len ++;
        }
        return {d, len};
    } else {
        return {std::ranges::data(s), std::ranges::size(s)};
    }
}


/* ######## Read cursors ######## */

template<class C>
struct map_read_cursor;

template<class C>
concept MapReadable = requires(const C& c) {
    typename map_read_cursor<C>::key_type;
    typename map_read_cursor<C>::mapped_type;
    { map_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { map_read_cursor<C>{c}.get_key() } -> std::same_as<const typename map_read_cursor<C>::key_type&>;
    { map_read_cursor<C>{c}.get_value() } -> std::same_as<const typename map_read_cursor<C>::mapped_type&>;
};

// Generic map read cursor for map-like containers
template<class M>
    requires requires(const M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.begin() } -> std::same_as<typename M::const_iterator>;
        { m.end() } -> std::same_as<typename M::const_iterator>;
        { m.size() } -> std::convertible_to<std::size_t>;
    }
struct map_read_cursor<M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    const M& m;
    typename M::const_iterator it = m.begin();
    bool first = true;

    constexpr stream_read_result read_more() {
        if (first) {
            first = false;
        } else {
            ++it;
        }
        return (it != m.end()) ? stream_read_result::value
                               : stream_read_result::end;
    }

    constexpr const key_type& get_key() const {
        return it->first;
    }

    constexpr const mapped_type& get_value() const {
        return it->second;
    }

    constexpr std::size_t size() const {
        return m.size();
    }
};

template<class C>
concept MapLike = !StringLike<C> && MapReadable<C>;


template<class C>
concept ArrayLike =
    !StringLike<C> && !BytesLike<C> && !MapLike<C> &&
    std::ranges::input_range<const C>;

template<class C>
struct array_read_cursor{};

// Proxy references (std::vector<bool>) have no address to hand out, the
// cursor keeps a copy of the current element instead.
template<ArrayLike C>
struct array_read_cursor<C> {
    using element_type = std::remove_cv_t<std::ranges::range_value_t<const C>>;
    static constexpr bool by_reference =
        std::is_lvalue_reference_v<std::ranges::range_reference_t<const C>>;

    struct no_copy {};

    const C& c;
    std::ranges::iterator_t<const C> it = std::ranges::begin(c);
    bool first = true;
    std::conditional_t<by_reference, no_copy, std::optional<element_type>> current{};

    constexpr const element_type& get() const {
        if constexpr (by_reference) {
            return *it;
        } else {
            return *current;
        }
    }
    constexpr stream_read_result read_more() {
        if(first) {
            first = false;
        } else {
            ++it;
        }
        if(it == std::ranges::end(c)) return stream_read_result::end;
        if constexpr (!by_reference) {
            current.emplace(*it);
        }
        return stream_read_result::value;
    }
    // -1 when the range cannot report its size without walking it.
    constexpr std::ptrdiff_t size() const {
        if constexpr (std::ranges::sized_range<const C>) {
            return static_cast<std::ptrdiff_t>(std::ranges::size(c));
        } else {
            return -1;
        }
    }
};


/* ######## Wrappers and nil ######## */

template<class C>
concept NilLike =
    std::same_as<C, std::nullptr_t> ||
    std::same_as<C, std::monostate>;


/* ######## Records ######## */

template<class C>
concept RecordLike =
    !NilLike<C> && !MapLike<C> && !std::ranges::range<C> && std::is_class_v<C> &&
    (hasStructMeta<C> || std::is_aggregate_v<C>);


template<class C>
concept ObjectPointer =
    std::is_pointer_v<C> && std::is_object_v<std::remove_pointer_t<C>> &&
    !std::is_void_v<std::remove_cv_t<std::remove_pointer_t<C>>>;

template<class C>
concept NullableLike =
    is_specialization_of_v<C, std::optional>   ||
    is_specialization_of_v<C, std::unique_ptr> ||
    is_specialization_of_v<C, std::shared_ptr> ||
    ObjectPointer<C>;

template<class C>
concept WrapperLike =
    NullableLike<C> ||
    is_specialization_of_v<C, std::reference_wrapper> ||
    is_specialization_of_v<C, std::variant> ||
    is_specialization_of_v<C, Annotated>;

template<NullableLike C>
constexpr bool isNull(const C& c) {
    if constexpr (is_specialization_of_v<C, std::optional>) {
        return !c.has_value();
    } else {
        return c == nullptr;
    }
}

} // namespace static_schema

} // namespace ObjConv
