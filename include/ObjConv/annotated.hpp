#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <tuple>
#include <string_view>
#include <utility>

#include "const_string.hpp"

namespace ObjConv {

template <class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

/// Field wrapper carrying compile-time options (key renaming, omission rules).
/// Traversal sees straight through it: Annotated<int, ...> is an int.
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

/// External per-field annotation, for structs that cannot be edited:
///
///     template<> struct ObjConv::AnnotatedField<Point, 1> {
///         using Options = OptionsPack<ObjConv::options::omitzero>;
///     };
template <class Struct, std::size_t Index>
struct AnnotatedField;

/// External field list, for record types PFR cannot enumerate (constructors,
/// private state) or whose wire names differ from member names:
///
///     template<> struct ObjConv::StructMeta<Legacy> {
///         using Fields = StructFields<
///             Field<&Legacy::id, "id">,
///             Field<&Legacy::label, "label", options::omitempty>>;
///     };
template <class T>
struct StructMeta;

template <auto Member, ConstString Key, class... Opts>
struct Field;

template <class C, class T, T C::*Member, ConstString Key, class... Opts>
struct Field<Member, Key, Opts...> {
    using value_type = T;
    using options = OptionsPack<Opts...>;
    static constexpr std::string_view key = Key.view();
    static constexpr T C::*member = Member;
};

template <class... F>
struct StructFields {
    using list = std::tuple<F...>;
};

template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs,
                const Annotated<T, OptsR...>& rhs)
    noexcept(noexcept(lhs.value == rhs.value))
{
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs,
                const U& rhs)
    noexcept(noexcept(std::declval<const T&>() == std::declval<const U&>()))
{
    return lhs.value == rhs;
}

} // namespace ObjConv
