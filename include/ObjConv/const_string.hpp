#pragma once
#include <algorithm>
#include <cstddef>
#include <string_view>

namespace ObjConv {

// Field key usable as a template argument: options::key<"name">, Field<&T::m, "name">.
template <std::size_t N>
struct ConstString {
    char chars[N + 1]{};

    constexpr ConstString(const char (&str)[N + 1]) {
        std::copy_n(str, N + 1, chars);
    }

    constexpr std::string_view view() const {
        return {chars, N};
    }

    // Keys end up in diagnostics paths, control characters are refused.
    constexpr bool printable() const {
        return std::ranges::none_of(view(), [](char c) {
            return static_cast<unsigned char>(c) < 0x20;
        });
    }
};

template <std::size_t M>
ConstString(const char (&)[M]) -> ConstString<M - 1>;

} // namespace ObjConv
