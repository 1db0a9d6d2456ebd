#pragma once

#include <string_view>

namespace ObjConv {

namespace type_name_detail {

template<class T>
constexpr std::string_view raw_signature() {
#if defined(__clang__) || defined(__GNUC__)
    return __PRETTY_FUNCTION__;
#elif defined(_MSC_VER)
    return __FUNCSIG__;
#else
    return {};
#endif
}

template<class T>
constexpr std::string_view extract() {
    constexpr std::string_view sig = raw_signature<T>();
#if defined(__clang__) || defined(__GNUC__)
    // clang: "... raw_signature() [T = int]"
    // gcc:   "... raw_signature() [with T = int; std::string_view = ...]"
    constexpr std::string_view marker = "T = ";
    const std::size_t start = sig.find(marker);
    if(start == std::string_view::npos) return "unknown";
    const std::size_t from = start + marker.size();
    std::size_t to = sig.find(';', from);
    if(to == std::string_view::npos) to = sig.rfind(']');
    return sig.substr(from, to - from);
#elif defined(_MSC_VER)
    // "... raw_signature<int>(void)"
    constexpr std::string_view marker = "raw_signature<";
    const std::size_t start = sig.find(marker);
    if(start == std::string_view::npos) return "unknown";
    const std::size_t from = start + marker.size();
    const std::size_t to = sig.rfind(">(void)");
    return sig.substr(from, to - from);
#else
    return "unknown";
#endif
}

}

/// Human readable spelling of T, for diagnostics only. Not stable across compilers.
template<class T>
constexpr std::string_view type_name() {
    return type_name_detail::extract<T>();
}

} // namespace ObjConv
