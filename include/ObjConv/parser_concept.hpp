#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "errors.hpp"
#include "type.hpp"

namespace ObjConv {

namespace parser {

/// ParserLike is the contract between a format-specific parser and a generic
/// decoder. The decoder pulls one value at a time:
///
///   parse_type() first (any number of times, idempotent), then exactly one
///   matching getter, or for composites:
///
///     parse_array_begin(n)             parse_map_begin(n)
///       value                            key, parse_map_value(), value
///       parse_array_next()  ...          parse_map_next() ...
///     parse_array_end()                parse_map_end()
///
/// With a known length n the decoder calls *_next() n-1 times. With n < 0 it
/// calls *_next() before every element, including the first, until it returns
/// Status::end.
///
/// String, bytes and error views point into parser-owned storage and stay
/// valid only until the next call on the same parser.
template<typename P>
concept ParserLike = requires(P& p,
                              const P& cp,
                              Type& type_ref,
                              bool& bool_ref,
                              std::int64_t& int_ref,
                              std::uint64_t& uint_ref,
                              double& double_ref,
                              std::string_view& string_ref,
                              std::span<const std::byte>& bytes_ref,
                              time_type& time_ref,
                              std::chrono::nanoseconds& duration_ref,
                              std::ptrdiff_t& length_ref
                              ) {

    // ========== Type Requirements ==========
    typename P::error_type;

    { cp.getError() } -> std::same_as<typename P::error_type>;

    // ========== Classification ==========
    { p.parse_type(type_ref) } -> std::same_as<Status>;

    // ========== Scalars ==========
    { p.parse_nil() } -> std::same_as<Status>;
    { p.parse_bool(bool_ref) } -> std::same_as<Status>;
    { p.parse_int(int_ref) } -> std::same_as<Status>;
    { p.parse_uint(uint_ref) } -> std::same_as<Status>;
    { p.parse_float(double_ref) } -> std::same_as<Status>;
    { p.parse_string(string_ref) } -> std::same_as<Status>;
    { p.parse_bytes(bytes_ref) } -> std::same_as<Status>;
    { p.parse_time(time_ref) } -> std::same_as<Status>;
    { p.parse_duration(duration_ref) } -> std::same_as<Status>;
    { p.parse_error(string_ref) } -> std::same_as<Status>;

    // ========== Arrays ==========
    { p.parse_array_begin(length_ref) } -> std::same_as<Status>;
    { p.parse_array_next() } -> std::same_as<Status>;
    { p.parse_array_end() } -> std::same_as<Status>;

    // ========== Maps ==========
    { p.parse_map_begin(length_ref) } -> std::same_as<Status>;
    { p.parse_map_value() } -> std::same_as<Status>;
    { p.parse_map_next() } -> std::same_as<Status>;
    { p.parse_map_end() } -> std::same_as<Status>;
};

template<typename P>
constexpr bool is_parser_like_v = ParserLike<P>;

} // namespace parser

} // namespace ObjConv
