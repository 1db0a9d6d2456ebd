#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "errors.hpp"
#include "parser_concept.hpp"
#include "type.hpp"

namespace ObjConv {

namespace parser {

namespace detail {

template<std::size_t MaxSkipNesting, ParserLike P>
Status skip_value_internal(P& p, std::size_t depth) {
    Type t;
    if(Status s = p.parse_type(t); s != Status::ok) return s;

    switch(t) {
    case Type::Nil:
        return p.parse_nil();
    case Type::Bool: {
        bool b;
        return p.parse_bool(b);
    }
    case Type::Int: {
        std::int64_t i;
        return p.parse_int(i);
    }
    case Type::Uint: {
        std::uint64_t u;
        return p.parse_uint(u);
    }
    case Type::Float: {
        double f;
        return p.parse_float(f);
    }
    case Type::String: {
        std::string_view s;
        return p.parse_string(s);
    }
    case Type::Bytes: {
        std::span<const std::byte> b;
        return p.parse_bytes(b);
    }
    case Type::Time: {
        time_type tm;
        return p.parse_time(tm);
    }
    case Type::Duration: {
        std::chrono::nanoseconds d;
        return p.parse_duration(d);
    }
    case Type::Error: {
        std::string_view m;
        return p.parse_error(m);
    }
    case Type::Array: {
        if(depth >= MaxSkipNesting) return Status::error;
        std::ptrdiff_t n;
        if(Status s = p.parse_array_begin(n); s != Status::ok) return s;
        if(n < 0) {
            for(;;) {
                Status s = p.parse_array_next();
                if(s == Status::end) break;
                if(s != Status::ok) return s;
                if(s = skip_value_internal<MaxSkipNesting>(p, depth + 1); s != Status::ok) return s;
            }
        } else {
            for(std::ptrdiff_t i = 0; i < n; i ++) {
                if(i > 0) {
                    if(Status s = p.parse_array_next(); s != Status::ok) return s;
                }
                if(Status s = skip_value_internal<MaxSkipNesting>(p, depth + 1); s != Status::ok) return s;
            }
        }
        return p.parse_array_end();
    }
    case Type::Map: {
        if(depth >= MaxSkipNesting) return Status::error;
        std::ptrdiff_t n;
        if(Status s = p.parse_map_begin(n); s != Status::ok) return s;
        for(std::ptrdiff_t i = 0; n < 0 || i < n; i ++) {
            if(n < 0 || i > 0) {
                Status s = p.parse_map_next();
                if(s == Status::end && n < 0) break;
                if(s != Status::ok) return s;
            }
            if(Status s = skip_value_internal<MaxSkipNesting>(p, depth + 1); s != Status::ok) return s;
            if(Status s = p.parse_map_value(); s != Status::ok) return s;
            if(Status s = skip_value_internal<MaxSkipNesting>(p, depth + 1); s != Status::ok) return s;
        }
        return p.parse_map_end();
    }
    }
    return Status::error;
}

} // namespace detail

/// Consumes exactly one value, composites included, from any parser.
/// Stops at the first failing call and returns its status; the parser's
/// getError() tells why. Exceeding MaxSkipNesting also yields Status::error
/// without touching the parser.
template<std::size_t MaxSkipNesting = 512, ParserLike P>
Status SkipValue(P& p) {
    return detail::skip_value_internal<MaxSkipNesting>(p, 0);
}

} // namespace parser

} // namespace ObjConv
