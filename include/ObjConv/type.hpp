#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace ObjConv {

/// Shape of the next value in a parser's stream.
/// The set is closed: every parser reports exactly one of these before the
/// matching getter (or Begin call) is issued.
enum class Type : std::uint8_t {
    Nil,
    Bool,
    Int,
    Uint,
    Float,
    String,
    Bytes,
    Time,
    Duration,
    Error,
    Array,
    Map
};

constexpr std::string_view type_to_string(Type t) {
    switch(t) {
    case Type::Nil: return "nil"; break;
    case Type::Bool: return "bool"; break;
    case Type::Int: return "int"; break;
    case Type::Uint: return "uint"; break;
    case Type::Float: return "float"; break;
    case Type::String: return "string"; break;
    case Type::Bytes: return "bytes"; break;
    case Type::Time: return "time"; break;
    case Type::Duration: return "duration"; break;
    case Type::Error: return "error"; break;
    case Type::Array: return "array"; break;
    case Type::Map: return "map"; break;
    }
    return "N/A";
}

// Timestamps cross the protocol at nanosecond precision.
using time_type = std::chrono::sys_time<std::chrono::nanoseconds>;

} // namespace ObjConv
