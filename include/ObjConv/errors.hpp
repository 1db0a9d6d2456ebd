#pragma once

#include <cstdint>
#include <string_view>

namespace ObjConv {

namespace parser {

enum class Status : std::uint8_t {
    ok,     // call succeeded
    end,    // end of sequence, only from *_next() after an unknown-length begin
    error   // call failed, parser.getError() tells why
};

} // namespace parser


enum class ParseError {
    NO_ERROR,
    UNSUPPORTED_TYPE,
    TYPE_MISMATCH,
    PROTOCOL_VIOLATION,
    CYCLE_DETECTED,
    NESTING_TOO_DEEP
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE"; break;
    case ParseError::TYPE_MISMATCH: return "TYPE_MISMATCH"; break;
    case ParseError::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION"; break;
    case ParseError::CYCLE_DETECTED: return "CYCLE_DETECTED"; break;
    case ParseError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP"; break;
    }
    return "N/A";
}

} // namespace ObjConv
