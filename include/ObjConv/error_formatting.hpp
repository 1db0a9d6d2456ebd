#pragma once

#include <format>
#include <string>

#include "errors.hpp"
#include "value_parser.hpp"

namespace ObjConv {

/// One-line description of the parser's last fault, with the path of the
/// value it happened at:
///
///     When parsing $.servers[2].port, parsing error 'TYPE_MISMATCH'
template<class... Opts>
std::string ParseErrorToString(const ValueParser<Opts...>& p) {
    std::string res = std::format("When parsing {}, parsing error '{}'",
                                  p.current_path(), error_to_string(p.getError()));
    if(p.getError() == ParseError::UNSUPPORTED_TYPE) {
        res += std::format(": no representation for '{}'", p.unsupportedTypeName());
    }
    return res;
}

} // namespace ObjConv
