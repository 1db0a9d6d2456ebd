#include <array>
#include <cassert>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "test_helpers.hpp"

using namespace ObjConv;
using namespace TestHelpers;
using parser::Status;

enum class Level : std::int8_t { low = -1, high = 1 };
enum class Mask : std::uint16_t { a = 1, b = 2 };

// ============================================================================
// Scalar classification and extraction
// ============================================================================

bool test_bool() {
    bool v = true;
    ValueParser<> p(v);
    Type t;
    bool out = false;
    return p.parse_type(t) == Status::ok && t == Type::Bool
        && p.parse_bool(out) == Status::ok && out;
}

bool test_signed_integers() {
    std::int8_t small = -7;
    long long big = std::numeric_limits<long long>::min();
    Level lv = Level::low;

    std::int64_t out = 0;
    ValueParser<> p1(small);
    if(p1.parse_int(out) != Status::ok || out != -7) return false;
    ValueParser<> p2(big);
    if(p2.parse_int(out) != Status::ok || out != std::numeric_limits<std::int64_t>::min()) return false;
    ValueParser<> p3(lv);
    if(p3.parse_int(out) != Status::ok || out != -1) return false;

    return ClassifiesAs(small, Type::Int) && ClassifiesAs(lv, Type::Int);
}

bool test_unsigned_integers() {
    std::uint64_t big = std::numeric_limits<std::uint64_t>::max();
    std::uint8_t one_byte = 200;
    Mask m = Mask::b;

    std::uint64_t out = 0;
    ValueParser<> p1(big);
    if(p1.parse_uint(out) != Status::ok || out != big) return false;
    ValueParser<> p2(one_byte);
    if(p2.parse_uint(out) != Status::ok || out != 200) return false;
    ValueParser<> p3(m);
    if(p3.parse_uint(out) != Status::ok || out != 2) return false;

    return ClassifiesAs(one_byte, Type::Uint) && ClassifiesAs(m, Type::Uint);
}

bool test_floats() {
    float f = 0.5f;
    double d = -1.25;
    double out = 0;
    ValueParser<> p1(f);
    if(p1.parse_float(out) != Status::ok || out != 0.5) return false;
    ValueParser<> p2(d);
    if(p2.parse_float(out) != Status::ok || out != -1.25) return false;
    return ClassifiesAs(f, Type::Float);
}

bool test_strings() {
    std::string s = "hello";
    std::string_view sv = "view";
    char buf[8] = "abc";
    std::array<char, 4> fixed{'w', 'x', 'y', 'z'};

    return RendersAs(s, "\"hello\"")
        && RendersAs(sv, "\"view\"")
        && RendersAs(buf, "\"abc\"")
        && RendersAs(fixed, "\"wxyz\"")
        && ClassifiesAs(s, Type::String);
}

bool test_parse_type_is_idempotent() {
    std::string s = "x";
    ValueParser<> p(s);
    Type a, b;
    std::string_view out;
    return p.parse_type(a) == Status::ok
        && p.parse_type(b) == Status::ok
        && a == b && a == Type::String
        && p.parse_string(out) == Status::ok && out == "x";
}

// ============================================================================
// Nil and empty wrappers
// ============================================================================

bool test_nil() {
    std::optional<int> empty;
    std::unique_ptr<std::string> none;
    const int* null_ptr = nullptr;
    std::monostate mono;

    ValueParser<> root(nullptr);
    Type t;
    if(root.parse_type(t) != Status::ok || t != Type::Nil) return false;
    if(root.parse_nil() != Status::ok) return false;

    return ClassifiesAs(empty, Type::Nil)
        && ClassifiesAs(none, Type::Nil)
        && ClassifiesAs(null_ptr, Type::Nil)
        && ClassifiesAs(mono, Type::Nil)
        && RendersAs(empty, "nil");
}

bool test_filled_wrappers_classify_as_payload() {
    std::optional<int> o = 42;
    auto u = std::make_unique<std::string>("boxed");
    int target = 9;
    const int* ptr = &target;

    return RendersAs(o, "42")
        && RendersAs(u, "\"boxed\"")
        && RendersAs(ptr, "9");
}

// ============================================================================
// Byte sequences vs arrays
// ============================================================================

bool test_byte_sequences_are_bytes() {
    std::vector<std::uint8_t> raw{0x01, 0x02, 0xff};
    std::vector<std::byte> b{std::byte{0x10}};

    ValueParser<> p(raw);
    std::span<const std::byte> out;
    if(p.parse_bytes(out) != Status::ok || out.size() != 3 || out[2] != std::byte{0xff}) return false;

    return ClassifiesAs(raw, Type::Bytes)
        && RendersAs(b, "0x10");
}

bool test_fixed_byte_arrays_are_arrays() {
    std::array<std::uint8_t, 2> fixed{0xab, 0xcd};
    unsigned char c_array[2] = {1, 2};
    return ClassifiesAs(fixed, Type::Array)
        && RendersAs(fixed, "[171u,205u]")
        && RendersAs(c_array, "[1u,2u]");
}

bool test_bool_vector_is_array() {
    std::vector<bool> flags{true, false};
    std::vector<bool> none;
    return ClassifiesAs(flags, Type::Array)
        && RendersAs(flags, "[true,false]")
        && RendersAs(none, "[]");
}

bool test_same_length_non_bytes_are_arrays() {
    std::vector<int> ints{1, 2, 3};
    std::vector<std::uint16_t> wide{1, 2, 3};
    return ClassifiesAs(ints, Type::Array)
        && ClassifiesAs(wide, Type::Array)
        && RendersAs(wide, "[1u,2u,3u]");
}

bool test_string_view_valid_until_next_call() {
    std::vector<std::string> words{"first", "second"};
    ValueParser<> p(words);
    std::ptrdiff_t n = 0;
    std::string_view a;
    std::string_view b;
    if(p.parse_array_begin(n) != Status::ok) return false;
    if(p.parse_string(a) != Status::ok || a != "first") return false;
    const char* storage = a.data();
    if(p.parse_array_next() != Status::ok) return false;
    if(p.parse_string(b) != Status::ok || b != "second") return false;
    // Both views share the parser's buffer, the first one now reads the new text.
    if(b.data() != storage) return false;
    if(std::string_view(storage, 5) != "secon") return false;
    return p.parse_array_end() == Status::ok;
}

bool test_error_message_reuses_string_buffer() {
    std::map<std::string, std::runtime_error> failures{{"disk", std::runtime_error("full")}};
    ValueParser<> p(failures);
    std::ptrdiff_t n = 0;
    std::string_view key;
    std::string_view message;
    if(p.parse_map_begin(n) != Status::ok) return false;
    if(p.parse_string(key) != Status::ok || key != "disk") return false;
    const char* storage = key.data();
    if(p.parse_map_value() != Status::ok) return false;
    if(p.parse_error(message) != Status::ok || message != "full") return false;
    if(message.data() != storage || std::string_view(storage, 4) != "full") return false;
    return p.parse_map_end() == Status::ok;
}

bool test_bytes_view_is_parser_owned() {
    std::vector<std::uint8_t> raw{1, 2};
    ValueParser<> p(raw);
    std::span<const std::byte> out;
    if(p.parse_bytes(out) != Status::ok) return false;
    return out.data() != reinterpret_cast<const std::byte*>(raw.data());
}

// ============================================================================
// Unsupported values
// ============================================================================

void free_function() {}

bool test_function_is_unsupported() {
    void (*fn)() = &free_function;
    std::function<int(int)> callback = [](int x) { return x; };

    ValueParser<> p(callback);
    Type t;
    if(p.parse_type(t) != Status::error) return false;
    if(p.getError() != ParseError::UNSUPPORTED_TYPE) return false;
    if(p.unsupportedTypeName().empty()) return false;

    return ClassifyFailsWith(fn, ParseError::UNSUPPORTED_TYPE)
        && ClassifyFailsWith(callback, ParseError::UNSUPPORTED_TYPE);
}

bool test_unsupported_element_is_not_fatal() {
    std::vector<std::mutex> locks(2);
    ValueParser<> p(locks);
    std::ptrdiff_t n = 0;
    Type t;
    if(p.parse_array_begin(n) != Status::ok || n != 2) return false;
    if(p.parse_type(t) != Status::error || p.getError() != ParseError::UNSUPPORTED_TYPE) return false;
    if(p.pending() != 1 || p.depth() != 1) return false;
    // Caller skips the element and keeps going.
    if(p.parse_array_next() != Status::ok) return false;
    if(p.parse_array_end() != Status::ok) return false;
    return p.pending() == 0 && p.depth() == 0;
}

bool test_wrong_getter_is_type_mismatch() {
    int v = 3;
    ValueParser<> p(v);
    std::string_view s;
    bool b;
    if(p.parse_string(s) != Status::error || p.getError() != ParseError::TYPE_MISMATCH) return false;
    if(p.parse_bool(b) != Status::error || p.getError() != ParseError::TYPE_MISMATCH) return false;
    std::int64_t out = 0;
    return p.parse_int(out) == Status::ok && out == 3;
}

int main() {
    assert(test_bool());
    assert(test_signed_integers());
    assert(test_unsigned_integers());
    assert(test_floats());
    assert(test_strings());
    assert(test_parse_type_is_idempotent());
    assert(test_nil());
    assert(test_filled_wrappers_classify_as_payload());
    assert(test_byte_sequences_are_bytes());
    assert(test_fixed_byte_arrays_are_arrays());
    assert(test_bool_vector_is_array());
    assert(test_same_length_non_bytes_are_arrays());
    assert(test_string_view_valid_until_next_call());
    assert(test_error_message_reuses_string_buffer());
    assert(test_bytes_view_is_parser_owned());
    assert(test_function_is_unsupported());
    assert(test_unsupported_element_is_not_fatal());
    assert(test_wrong_getter_is_type_mismatch());
    return 0;
}
