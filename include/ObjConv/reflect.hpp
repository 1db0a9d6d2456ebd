#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "type.hpp"
#include "static_schema.hpp"

namespace ObjConv {

namespace reflect {

/// Runtime shape of a C++ type. Wrapper and Record never reach a parser's
/// caller: wrappers are unwrapped and records are reported as maps.
enum class Kind : std::uint8_t {
    Unsupported,
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
    Map,
    Record,
    Wrapper
};

struct Descriptor;

/// Borrowed handle to an object somewhere in the traversed graph.
/// A default constructed Value stands for "nothing" (empty wrapper, nil root).
class Value {
public:
    constexpr Value() = default;
    constexpr Value(const void* ptr, const Descriptor* desc) noexcept
        : ptr_(ptr), desc_(desc)
    {}

    constexpr bool valid() const noexcept { return desc_ != nullptr; }
    constexpr const void* address() const noexcept { return ptr_; }
    constexpr const Descriptor* descriptor() const noexcept { return desc_; }

    inline Kind kind() const noexcept;
    inline std::string_view type_name() const noexcept;

    constexpr bool operator==(const Value&) const = default;

private:
    const void* ptr_ = nullptr;
    const Descriptor* desc_ = nullptr;
};

class SequenceCursor {
public:
    virtual ~SequenceCursor() = default;
    virtual stream_read_result read_more() = 0;
    virtual Value get() const = 0;
};

struct MapEntry {
    Value key;
    Value value;
};

/// One record field as seen by the traversal engine.
struct FieldInfo {
    std::string_view name{};
    std::size_t index = 0;                          // position among the struct's raw fields
    Value (*get)(const void* record) = nullptr;
    bool (*omit)(const void* record) = nullptr;     // null when the field is never omitted
};

struct StructInfo {
    std::string_view name;
    std::span<const FieldInfo> fields;
};

struct Descriptor {
    Kind kind = Kind::Unsupported;
    std::string_view name{};

    bool                     (*get_bool)(const void*) = nullptr;
    std::int64_t             (*get_int)(const void*) = nullptr;
    std::uint64_t            (*get_uint)(const void*) = nullptr;
    double                   (*get_float)(const void*) = nullptr;
    std::string_view         (*get_string)(const void*) = nullptr;
    std::span<const std::byte> (*get_bytes)(const void*) = nullptr;
    time_type                (*get_time)(const void*) = nullptr;
    std::chrono::nanoseconds (*get_duration)(const void*) = nullptr;
    void                     (*get_error)(const void*, std::string& message) = nullptr;

    // Wrapper: the held value, or an invalid Value when empty.
    Value (*deref)(const void*) = nullptr;

    // Array
    std::ptrdiff_t (*length)(const void*) = nullptr;
    std::unique_ptr<SequenceCursor> (*open)(const void*) = nullptr;

    // Map
    void (*entries)(const void*, std::vector<MapEntry>& out) = nullptr;

    // Record
    const StructInfo& (*fields)() = nullptr;
};

inline Kind Value::kind() const noexcept {
    return desc_ ? desc_->kind : Kind::Nil;
}

inline std::string_view Value::type_name() const noexcept {
    return desc_ ? desc_->name : std::string_view("nil");
}

template<class T>
const Descriptor& descriptor_of();

template<class T>
Value valueOf(const T& v) {
    return Value(std::addressof(v), &descriptor_of<T>());
}

} // namespace reflect

/// Field-metadata lookup for record type T, computed once per type.
template<class T>
const reflect::StructInfo& LookupStruct();

} // namespace ObjConv
