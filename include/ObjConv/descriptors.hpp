#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

#include "reflect.hpp"
#include "static_schema.hpp"
#include "struct_fields.hpp"
#include "type_name.hpp"

namespace ObjConv {

namespace reflect {

namespace detail {

template<class C>
class RangeCursor final : public SequenceCursor {
public:
    explicit RangeCursor(const C& c) : cursor_{c} {}

    stream_read_result read_more() override {
        return cursor_.read_more();
    }

    Value get() const override {
        using E = typename static_schema::array_read_cursor<C>::element_type;
        return Value(std::addressof(cursor_.get()), &descriptor_of<E>());
    }

private:
    static_schema::array_read_cursor<C> cursor_;
};

template<class T>
const T& as(const void* p) {
    return *static_cast<const T*>(p);
}

// First match wins; the order mirrors the protocol's classification rules.
template<class T>
Descriptor make_descriptor() {
    using namespace static_schema;
    Descriptor d;
    d.name = type_name<T>();

    if constexpr (TimeLike<T>) {
        d.kind = Kind::Time;
        d.get_time = [](const void* p) -> time_type {
            return std::chrono::time_point_cast<std::chrono::nanoseconds>(as<T>(p));
        };
    } else if constexpr (DurationLike<T>) {
        d.kind = Kind::Duration;
        d.get_duration = [](const void* p) -> std::chrono::nanoseconds {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(as<T>(p));
        };
    } else if constexpr (ErrorLike<T>) {
        d.kind = Kind::Error;
        d.get_error = [](const void* p, std::string& message) {
            if constexpr (std::same_as<T, std::error_code>) {
                message = as<T>(p).message();
            } else {
                message = as<T>(p).what();
            }
        };
    } else if constexpr (BoolLike<T>) {
        d.kind = Kind::Bool;
        d.get_bool = [](const void* p) -> bool { return as<T>(p); };
    } else if constexpr (IntLike<T>) {
        d.kind = Kind::Int;
        d.get_int = [](const void* p) -> std::int64_t {
            if constexpr (std::is_enum_v<T>) {
                return static_cast<std::int64_t>(static_cast<std::underlying_type_t<T>>(as<T>(p)));
            } else {
                return static_cast<std::int64_t>(as<T>(p));
            }
        };
    } else if constexpr (UintLike<T>) {
        d.kind = Kind::Uint;
        d.get_uint = [](const void* p) -> std::uint64_t {
            if constexpr (std::is_enum_v<T>) {
                return static_cast<std::uint64_t>(static_cast<std::underlying_type_t<T>>(as<T>(p)));
            } else {
                return static_cast<std::uint64_t>(as<T>(p));
            }
        };
    } else if constexpr (FloatLike<T>) {
        d.kind = Kind::Float;
        d.get_float = [](const void* p) -> double { return static_cast<double>(as<T>(p)); };
    } else if constexpr (StringLike<T>) {
        d.kind = Kind::String;
        d.get_string = [](const void* p) -> std::string_view { return string_view_of(as<T>(p)); };
    } else if constexpr (BytesLike<T>) {
        d.kind = Kind::Bytes;
        d.get_bytes = [](const void* p) -> std::span<const std::byte> {
            const T& c = as<T>(p);
            return std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(std::ranges::data(c)), std::ranges::size(c));
        };
    } else if constexpr (ArrayLike<T>) {
        d.kind = Kind::Array;
        d.length = [](const void* p) -> std::ptrdiff_t {
            return array_read_cursor<T>{as<T>(p)}.size();
        };
        d.open = [](const void* p) -> std::unique_ptr<SequenceCursor> {
            return std::make_unique<RangeCursor<T>>(as<T>(p));
        };
    } else if constexpr (MapLike<T>) {
        d.kind = Kind::Map;
        d.entries = [](const void* p, std::vector<MapEntry>& out) {
            using Cursor = map_read_cursor<T>;
            using K = std::remove_cv_t<typename Cursor::key_type>;
            using V = std::remove_cv_t<typename Cursor::mapped_type>;
            Cursor cursor{as<T>(p)};
            out.clear();
            out.reserve(cursor.size());
            while(cursor.read_more() == stream_read_result::value) {
                out.push_back(MapEntry{
                    Value(std::addressof(cursor.get_key()), &descriptor_of<K>()),
                    Value(std::addressof(cursor.get_value()), &descriptor_of<V>())
                });
            }
        };
    } else if constexpr (RecordLike<T>) {
        d.kind = Kind::Record;
        d.fields = &LookupStruct<T>;
    } else if constexpr (NilLike<T>) {
        d.kind = Kind::Nil;
    } else if constexpr (is_specialization_of_v<T, std::variant>) {
        d.kind = Kind::Wrapper;
        d.deref = [](const void* p) -> Value {
            const T& v = as<T>(p);
            if(v.valueless_by_exception()) return Value();
            return std::visit([](const auto& alt) -> Value {
                return valueOf(alt);
            }, v);
        };
    } else if constexpr (is_specialization_of_v<T, std::reference_wrapper>) {
        d.kind = Kind::Wrapper;
        d.deref = [](const void* p) -> Value {
            return valueOf(as<T>(p).get());
        };
    } else if constexpr (is_specialization_of_v<T, Annotated>) {
        d.kind = Kind::Wrapper;
        d.deref = [](const void* p) -> Value {
            return valueOf(as<T>(p).value);
        };
    } else if constexpr (NullableLike<T>) {
        d.kind = Kind::Wrapper;
        d.deref = [](const void* p) -> Value {
            const T& w = as<T>(p);
            if(isNull(w)) return Value();
            return valueOf(*w);
        };
    } else {
        d.kind = Kind::Unsupported;
    }
    return d;
}

} // namespace detail

template<class T>
const Descriptor& descriptor_of() {
    static const Descriptor d = detail::make_descriptor<std::remove_cv_t<T>>();
    return d;
}

} // namespace reflect

} // namespace ObjConv
