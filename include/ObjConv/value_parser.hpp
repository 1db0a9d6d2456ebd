#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "descriptors.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "parser_concept.hpp"
#include "reflect.hpp"
#include "type.hpp"

namespace ObjConv {

/// Parser over an in-memory value graph. It replays the graph as the same
/// event stream a wire-format parser would produce for it, which makes it the
/// reference implementation of parser::ParserLike and a test oracle for
/// decoders.
///
///     Config cfg{...};
///     ValueParser<> p(cfg);
///     Type t;
///     p.parse_type(t);          // Type::Map
///
/// The graph is borrowed: it must outlive the parser and stay unmodified while
/// the parser is in use. Self-referencing graphs are rejected with
/// CYCLE_DETECTED when the traversal would re-enter an open composite.
template <class... Opts>
class ValueParser {
    using Config = options::detail::parser_options<Opts...>;

public:
    using error_type = ParseError;

    static constexpr std::size_t MaxNesting = Config::MaxNesting;
    static constexpr std::size_t MaxUnwrapDepth = 64;

    template<class T>
    explicit ValueParser(const T& root)
        : root_(reflect::valueOf(root))
    {}

    // Nil root.
    explicit ValueParser(std::nullptr_t) {}

    template<class T>
    explicit ValueParser(const T&&) = delete;

    ParseError getError() const noexcept { return err_; }

    // Readable name of the type behind the last UNSUPPORTED_TYPE error.
    std::string_view unsupportedTypeName() const noexcept { return unsupported_; }

    // Number of open composites.
    std::size_t depth() const noexcept { return ctx_.size(); }

    // Number of children currently pushed above the root.
    std::size_t pending() const noexcept { return stack_.size(); }

    std::string current_path() const {
        std::string path = "$";
        for(const Context& c : ctx_) {
            if(!c.has_child) break;
            switch(c.kind) {
            case FrameKind::array:
                path += std::format("[{}]", c.index);
                break;
            case FrameKind::record:
                path += std::format(".{}", c.fields[c.index]->name);
                break;
            case FrameKind::map:
                path += describeKey(c.entries[c.index].key, c.index);
                break;
            }
        }
        return path;
    }

    // ---- Classification ----

    parser::Status parse_type(Type& t) {
        reflect::Value v;
        if(!unwrap(top(), v)) {
            return fail(ParseError::CYCLE_DETECTED);
        }
        switch(v.kind()) {
        case reflect::Kind::Nil:      t = Type::Nil; break;
        case reflect::Kind::Bool:     t = Type::Bool; break;
        case reflect::Kind::Int:      t = Type::Int; break;
        case reflect::Kind::Uint:     t = Type::Uint; break;
        case reflect::Kind::Float:    t = Type::Float; break;
        case reflect::Kind::String:   t = Type::String; break;
        case reflect::Kind::Bytes:    t = Type::Bytes; break;
        case reflect::Kind::Time:     t = Type::Time; break;
        case reflect::Kind::Duration: t = Type::Duration; break;
        case reflect::Kind::Error:    t = Type::Error; break;
        case reflect::Kind::Array:    t = Type::Array; break;
        case reflect::Kind::Map:      t = Type::Map; break;
        case reflect::Kind::Record:   t = Type::Map; break;
        case reflect::Kind::Wrapper:
        case reflect::Kind::Unsupported:
            unsupported_ = v.type_name();
            return fail(ParseError::UNSUPPORTED_TYPE);
        }
        return parser::Status::ok;
    }

    // ---- Scalars ----

    parser::Status parse_nil() {
        reflect::Value v;
        if(!expect(reflect::Kind::Nil, v)) return parser::Status::error;
        return parser::Status::ok;
    }

    parser::Status parse_bool(bool& b) {
        reflect::Value v;
        if(!expect(reflect::Kind::Bool, v)) return parser::Status::error;
        b = v.descriptor()->get_bool(v.address());
        return parser::Status::ok;
    }

    parser::Status parse_int(std::int64_t& i) {
        reflect::Value v;
        if(!expect(reflect::Kind::Int, v)) return parser::Status::error;
        i = v.descriptor()->get_int(v.address());
        return parser::Status::ok;
    }

    parser::Status parse_uint(std::uint64_t& u) {
        reflect::Value v;
        if(!expect(reflect::Kind::Uint, v)) return parser::Status::error;
        u = v.descriptor()->get_uint(v.address());
        return parser::Status::ok;
    }

    parser::Status parse_float(double& f) {
        reflect::Value v;
        if(!expect(reflect::Kind::Float, v)) return parser::Status::error;
        f = v.descriptor()->get_float(v.address());
        return parser::Status::ok;
    }

    parser::Status parse_string(std::string_view& s) {
        reflect::Value v;
        if(!expect(reflect::Kind::String, v)) return parser::Status::error;
        buffer_.assign(v.descriptor()->get_string(v.address()));
        s = buffer_;
        return parser::Status::ok;
    }

    parser::Status parse_bytes(std::span<const std::byte>& out) {
        reflect::Value v;
        if(!expect(reflect::Kind::Bytes, v)) return parser::Status::error;
        std::span<const std::byte> bytes = v.descriptor()->get_bytes(v.address());
        buffer_.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        out = std::span<const std::byte>(reinterpret_cast<const std::byte*>(buffer_.data()), buffer_.size());
        return parser::Status::ok;
    }

    parser::Status parse_time(time_type& t) {
        reflect::Value v;
        if(!expect(reflect::Kind::Time, v)) return parser::Status::error;
        t = v.descriptor()->get_time(v.address());
        return parser::Status::ok;
    }

    parser::Status parse_duration(std::chrono::nanoseconds& d) {
        reflect::Value v;
        if(!expect(reflect::Kind::Duration, v)) return parser::Status::error;
        d = v.descriptor()->get_duration(v.address());
        return parser::Status::ok;
    }

    parser::Status parse_error(std::string_view& message) {
        reflect::Value v;
        if(!expect(reflect::Kind::Error, v)) return parser::Status::error;
        v.descriptor()->get_error(v.address(), buffer_);
        message = buffer_;
        return parser::Status::ok;
    }

    // ---- Arrays ----

    parser::Status parse_array_begin(std::ptrdiff_t& n) {
        reflect::Value v;
        if(!expect(reflect::Kind::Array, v)) return parser::Status::error;
        if(parser::Status s = checkCanOpen(v); s != parser::Status::ok) return s;

        Context c;
        c.kind   = FrameKind::array;
        c.value  = v;
        c.length = v.descriptor()->length(v.address());
        c.cursor = v.descriptor()->open(v.address());

        if(c.length > 0 && c.cursor->read_more() == stream_read_result::value) {
            push(c.cursor->get());
            c.has_child = true;
        }
        n = c.length;
        ctx_.push_back(std::move(c));
        return parser::Status::ok;
    }

    parser::Status parse_array_next() {
        Context* c = topContext(FrameKind::array);
        if(!c) return fail(ParseError::PROTOCOL_VIOLATION);

        if(c->length >= 0) {
            if(c->index + 1 >= static_cast<std::size_t>(c->length)) {
                return fail(ParseError::PROTOCOL_VIOLATION);
            }
            if(c->cursor->read_more() != stream_read_result::value) {
                return fail(ParseError::PROTOCOL_VIOLATION);
            }
            pop();
            c->index ++;
            push(c->cursor->get());
            return parser::Status::ok;
        }

        // Unknown length: the first call moves onto element 0.
        if(c->finished) return fail(ParseError::PROTOCOL_VIOLATION);

        const bool more = c->cursor->read_more() == stream_read_result::value;
        if(c->has_child) {
            pop();
            c->has_child = false;
            c->index ++;
        }
        if(!more) {
            c->finished = true;
            return parser::Status::end;
        }
        push(c->cursor->get());
        c->has_child = true;
        return parser::Status::ok;
    }

    parser::Status parse_array_end() {
        Context* c = topContext(FrameKind::array);
        if(!c) return fail(ParseError::PROTOCOL_VIOLATION);
        if(c->has_child) pop();
        popContext();
        return parser::Status::ok;
    }

    // ---- Maps and records ----

    parser::Status parse_map_begin(std::ptrdiff_t& n) {
        reflect::Value v;
        if(!unwrap(top(), v)) return fail(ParseError::CYCLE_DETECTED);
        if(v.kind() != reflect::Kind::Map && v.kind() != reflect::Kind::Record) {
            return fail(ParseError::TYPE_MISMATCH);
        }
        if(parser::Status s = checkCanOpen(v); s != parser::Status::ok) return s;

        Context c;
        c.value = v;
        if(v.kind() == reflect::Kind::Map) {
            c.kind = FrameKind::map;
            v.descriptor()->entries(v.address(), c.entries);
            c.length = static_cast<std::ptrdiff_t>(c.entries.size());
        } else {
            c.kind = FrameKind::record;
            const reflect::StructInfo& info = v.descriptor()->fields();
            for(const reflect::FieldInfo& f : info.fields) {
                if(f.omit && f.omit(v.address())) continue;
                if constexpr (Config::SkipNulls) {
                    if(isNil(f.get(v.address()))) continue;
                }
                c.fields.push_back(&f);
            }
            c.length = static_cast<std::ptrdiff_t>(c.fields.size());
        }

        if(c.length > 0) {
            push(keyAt(c, 0));
            c.has_child = true;
        }
        n = c.length;
        ctx_.push_back(std::move(c));
        return parser::Status::ok;
    }

    parser::Status parse_map_value() {
        Context* c = topMapContext();
        if(!c || !c->has_child || c->on_value) return fail(ParseError::PROTOCOL_VIOLATION);
        pop();
        push(valueAt(*c, c->index));
        c->on_value = true;
        return parser::Status::ok;
    }

    parser::Status parse_map_next() {
        Context* c = topMapContext();
        if(!c) return fail(ParseError::PROTOCOL_VIOLATION);
        if(c->index + 1 >= static_cast<std::size_t>(c->length)) {
            return fail(ParseError::PROTOCOL_VIOLATION);
        }
        pop();
        c->index ++;
        push(keyAt(*c, c->index));
        c->on_value = false;
        return parser::Status::ok;
    }

    parser::Status parse_map_end() {
        Context* c = topMapContext();
        if(!c) return fail(ParseError::PROTOCOL_VIOLATION);
        if(c->has_child) pop();
        popContext();
        return parser::Status::ok;
    }

private:
    enum class FrameKind : std::uint8_t {
        array,
        map,
        record
    };

    struct Context {
        FrameKind kind = FrameKind::array;
        std::size_t index = 0;
        std::ptrdiff_t length = 0;
        reflect::Value value;
        std::unique_ptr<reflect::SequenceCursor> cursor;      // arrays
        std::vector<reflect::MapEntry> entries;               // maps, snapshot taken at begin
        std::vector<const reflect::FieldInfo*> fields;        // records, omitted fields removed
        bool has_child = false;
        bool on_value  = false;     // map: value (not key) is on top
        bool finished  = false;     // unknown length: end already reported
    };

    reflect::Value root_;
    std::vector<reflect::Value> stack_;
    std::vector<Context> ctx_;
    std::string buffer_;
    std::string_view unsupported_;
    ParseError err_ = ParseError::NO_ERROR;

    const reflect::Value& top() const {
        return stack_.empty() ? root_ : stack_.back();
    }

    void push(reflect::Value v) {
        SPDLOG_TRACE("ObjConv: push {} at depth {}", v.type_name(), stack_.size() + 1);
        stack_.push_back(v);
    }

    void pop() {
        SPDLOG_TRACE("ObjConv: pop {} at depth {}", stack_.back().type_name(), stack_.size());
        stack_.pop_back();
    }

    void popContext() {
        ctx_.pop_back();
    }

    parser::Status fail(ParseError e) {
        err_ = e;
        SPDLOG_DEBUG("ObjConv: {} at {}", error_to_string(e), current_path());
        return parser::Status::error;
    }

    // Peels wrappers until a non-wrapper or an empty wrapper. Domain types
    // (time, duration, error) are never wrappers, so they stop the loop first.
    bool unwrap(reflect::Value in, reflect::Value& out) const {
        reflect::Value v = in;
        for(std::size_t i = 0; i < MaxUnwrapDepth; i ++) {
            if(v.kind() != reflect::Kind::Wrapper) {
                out = v;
                return true;
            }
            v = v.descriptor()->deref(v.address());
        }
        return false;
    }

    bool expect(reflect::Kind k, reflect::Value& v) {
        if(!unwrap(top(), v)) {
            fail(ParseError::CYCLE_DETECTED);
            return false;
        }
        if(v.kind() != k) {
            fail(ParseError::TYPE_MISMATCH);
            return false;
        }
        return true;
    }

    bool isNil(reflect::Value v) const {
        reflect::Value u;
        return unwrap(v, u) && u.kind() == reflect::Kind::Nil;
    }

    parser::Status checkCanOpen(const reflect::Value& v) {
        if(ctx_.size() >= MaxNesting) {
            return fail(ParseError::NESTING_TOO_DEEP);
        }
        for(const Context& c : ctx_) {
            if(c.value == v) return fail(ParseError::CYCLE_DETECTED);
        }
        return parser::Status::ok;
    }

    Context* topContext(FrameKind k) {
        if(ctx_.empty() || ctx_.back().kind != k) return nullptr;
        return &ctx_.back();
    }

    Context* topMapContext() {
        if(ctx_.empty() || ctx_.back().kind == FrameKind::array) return nullptr;
        return &ctx_.back();
    }

    static reflect::Value keyAt(const Context& c, std::size_t i) {
        if(c.kind == FrameKind::map) {
            return c.entries[i].key;
        }
        return reflect::valueOf(c.fields[i]->name);
    }

    static reflect::Value valueAt(const Context& c, std::size_t i) {
        if(c.kind == FrameKind::map) {
            return c.entries[i].value;
        }
        return c.fields[i]->get(c.value.address());
    }

    std::string describeKey(reflect::Value key, std::size_t index) const {
        reflect::Value k;
        if(unwrap(key, k)) {
            const reflect::Descriptor* d = k.descriptor();
            switch(k.kind()) {
            case reflect::Kind::String:
                return std::format("[\"{}\"]", d->get_string(k.address()));
            case reflect::Kind::Int:
                return std::format("[{}]", d->get_int(k.address()));
            case reflect::Kind::Uint:
                return std::format("[{}]", d->get_uint(k.address()));
            default:
                break;
            }
        }
        return std::format("[#{}]", index);
    }
};

static_assert(parser::ParserLike<ValueParser<>>);

} // namespace ObjConv
