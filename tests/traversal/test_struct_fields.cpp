#include <cassert>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "test_helpers.hpp"

using namespace ObjConv;
using namespace TestHelpers;
using namespace ObjConv::options;
using parser::Status;

// Records used below live at namespace scope so PFR can read field names.

struct Plain {
    int id;
    std::string name;
    bool active;
};

struct ZeroAndText {
    Annotated<int, omitzero> A;
    std::string B;
};

struct Renamed {
    Annotated<int, key<"identifier">> id;
    Annotated<std::string, key<"display-name">> name;
};

struct WithExcluded {
    int visible;
    Annotated<std::string, exclude> secret;
    int also_visible;
};

struct Empties {
    Annotated<std::optional<int>, omitempty> maybe;
    Annotated<std::string, omitempty> text;
    Annotated<std::vector<int>, omitempty> items;
    Annotated<std::map<std::string, int>, omitempty> table;
    Annotated<bool, omitempty> flag;
    Annotated<double, omitempty> ratio;
};

struct Inner {
    int x;
    int y;
};

struct Outer {
    Annotated<Inner, omitzero> origin;
    Annotated<std::array<int, 2>, omitzero> pair;
    Inner always;
};

struct Nullable {
    int id;
    std::optional<std::string> note;
    const int* ref;
};

struct ExternallyAnnotated {
    int a;
    int b;
    int c;
};

template<> struct ObjConv::AnnotatedField<ExternallyAnnotated, 1> {
    using Options = OptionsPack<ObjConv::options::exclude>;
};

template<> struct ObjConv::AnnotatedField<ExternallyAnnotated, 2> {
    using Options = OptionsPack<ObjConv::options::key<"C">, ObjConv::options::omitzero>;
};

// Not an aggregate: field list comes from StructMeta.
class Legacy {
public:
    Legacy(int i, std::string l) : id(i), label(std::move(l)) {}
    int id;
    std::string label;
    int cache = 0;
};

template<> struct ObjConv::StructMeta<Legacy> {
    using Fields = StructFields<
        Field<&Legacy::id, "id">,
        Field<&Legacy::label, "label", ObjConv::options::omitempty>
    >;
};

// ============================================================================
// Field table
// ============================================================================

static_assert(struct_fields::FieldsHelper<Plain>::fieldsCount == 3);
static_assert(struct_fields::FieldsHelper<WithExcluded>::rawFieldsCount == 3);
static_assert(struct_fields::FieldsHelper<WithExcluded>::fieldsCount == 2);
static_assert(struct_fields::FieldsHelper<Renamed>::fields[1].name == "display-name");
static_assert(struct_fields::FieldsHelper<ExternallyAnnotated>::fieldsCount == 2);
static_assert(struct_fields::FieldsHelper<Legacy>::fieldsCount == 2);
static_assert(struct_fields::FieldsHelper<Legacy>::fields[1].name == "label");

bool test_lookup_struct() {
    const reflect::StructInfo& info = LookupStruct<Plain>();
    if(info.fields.size() != 3) return false;
    if(info.name.find("Plain") == std::string_view::npos) return false;
    // Cached: same object every time.
    return &LookupStruct<Plain>() == &info
        && info.fields[0].name == "id"
        && info.fields[2].name == "active"
        && info.fields[0].omit == nullptr;
}

// ============================================================================
// Record traversal
// ============================================================================

bool test_record_is_a_map() {
    Plain p{7, "seven", true};
    return ClassifiesAs(p, Type::Map)
        && RendersAs(p, "{\"id\":7,\"name\":\"seven\",\"active\":true}");
}

bool test_omitzero_drops_zero_field() {
    ZeroAndText v{0, "x"};
    ValueParser<> p(v);

    std::ptrdiff_t n = 0;
    std::string_view s;
    if(p.parse_map_begin(n) != Status::ok || n != 1) return false;
    if(p.parse_string(s) != Status::ok || s != "B") return false;
    if(p.parse_map_value() != Status::ok) return false;
    if(p.parse_string(s) != Status::ok || s != "x") return false;
    if(p.parse_map_end() != Status::ok) return false;

    ZeroAndText kept{3, "x"};
    return RendersAs(kept, "{\"A\":3,\"B\":\"x\"}");
}

bool test_key_rename() {
    Renamed r{5, "five"};
    return RendersAs(r, "{\"identifier\":5,\"display-name\":\"five\"}");
}

bool test_exclude() {
    WithExcluded w{1, "hidden", 2};
    return RendersAs(w, "{\"visible\":1,\"also_visible\":2}");
}

bool test_omitempty() {
    Empties none{};
    Empties some{};
    some.maybe = 0;
    some.text = std::string("t");
    some.items = std::vector<int>{1};
    some.table = std::map<std::string, int>{{"k", 0}};
    some.flag = true;
    some.ratio = 0.25;

    return RendersAs(none, "{}")
        && RendersAs(some, "{\"maybe\":0,\"text\":\"t\",\"items\":[1],\"table\":{\"k\":0},\"flag\":true,\"ratio\":0.25}");
}

bool test_omitzero_on_composites() {
    Outer zero{};
    Outer set{};
    set.origin = Inner{0, 1};
    set.pair = std::array<int, 2>{0, 9};

    return RendersAs(zero, "{\"always\":{\"x\":0,\"y\":0}}")
        && RendersAs(set, "{\"origin\":{\"x\":0,\"y\":1},\"pair\":[0,9],\"always\":{\"x\":0,\"y\":0}}");
}

bool test_external_field_annotation() {
    ExternallyAnnotated zero{1, 2, 0};
    ExternallyAnnotated set{1, 2, 3};
    return RendersAs(zero, "{\"a\":1}")
        && RendersAs(set, "{\"a\":1,\"C\":3}");
}

bool test_struct_meta() {
    Legacy full(4, "four");
    Legacy unlabeled(5, "");
    return ClassifiesAs(full, Type::Map)
        && RendersAs(full, "{\"id\":4,\"label\":\"four\"}")
        && RendersAs(unlabeled, "{\"id\":5}");
}

bool test_null_fields_kept_by_default() {
    Nullable v{1, std::nullopt, nullptr};
    return RendersAs(v, "{\"id\":1,\"note\":nil,\"ref\":nil}");
}

bool test_skip_nulls_option() {
    int target = 9;
    Nullable empty{1, std::nullopt, nullptr};
    Nullable filled{2, std::string("n"), &target};
    return RendersAs<skip_nulls>(empty, "{\"id\":1}")
        && RendersAs<skip_nulls>(filled, "{\"id\":2,\"note\":\"n\",\"ref\":9}");
}

bool test_omission_is_decided_at_begin() {
    ZeroAndText v{0, "x"};
    ValueParser<> p(v);
    std::ptrdiff_t n = 0;
    if(p.parse_map_begin(n) != Status::ok || n != 1) return false;
    // Record has a single surviving field; Next has nowhere to go.
    if(p.parse_map_next() != Status::error) return false;
    return p.parse_map_end() == Status::ok;
}

bool test_path_names_fields() {
    Plain v{1, "n", false};
    ValueParser<> p(v);
    std::ptrdiff_t n = 0;
    if(p.parse_map_begin(n) != Status::ok) return false;
    if(p.parse_map_next() != Status::ok) return false;
    if(p.parse_map_value() != Status::ok) return false;
    return p.current_path() == "$.name";
}

int main() {
    assert(test_lookup_struct());
    assert(test_record_is_a_map());
    assert(test_omitzero_drops_zero_field());
    assert(test_key_rename());
    assert(test_exclude());
    assert(test_omitempty());
    assert(test_omitzero_on_composites());
    assert(test_external_field_annotation());
    assert(test_struct_meta());
    assert(test_null_fields_kept_by_default());
    assert(test_skip_nulls_option());
    assert(test_omission_is_decided_at_begin());
    assert(test_path_names_fields());
    return 0;
}
