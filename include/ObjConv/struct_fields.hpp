#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <ranges>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "reflect.hpp"
#include "static_schema.hpp"
#include "type_name.hpp"

#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

namespace ObjConv {

namespace struct_fields {

/* ######## Field access ######## */

// Aggregates are enumerated by PFR.
template<class T>
struct Reader {
    static constexpr std::size_t count = pfr::tuple_size_v<T>;

    template<std::size_t I>
    using element = pfr::tuple_element_t<I, T>;

    template<std::size_t I>
    static constexpr const element<I>& get(const T& s) {
        return pfr::get<I>(s);
    }

    template<std::size_t I>
    static constexpr std::string_view name = pfr::get_name<I, T>();
};

template<class T, class OptPack>
struct annotate;

template<class T, class... Opts>
struct annotate<T, OptionsPack<Opts...>> {
    using type = Annotated<T, Opts...>;
};

// Types with a StructMeta specialization use its member list; per-field
// options ride along as an Annotated element type.
template<class T>
    requires static_schema::hasStructMeta<T>
struct Reader<T> {
    using list = typename StructMeta<T>::Fields::list;

    template<std::size_t I>
    using entry = std::tuple_element_t<I, list>;

    static constexpr std::size_t count = std::tuple_size_v<list>;

    template<std::size_t I>
    using element = typename annotate<typename entry<I>::value_type, typename entry<I>::options>::type;

    template<std::size_t I>
    static constexpr const typename entry<I>::value_type& get(const T& s) {
        return s.*(entry<I>::member);
    }

    template<std::size_t I>
    static constexpr std::string_view name = entry<I>::key;
};

// Options of raw field I: AnnotatedField<T, I> first, then the field's own Annotated pack.
template<class T, std::size_t I>
using field_opts = options::detail::field_options<
    typename options::detail::merge_options<
        typename options::detail::has_field_annotation_specialization_impl<T, I>::Options,
        typename options::detail::annotation_meta_getter<typename Reader<T>::template element<I>>::OptionsP
    >::type
>;

template<class T, std::size_t I>
using field_meta = options::detail::annotation_meta_getter<typename Reader<T>::template element<I>>;

template<class T, std::size_t I>
constexpr decltype(auto) fieldValue(const T& s) {
    return field_meta<T, I>::getRef(Reader<T>::template get<I>(s));
}

/* ######## Omission predicates ######## */

template<class V>
constexpr bool isEmptyValue(const V& v) {
    using namespace static_schema;
    if constexpr (NullableLike<V>) {
        return isNull(v);
    } else if constexpr (BoolLike<V>) {
        return !v;
    } else if constexpr (IntLike<V> || UintLike<V> || FloatLike<V>) {
        return v == V{};
    } else if constexpr (DurationLike<V>) {
        return v.count() == 0;
    } else if constexpr (TimeLike<V>) {
        return v.time_since_epoch().count() == 0;
    } else if constexpr (StringLike<V>) {
        return string_view_of(v).empty();
    } else if constexpr (MapLike<V>) {
        return v.size() == 0;
    } else if constexpr (std::ranges::range<const V>) {
        return std::ranges::begin(v) == std::ranges::end(v);
    } else {
        return false;
    }
}

template<class V>
constexpr bool isZeroValue(const V& v);

template<class S, std::size_t... I>
constexpr bool allFieldsZero(const S& s, std::index_sequence<I...>) {
    return (isZeroValue(fieldValue<S, I>(s)) && ...);
}

template<class V>
constexpr bool isZeroValue(const V& v) {
    using namespace static_schema;
    if constexpr (NullableLike<V>) {
        return isNull(v);
    } else if constexpr (BoolLike<V> || IntLike<V> || UintLike<V> || FloatLike<V>) {
        return v == V{};
    } else if constexpr (DurationLike<V>) {
        return v.count() == 0;
    } else if constexpr (TimeLike<V>) {
        return v.time_since_epoch().count() == 0;
    } else if constexpr (std::same_as<V, std::error_code>) {
        return !v;
    } else if constexpr (StringLike<V>) {
        return string_view_of(v).empty();
    } else if constexpr (MapLike<V>) {
        return v.size() == 0;
    } else if constexpr (std::ranges::range<const V> && is_fixed_extent_v<V>) {
        for(const auto& e : v) {
            if(!isZeroValue(e)) return false;
        }
        return true;
    } else if constexpr (std::ranges::range<const V>) {
        return std::ranges::begin(v) == std::ranges::end(v);
    } else if constexpr (RecordLike<V>) {
        return allFieldsZero(v, std::make_index_sequence<Reader<V>::count>{});
    } else {
        return false;
    }
}


/* ######## Field table ######## */

template<class T, std::size_t I>
static consteval bool fieldIsExcluded() {
    using Opts = field_opts<T, I>;
    return Opts::template has_option<options::detail::exclude_tag>;
}

template<class T>
struct FieldsHelper {
    static constexpr std::size_t rawFieldsCount = Reader<T>::count;

    static constexpr std::size_t fieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + (!fieldIsExcluded<T, I>() ? 1: 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    template<std::size_t I>
    static consteval std::string_view fieldName() {
        using Opts = field_opts<T, I>;
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
            return KeyOpt::desc.view();
        } else {
            return Reader<T>::template name<I>;
        }
    }

    template<std::size_t I>
    static reflect::Value getField(const void* record) {
        const T& s = *static_cast<const T*>(record);
        using V = std::remove_cvref_t<typename field_meta<T, I>::value_t>;
        const V& ref = fieldValue<T, I>(s);
        return reflect::Value(std::addressof(ref), &reflect::descriptor_of<V>());
    }

    template<std::size_t I>
    static bool omitField(const void* record) {
        using Opts = field_opts<T, I>;
        const T& s = *static_cast<const T*>(record);
        const auto& ref = fieldValue<T, I>(s);
        if constexpr (Opts::template has_option<options::detail::omitempty_tag>) {
            if(isEmptyValue(ref)) return true;
        }
        if constexpr (Opts::template has_option<options::detail::omitzero_tag>) {
            if(isZeroValue(ref)) return true;
        }
        return false;
    }

    template<std::size_t I>
    static constexpr reflect::FieldInfo makeField() {
        using Opts = field_opts<T, I>;
        constexpr bool omittable = Opts::template has_option<options::detail::omitempty_tag>
                                || Opts::template has_option<options::detail::omitzero_tag>;
        return reflect::FieldInfo{
            fieldName<I>(),
            I,
            &getField<I>,
            omittable ? &omitField<I> : nullptr
        };
    }

    static constexpr std::array<reflect::FieldInfo, fieldsCount> fields =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<reflect::FieldInfo, fieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (!fieldIsExcluded<T, J>()) {
                    arr[index++] = makeField<J>();
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr bool fieldsAreUnique = []() consteval {
        for(std::size_t i = 0; i < fieldsCount; i ++) {
            for(std::size_t j = i + 1; j < fieldsCount; j ++) {
                if(fields[i].name == fields[j].name) return false;
            }
        }
        return true;
    }();
};

} // namespace struct_fields


template<class T>
const reflect::StructInfo& LookupStruct() {
    using Helper = struct_fields::FieldsHelper<T>;
    static_assert(Helper::fieldsAreUnique, "[[[ ObjConv ]]] record has duplicate field keys");
    static const reflect::StructInfo info{
        type_name<T>(),
        std::span<const reflect::FieldInfo>(Helper::fields.data(), Helper::fields.size())
    };
    return info;
}

} // namespace ObjConv
