/**
 * @file sum_types.hpp
 * @brief Binding for std::variant sum types
 *
 * Each alternative is one variant of the sum type. Its name is the
 * alternative's unqualified type name; an empty struct (or std::monostate)
 * is a unit variant, anything else carries a payload encoded with its own
 * node.
 *
 * If every variant is a unit variant the whole value is just the tag.
 * Otherwise the value is (tag, <payload>) with a fixed "(<tag>v)" signature,
 * and the node lists one payload node per variant:
 *
 * @code
 * struct A {};
 * struct B { int32_t value; };
 * using Item = std::variant<A, B>;
 * template<> struct varserde::TagTraits<Item> {
 *     static constexpr TagMode tag_mode = TagMode::Index;
 * };
 * // encode(Item{B{2}})  ->  "(1, <2>)" of type "(uv)"
 * @endcode
 *
 * In TagMode::Repr every alternative provides `static constexpr discriminant`
 * and TagTraits<V>::repr_type selects the tag width.
 */

#pragma once

#include "varserde/bindings/structs.hpp"
#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/helpers/type_name.hpp"
#include "varserde/tag.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace varserde {

namespace detail {

template<typename Alt>
constexpr bool is_unit_alternative() {
    if constexpr (std::is_same_v<Alt, std::monostate>) {
        return true;
    } else if constexpr (ReflectedStruct<Alt>) {
        return field_count_v<Alt> == 0;
    } else {
        return false;
    }
}

template<typename V>
struct SumTypeInfo;

template<typename... Alts>
struct SumTypeInfo<std::variant<Alts...>> {
    using variant_t = std::variant<Alts...>;

    static constexpr std::size_t count = sizeof...(Alts);
    static constexpr bool all_unit = (is_unit_alternative<Alts>() && ...);
    static constexpr std::array<std::string_view, count> names{TypeName<Alts>::unqualified()...};

    using repr_t = tag_repr_type_t<variant_t>;

    static std::string tag_signature() {
        if constexpr (tag_mode_v<variant_t> == TagMode::Index) {
            return std::string(1, tag_code<tag_index_type_t<variant_t>>());
        } else if constexpr (tag_mode_v<variant_t> == TagMode::Repr) {
            return std::string(1, tag_code<repr_t>());
        } else {
            return "s";
        }
    }

    template<std::size_t I>
    static VariantTag tag_of() {
        using Alt = std::variant_alternative_t<I, variant_t>;
        if constexpr (tag_mode_v<variant_t> == TagMode::Repr) {
            return VariantTag::from(names[I], static_cast<repr_t>(Alt::discriminant));
        } else {
            return VariantTag::from(names[I], I);
        }
    }

    template<std::size_t I>
    static bool matches(const VariantTag& tag) {
        if (tag.has_name) {
            return tag.name == names[I];
        }
        if constexpr (tag_mode_v<variant_t> == TagMode::Repr) {
            using Alt = std::variant_alternative_t<I, variant_t>;
            return tag.number_equals(static_cast<repr_t>(Alt::discriminant));
        } else {
            return tag.number_equals(I);
        }
    }

    template<std::size_t I>
    static TypeNodePtr payload_node() {
        using Alt = std::variant_alternative_t<I, variant_t>;
        if constexpr (is_unit_alternative<Alt>()) {
            return TypeNode::unit();
        } else {
            return type_node_ptr_of<Alt>();
        }
    }

    template<std::size_t... Is>
    static TypeNodePtr node(std::index_sequence<Is...>) {
        std::string tag = tag_signature();
        if constexpr (all_unit) {
            return TypeNode::leaf(std::move(tag));
        } else {
            return TypeNode::make("(" + tag + "v)", {payload_node<Is>()...});
        }
    }
};

} // namespace detail

template<typename... Alts>
struct VariantType<std::variant<Alts...>> {
    static TypeNodePtr node() {
        return detail::SumTypeInfo<std::variant<Alts...>>::node(std::index_sequence_for<Alts...>{});
    }
};

template<typename... Alts>
struct Serializable<std::variant<Alts...>> {
    using info = detail::SumTypeInfo<std::variant<Alts...>>;

    static Result<wire::Value> serialize(const std::variant<Alts...>& value, const Encoder& encoder) {
        if (value.valueless_by_exception()) {
            return Error::custom("Cannot encode a valueless variant");
        }
        return serialize_at(value, encoder, std::index_sequence_for<Alts...>{});
    }

private:
    template<std::size_t... Is>
    static Result<wire::Value> serialize_at(const std::variant<Alts...>& value, const Encoder& encoder,
                                            std::index_sequence<Is...>) {
        std::optional<Result<wire::Value>> result;
        ((value.index() == Is ? (result.emplace(serialize_alternative<Is>(value, encoder)), true) : false) || ...);
        return std::move(*result);
    }

    template<std::size_t I>
    static Result<wire::Value> serialize_alternative(const std::variant<Alts...>& value, const Encoder& encoder) {
        using Alt = std::variant_alternative_t<I, std::variant<Alts...>>;
        VariantTag tag = info::template tag_of<I>();

        if constexpr (detail::is_unit_alternative<Alt>()) {
            return encoder.encode_unit_variant(tag);
        } else {
            auto payload = encoder.variant_payload(I).encode(std::get<I>(value));
            if (!payload) {
                return payload;
            }
            return encoder.encode_variant(tag, std::move(*payload));
        }
    }
};

template<typename... Alts>
struct Deserializable<std::variant<Alts...>> {
    using variant_t = std::variant<Alts...>;
    using info = detail::SumTypeInfo<variant_t>;

    static Result<variant_t> deserialize(const Decoder& decoder) {
        auto access = decoder.decode_enum();
        if (!access) {
            return std::move(access).error();
        }
        auto tag = access->tag();
        if (!tag) {
            return std::move(tag).error();
        }
        return deserialize_at(*access, *tag, std::index_sequence_for<Alts...>{});
    }

private:
    template<std::size_t... Is>
    static Result<variant_t> deserialize_at(EnumAccess& access, const VariantTag& tag, std::index_sequence<Is...>) {
        std::optional<Result<variant_t>> result;
        ((info::template matches<Is>(tag) ? (result.emplace(deserialize_alternative<Is>(access)), true) : false) || ...);
        if (!result) {
            return Error{ErrorCode::InvalidTag,
                         "Unknown enum tag " + tag.describe() + " for '" +
                         std::string(get_type_name<variant_t>()) + "'"};
        }
        return std::move(*result);
    }

    template<std::size_t I>
    static Result<variant_t> deserialize_alternative(EnumAccess& access) {
        using Alt = std::variant_alternative_t<I, variant_t>;

        if constexpr (detail::is_unit_alternative<Alt>()) {
            auto unit = access.unit_variant();
            if (!unit) {
                return unit.error();
            }
            return variant_t(std::in_place_index<I>);
        } else {
            auto payload = access.template read_payload<Alt>();
            if (!payload) {
                return std::move(payload).error();
            }
            return variant_t(std::in_place_index<I>, std::move(*payload));
        }
    }
};

} // namespace varserde
