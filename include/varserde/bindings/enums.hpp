/**
 * @file enums.hpp
 * @brief Binding for enum types as all-unit tagged values
 *
 * The tag follows TagTraits<E>::tag_mode:
 * - Name  (default): the registry nick, wire 's'         South -> 'south'
 * - Index:           declaration index at index_type      West  -> uint32 3
 * - Repr:            the enumerator value at the width of the underlying type
 */

#pragma once

#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/enum_registry.hpp"
#include "varserde/helpers/type_name.hpp"
#include "varserde/tag.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"

#include <cstddef>
#include <string>
#include <type_traits>

namespace varserde {

namespace detail {

/// Wire type of an enum's tag
template<typename E>
std::string enum_tag_signature() {
    if constexpr (tag_mode_v<E> == TagMode::Index) {
        return std::string(1, tag_code<tag_index_type_t<E>>());
    } else if constexpr (tag_mode_v<E> == TagMode::Repr) {
        return std::string(1, tag_code<std::underlying_type_t<E>>());
    } else {
        return "s";
    }
}

/// Match a decoded tag against the registry of E
template<typename E>
Result<E> resolve_enum_tag(const VariantTag& tag) {
    const auto& registry = EnumRegistry<E>::instance();

    std::optional<E> found;
    if (tag.has_name) {
        found = registry.lookup_by_name(tag.name);
    } else if constexpr (tag_mode_v<E> == TagMode::Repr) {
        if (auto raw = tag.number_as<std::underlying_type_t<E>>()) {
            found = registry.lookup_by_value(*raw);
        }
    } else {
        if (auto index = tag.number_as<std::size_t>()) {
            found = registry.at_index(*index);
        }
    }

    if (!found) {
        return Error{ErrorCode::InvalidTag,
                     "Unknown enum tag " + tag.describe() + " for '" + std::string(get_type_name<E>()) + "'"};
    }
    return *found;
}

} // namespace detail

template<typename E>
    requires std::is_enum_v<E>
struct VariantType<E> {
    static TypeNodePtr node() { return TypeNode::leaf(detail::enum_tag_signature<E>()); }
};

template<typename E>
    requires std::is_enum_v<E>
struct Serializable<E> {
    static Result<wire::Value> serialize(const E& value, const Encoder& encoder) {
        const auto& registry = EnumRegistry<E>::instance();
        const auto* entry = registry.find(value);

        if constexpr (tag_mode_v<E> == TagMode::Repr) {
            auto raw = static_cast<std::underlying_type_t<E>>(value);
            std::string_view name = entry ? std::string_view(entry->nick) : std::string_view{};
            return encoder.encode_unit_variant(VariantTag::from(name, raw));
        } else {
            if (!entry) {
                return Error{ErrorCode::InvalidTag,
                             "Value " + std::to_string(static_cast<long long>(value)) +
                             " is not an enumerator of '" + std::string(get_type_name<E>()) + "'"};
            }
            return encoder.encode_unit_variant(VariantTag::from(entry->nick, entry->index));
        }
    }
};

template<typename E>
    requires std::is_enum_v<E>
struct Deserializable<E> {
    static Result<E> deserialize(const Decoder& decoder) {
        auto access = decoder.decode_enum();
        if (!access) {
            return std::move(access).error();
        }
        auto tag = access->tag();
        if (!tag) {
            return std::move(tag).error();
        }
        auto value = detail::resolve_enum_tag<E>(*tag);
        if (!value) {
            return value;
        }
        auto unit = access->unit_variant();
        if (!unit) {
            return unit.error();
        }
        return value;
    }
};

} // namespace varserde
