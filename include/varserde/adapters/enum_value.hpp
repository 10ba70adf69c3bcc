/**
 * @file enum_value.hpp
 * @brief Enum wrappers encoded through the enum registry
 *
 * - EnumValue<E>:     the enumerator nick, wire 's'       ('val-with-custom-name')
 * - EnumReprValue<E>: the raw enumerator value, wire 'i'
 *
 * Unlike a bare enum member (bindings/enums.hpp) these ignore TagTraits
 * tag modes and always use the registry representation.
 */

#pragma once

#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/enum_registry.hpp"
#include "varserde/error.hpp"
#include "varserde/helpers/type_name.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace varserde {

namespace detail {

template<typename E>
Error invalid_enum_value() {
    return Error::custom("expected a valid enum value for " + std::string(TypeName<E>::unqualified()));
}

} // namespace detail

// ============================================================================
// EnumValue (by nick)
// ============================================================================

template<typename E>
    requires std::is_enum_v<E>
class EnumValue {
public:
    EnumValue() = default;
    EnumValue(E value) : value_(value) {}

    E value() const { return value_; }

    /// Registry nick, empty if not an enumerator
    std::string_view nick() const { return EnumRegistry<E>::instance().name_of(value_); }

    static Result<EnumValue> parse(std::string_view nick) {
        auto found = EnumRegistry<E>::instance().lookup_by_name(nick);
        if (!found) {
            return detail::invalid_enum_value<E>();
        }
        return EnumValue(*found);
    }

    bool operator==(const EnumValue& other) const = default;

private:
    E value_{};
};

template<typename E>
struct VariantType<EnumValue<E>> {
    static TypeNodePtr node() { return TypeNode::leaf("s"); }
};

template<typename E>
struct Serializable<EnumValue<E>> {
    static Result<wire::Value> serialize(const EnumValue<E>& value, const Encoder&) {
        std::string_view nick = value.nick();
        if (nick.empty()) {
            return detail::invalid_enum_value<E>();
        }
        return wire::Value::string(nick);
    }
};

template<typename E>
struct Deserializable<EnumValue<E>> {
    static Result<EnumValue<E>> deserialize(const Decoder& decoder) {
        auto text = decoder.decode_string();
        if (!text) {
            return std::move(text).error();
        }
        return EnumValue<E>::parse(*text);
    }
};

// ============================================================================
// EnumReprValue (by raw value)
// ============================================================================

template<typename E>
    requires std::is_enum_v<E>
class EnumReprValue {
public:
    EnumReprValue() = default;
    EnumReprValue(E value) : value_(value) {}

    E value() const { return value_; }

    bool operator==(const EnumReprValue& other) const = default;

private:
    E value_{};
};

template<typename E>
struct VariantType<EnumReprValue<E>> {
    static TypeNodePtr node() { return TypeNode::leaf("i"); }
};

template<typename E>
struct Serializable<EnumReprValue<E>> {
    static Result<wire::Value> serialize(const EnumReprValue<E>& value, const Encoder&) {
        auto raw = static_cast<std::underlying_type_t<E>>(value.value());
        if (!std::in_range<std::int32_t>(raw)) {
            return Error::overflow("int32");
        }
        return wire::Value::of(static_cast<std::int32_t>(raw));
    }
};

template<typename E>
struct Deserializable<EnumReprValue<E>> {
    static Result<EnumReprValue<E>> deserialize(const Decoder& decoder) {
        auto raw = decoder.decode_integer<std::underlying_type_t<E>>();
        if (!raw) {
            return std::move(raw).error();
        }
        auto found = EnumRegistry<E>::instance().lookup_by_value(*raw);
        if (!found) {
            return detail::invalid_enum_value<E>();
        }
        return EnumReprValue<E>(*found);
    }
};

} // namespace varserde
