/**
 * @file scalars.hpp
 * @brief Bindings for arithmetic types, char, std::string and std::monostate
 */

#pragma once

#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace varserde {

// ============================================================================
// Arithmetic (bool, integers, float, double)
// ============================================================================

template<typename T>
    requires WireArithmetic<T>
struct VariantType<T> {
    static TypeNodePtr node() {
        return TypeNode::leaf(std::string(1, wire::scalar_code_v<wire_scalar_t<T>>));
    }
};

template<typename T>
    requires WireArithmetic<T>
struct Serializable<T> {
    static Result<wire::Value> serialize(const T& value, const Encoder& encoder) {
        return encoder.encode_scalar(value);
    }
};

template<typename T>
    requires WireArithmetic<T>
struct Deserializable<T> {
    static Result<T> deserialize(const Decoder& decoder) {
        if constexpr (std::is_same_v<T, bool>) {
            return decoder.decode_bool();
        } else if constexpr (std::is_floating_point_v<T>) {
            auto value = decoder.decode_double();
            if (!value) {
                return std::move(value).error();
            }
            return static_cast<T>(*value);
        } else {
            return decoder.decode_integer<T>();
        }
    }
};

// ============================================================================
// char
// ============================================================================

template<>
struct VariantType<char> {
    static TypeNodePtr node() { return TypeNode::leaf("s"); }
};

template<>
struct Serializable<char> {
    static Result<wire::Value> serialize(const char& value, const Encoder& encoder) {
        return encoder.encode_char(value);
    }
};

template<>
struct Deserializable<char> {
    static Result<char> deserialize(const Decoder& decoder) {
        return decoder.decode_char();
    }
};

// ============================================================================
// std::string
// ============================================================================

template<>
struct VariantType<std::string> {
    static TypeNodePtr node() { return TypeNode::leaf("s"); }
};

template<>
struct Serializable<std::string> {
    static Result<wire::Value> serialize(const std::string& value, const Encoder& encoder) {
        return encoder.encode_str(value);
    }
};

template<>
struct Deserializable<std::string> {
    static Result<std::string> deserialize(const Decoder& decoder) {
        return decoder.decode_string();
    }
};

// ============================================================================
// std::monostate (unit)
// ============================================================================

template<>
struct VariantType<std::monostate> {
    static TypeNodePtr node() { return TypeNode::unit(); }
};

template<>
struct Serializable<std::monostate> {
    static Result<wire::Value> serialize(const std::monostate&, const Encoder& encoder) {
        return encoder.encode_unit();
    }
};

template<>
struct Deserializable<std::monostate> {
    static Result<std::monostate> deserialize(const Decoder& decoder) {
        auto unit = decoder.decode_unit();
        if (!unit) {
            return unit.error();
        }
        return std::monostate{};
    }
};

} // namespace varserde
