/**
 * @file dynamic_value.hpp
 * @brief Value of any wire type, encoded as a box 'v'
 *
 * Carries content whose static type is not known up front. Decoding a box
 * yields its content; decoding anything else keeps the value as is, so a
 * DynamicValue field accepts both "<5>" and "5".
 *
 * @code
 * auto dynamic = DynamicValue::from(std::vector<uint32_t>{1, 2, 3});
 * encode(*dynamic)->to_string();   // "<[uint32 1, 2, 3]>"
 * @endcode
 */

#pragma once

#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/error.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"
#include "varserde/wire/value.hpp"

#include <string>
#include <utility>

namespace varserde {

class DynamicValue {
public:
    /// Holds the unit value
    DynamicValue() = default;

    explicit DynamicValue(wire::Value value) : value_(std::move(value)) {}

    /// Encode @p value with its own node and hold the result
    template<SerializableType T>
    static Result<DynamicValue> from(const T& value) {
        auto encoded = Encoder(type_node_ptr_of<T>()).encode(value);
        if (!encoded) {
            return std::move(encoded).error();
        }
        return DynamicValue(std::move(*encoded));
    }

    const wire::Value& value() const { return value_; }
    std::string signature() const { return value_.type_string(); }

    /// Decode the held value as T
    template<DeserializableType T>
    Result<T> get() const {
        return Decoder(value_).decode<T>();
    }

    bool operator==(const DynamicValue& other) const { return value_ == other.value_; }
    bool operator!=(const DynamicValue& other) const { return !(*this == other); }

private:
    wire::Value value_;
};

template<>
struct VariantType<DynamicValue> {
    static TypeNodePtr node() { return TypeNode::leaf("v"); }
};

template<>
struct Serializable<DynamicValue> {
    static Result<wire::Value> serialize(const DynamicValue& value, const Encoder& encoder) {
        return encoder.encode_box(value.value());
    }
};

template<>
struct Deserializable<DynamicValue> {
    static Result<DynamicValue> deserialize(const Decoder& decoder) {
        return decoder.visit([&decoder](auto&& x) -> Result<DynamicValue> {
            if constexpr (std::is_same_v<std::decay_t<decltype(x)>, BoxAccess>) {
                return DynamicValue(x.value());
            } else {
                return DynamicValue(decoder.value());
            }
        });
    }
};

} // namespace varserde
