/**
 * @file traits.hpp
 * @brief Binding traits between C++ types and the encoder/decoder
 *
 * A type T takes part in encoding and decoding through three traits:
 * - VariantType<T>::node()                     (type_node.hpp)
 * - Serializable<T>::serialize(value, encoder)
 * - Deserializable<T>::deserialize(decoder)
 *
 * Specializations for the standard types, reflected aggregates, enums and
 * std::variant sum types live under varserde/bindings/.
 */

#pragma once

#include "varserde/error.hpp"
#include "varserde/type_node.hpp"
#include "varserde/wire/value.hpp"

#include <concepts>

namespace varserde {

class Encoder;
class Decoder;

template<typename T>
struct Serializable;

template<typename T>
struct Deserializable;

template<typename T>
concept SerializableType = requires(const T& value, const Encoder& encoder) {
    { Serializable<T>::serialize(value, encoder) } -> std::same_as<Result<wire::Value>>;
};

template<typename T>
concept DeserializableType = requires(const Decoder& decoder) {
    { Deserializable<T>::deserialize(decoder) } -> std::same_as<Result<T>>;
};

} // namespace varserde
