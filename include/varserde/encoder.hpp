/**
 * @file encoder.hpp
 * @brief Type-node driven construction of wire values
 *
 * An Encoder holds the node describing what is about to be encoded. Child
 * encoders for tuple slots, elements, keys, values and variant payloads come
 * from the node's declared children, or are derived from its signature when
 * the descriptor is sparse (TypeNode::child_or_derived).
 *
 * Scalars encode to their natural wire type. Strings follow the target
 * signature ('o' and 'g' are validated). Sequences of fixed-width primitives
 * take a packed fast path when the node's element type matches.
 *
 * Example:
 * @code
 * Encoder encoder(type_node_ptr_of<std::vector<uint32_t>>());
 * std::vector<uint32_t> data{1, 2, 3};
 * auto value = encoder.encode_fixed_seq(std::span<const uint32_t>(data));
 * value->to_string();   // "[1, 2, 3]"
 * @endcode
 */

#pragma once

#include "varserde/error.hpp"
#include "varserde/tag.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"
#include "varserde/wire/signature.hpp"
#include "varserde/wire/value.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace varserde {

// ============================================================================
// Wire scalar mapping
// ============================================================================

/// Wire representation of an arithmetic C++ type (int8 widens to int16, float to double)
template<typename T>
struct wire_scalar { using type = T; };

template<> struct wire_scalar<std::int8_t> { using type = std::int16_t; };
template<> struct wire_scalar<float> { using type = double; };

template<typename T>
using wire_scalar_t = typename wire_scalar<T>::type;

/// Arithmetic type with a fixed-width wire representation
template<typename T>
concept WireArithmetic = wire::FixedScalar<wire_scalar_t<T>>;

class SeqEncoder;
class MapEncoder;
class TupleEncoder;

// ============================================================================
// Encoder
// ============================================================================

class Encoder {
public:
    explicit Encoder(TypeNodePtr node);

    const TypeNode& node() const { return *node_; }
    const TypeNodePtr& node_ptr() const { return node_; }
    const std::string& signature() const { return node_->signature; }

    /// Encoder for a structural position of the current node
    Encoder child(std::size_t index) const;

    /// Encode @p value with this encoder's node
    template<SerializableType T>
    Result<wire::Value> encode(const T& value) const {
        return Serializable<T>::serialize(value, *this);
    }

    // ------------------------------------------------------------------------
    // Scalars
    // ------------------------------------------------------------------------

    Result<wire::Value> encode_bool(bool value) const;

    template<std::integral I>
        requires (!std::is_same_v<I, bool> && WireArithmetic<I>)
    Result<wire::Value> encode_integer(I value) const {
        return wire::Value::of(static_cast<wire_scalar_t<I>>(value));
    }

    Result<wire::Value> encode_double(double value) const;

    /// One-character string
    Result<wire::Value> encode_char(char value) const;

    /// String, object path or signature depending on the node signature
    Result<wire::Value> encode_str(std::string_view value) const;

    template<WireArithmetic T>
    Result<wire::Value> encode_scalar(T value) const {
        if constexpr (std::is_same_v<T, bool>) {
            return encode_bool(value);
        } else if constexpr (std::is_floating_point_v<T>) {
            return encode_double(static_cast<double>(value));
        } else {
            return encode_integer(value);
        }
    }

    // ------------------------------------------------------------------------
    // Maybe, unit, box
    // ------------------------------------------------------------------------

    /// Absent maybe of the element type
    Result<wire::Value> encode_none() const;

    /// Present maybe; @p inner must have the element type
    Result<wire::Value> encode_some(wire::Value inner) const;

    template<SerializableType T>
    Result<wire::Value> encode_some(const T& value) const {
        auto inner = child(0).encode(value);
        if (!inner) {
            return std::move(inner).error();
        }
        return encode_some(std::move(*inner));
    }

    Result<wire::Value> encode_unit() const;
    Result<wire::Value> encode_box(wire::Value inner) const;

    // ------------------------------------------------------------------------
    // Sequences, maps, tuples
    // ------------------------------------------------------------------------

    /**
     * @brief Encode a contiguous sequence of arithmetic values
     *
     * Writes one packed buffer when the node's element type is the wire code
     * of T; otherwise each element is encoded with the element node.
     */
    template<WireArithmetic T>
    Result<wire::Value> encode_fixed_seq(std::span<const T> elements) const;

    Result<wire::Value> encode_bool_seq(const std::vector<bool>& elements) const;

    SeqEncoder begin_seq() const;
    MapEncoder begin_map() const;
    TupleEncoder begin_tuple() const;

    // ------------------------------------------------------------------------
    // Enum variants
    // ------------------------------------------------------------------------

    /// Tag wire type: first item of a (tag, box) node, else the node itself
    std::string tag_signature() const;

    /// True if the node describes a (tag, payload) pair rather than a bare tag
    bool has_payload_slot() const { return wire::is_tuple(node_->signature); }

    /// Encoder for the payload of variant @p index
    Encoder variant_payload(std::size_t index) const { return child(index); }

    /// Bare tag for all-unit enums, (tag, <()>) inside a payload enum
    Result<wire::Value> encode_unit_variant(const VariantTag& tag) const;

    /// (tag, <payload>)
    Result<wire::Value> encode_variant(const VariantTag& tag, wire::Value payload) const;

    /// Tag value at the tag wire type
    Result<wire::Value> encode_tag(const VariantTag& tag) const;

    /// Element type for arrays built by this node, "*" if indefinite
    std::string element_signature() const;

private:
    Result<wire::Value> make_array(std::vector<wire::Value> elements) const;

    friend class SeqEncoder;
    friend class MapEncoder;

    TypeNodePtr node_;
};

// ============================================================================
// Builders
// ============================================================================

class SeqEncoder {
public:
    explicit SeqEncoder(const Encoder& parent)
        : parent_(parent), element_(parent.child(0)) {}

    template<SerializableType T>
    Result<void> element(const T& value) {
        auto encoded = element_.encode(value);
        if (!encoded) {
            return std::move(encoded).error();
        }
        elements_.push_back(std::move(*encoded));
        return Result<void>::ok();
    }

    void reserve(std::size_t count) { elements_.reserve(count); }

    Result<wire::Value> end() {
        return parent_.make_array(std::move(elements_));
    }

private:
    Encoder parent_;
    Encoder element_;
    std::vector<wire::Value> elements_;
};

class MapEncoder {
public:
    explicit MapEncoder(const Encoder& parent)
        : parent_(parent), key_(parent.child(0)), value_(parent.child(1)) {}

    template<SerializableType K, SerializableType V>
    Result<void> entry(const K& key, const V& value) {
        auto encoded_key = key_.encode(key);
        if (!encoded_key) {
            return std::move(encoded_key).error();
        }
        const std::string& key_type = encoded_key->type_string();
        if (key_type.size() != 1 || !wire::is_basic_code(key_type[0])) {
            return Error::type_mismatch("basic type", key_type);
        }
        auto encoded_value = value_.encode(value);
        if (!encoded_value) {
            return std::move(encoded_value).error();
        }
        entries_.push_back(wire::Value::dict_entry(std::move(*encoded_key), std::move(*encoded_value)));
        return Result<void>::ok();
    }

    Result<wire::Value> end() {
        return parent_.make_array(std::move(entries_));
    }

private:
    Encoder parent_;
    Encoder key_;
    Encoder value_;
    std::vector<wire::Value> entries_;
};

class TupleEncoder {
public:
    explicit TupleEncoder(const Encoder& parent) : parent_(parent) {}

    template<SerializableType T>
    Result<void> element(const T& value) {
        auto encoded = parent_.child(index_).encode(value);
        if (!encoded) {
            return std::move(encoded).error();
        }
        items_.push_back(std::move(*encoded));
        ++index_;
        return Result<void>::ok();
    }

    /// Append an already encoded item
    void push(wire::Value item) {
        items_.push_back(std::move(item));
        ++index_;
    }

    Result<wire::Value> end() {
        return wire::Value::tuple(std::move(items_));
    }

private:
    Encoder parent_;
    std::size_t index_ = 0;
    std::vector<wire::Value> items_;
};

inline SeqEncoder Encoder::begin_seq() const { return SeqEncoder(*this); }
inline MapEncoder Encoder::begin_map() const { return MapEncoder(*this); }
inline TupleEncoder Encoder::begin_tuple() const { return TupleEncoder(*this); }

template<WireArithmetic T>
Result<wire::Value> Encoder::encode_fixed_seq(std::span<const T> elements) const {
    using W = wire_scalar_t<T>;
    std::string element = element_signature();

    if (wire::is_array(node_->signature) && element.size() == 1 && element[0] == wire::scalar_code_v<W>) {
        if constexpr (std::is_same_v<T, W>) {
            return wire::Value::packed_array(elements);
        } else {
            std::vector<W> widened(elements.begin(), elements.end());
            return wire::Value::packed_array(std::span<const W>(widened));
        }
    }

    Encoder element_encoder = child(0);
    std::vector<wire::Value> encoded;
    encoded.reserve(elements.size());
    for (const T& value : elements) {
        auto item = element_encoder.encode_scalar(value);
        if (!item) {
            return std::move(item).error();
        }
        encoded.push_back(std::move(*item));
    }
    return make_array(std::move(encoded));
}

} // namespace varserde
