/**
 * @file decoder.hpp
 * @brief Decoding of self-describing wire values through a uniform visitor
 *
 * The Decoder dispatches on the wire value's own classification and hands
 * the visitor exactly one of:
 *
 *   bool, uint8_t, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t,
 *   double, std::string_view (s, o and g), MaybeAccess, SeqAccess (arrays),
 *   MapAccess (dictionaries), Unit ("()"), TupleAccess (tuples and dict
 *   entries), BoxAccess (boxes).
 *
 * Handles have no mapping and yield UnsupportedType. The typed helpers
 * (decode_integer, decode_string, decode_tuple, decode_enum, ...) are built
 * on visit() and report TypeMismatch when the wire shape is not what the
 * target expects.
 *
 * Example:
 * @code
 * Decoder decoder(*wire::parse("(1, 'Item')"));
 * auto count = decoder.visit([](auto&& x) -> Result<std::size_t> {
 *     if constexpr (std::is_same_v<std::decay_t<decltype(x)>, TupleAccess>) {
 *         return x.size();
 *     } else {
 *         return Error::custom("not a tuple");
 *     }
 * });
 * @endcode
 */

#pragma once

#include "varserde/error.hpp"
#include "varserde/helpers/type_name.hpp"
#include "varserde/tag.hpp"
#include "varserde/traits.hpp"
#include "varserde/wire/signature.hpp"
#include "varserde/wire/value.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace varserde {

class Decoder;

/// The unit value "()"
struct Unit {};

// ============================================================================
// Container access
// ============================================================================

class MaybeAccess {
public:
    explicit MaybeAccess(wire::Value value) : value_(std::move(value)) {}

    bool has_value() const { return value_.n_children() == 1; }
    std::string element_signature() const { return wire::element_of(value_.type_string()); }

    /// Present content; only valid if has_value()
    Decoder value() const;

private:
    wire::Value value_;
};

class SeqAccess {
public:
    explicit SeqAccess(wire::Value value) : value_(std::move(value)) {}

    std::size_t size() const { return value_.n_children(); }
    Decoder element(std::size_t index) const;

    /// Element type of an array, "*" for a tuple
    std::string element_signature() const { return wire::element_of(value_.type_string()); }

    /// True if the elements are stored as a packed buffer of T
    template<wire::FixedScalar T>
    bool is_fixed() const {
        const std::string& type = value_.type_string();
        return value_.is_packed() && type.size() == 2 && type[1] == wire::scalar_code_v<T>;
    }

    /// Zero-copy view of packed elements; check is_fixed<T>() first
    template<wire::FixedScalar T>
    std::span<const T> fixed() const { return value_.fixed_array<T>(); }

private:
    wire::Value value_;
};

class MapAccess {
public:
    explicit MapAccess(wire::Value value) : value_(std::move(value)) {}

    std::size_t size() const { return value_.n_children(); }
    Decoder key(std::size_t index) const;
    Decoder value(std::size_t index) const;

    /// Call @p fn(key_decoder, value_decoder) for each entry, stopping at the first error
    template<typename F>
    Result<void> for_each(F&& fn) const;

private:
    wire::Value value_;
};

class TupleAccess {
public:
    explicit TupleAccess(wire::Value value) : value_(std::move(value)) {}

    std::size_t size() const { return value_.n_children(); }
    Decoder item(std::size_t index) const;

private:
    wire::Value value_;
};

class BoxAccess {
public:
    explicit BoxAccess(wire::Value value) : inner_(value.unboxed()) {}

    std::string signature() const { return inner_.type_string(); }
    const wire::Value& value() const { return inner_; }
    Decoder inner() const;

private:
    wire::Value inner_;
};

// ============================================================================
// EnumAccess
// ============================================================================

/**
 * @brief Two-step enum decoding: read the tag, then the variant
 *
 * States: Start -> ReadTag -> UnitVariant -> Done, or
 *         Start -> ReadTag -> NonUnitVariant -> ReadPayload -> Done.
 *
 * A bare scalar is a tag of an all-unit enum. A container is a
 * (tag, <payload>) pair. Calling the steps out of order throws
 * std::logic_error.
 */
class EnumAccess {
public:
    enum class State { Start, ReadTag, UnitVariant, NonUnitVariant, ReadPayload, Done };

    explicit EnumAccess(wire::Value value) : value_(std::move(value)) {}

    State state() const { return state_; }

    /// True if the value carries a (tag, payload) pair
    bool has_payload() const { return value_.is_container(); }

    /// Name for 's' tags, number for integer tags, InvalidTag otherwise
    Result<VariantTag> tag();

    /// Finish a unit variant; a payload, if present, must be "()"
    Result<void> unit_variant();

    /// Decoder for a non-unit variant's payload
    Result<Decoder> payload();

    /// Decode the payload as T and finish
    template<typename T>
    Result<T> read_payload();

private:
    void require(State expected, const char* step) const;

    wire::Value value_;
    State state_ = State::Start;
};

// ============================================================================
// Decoder
// ============================================================================

class Decoder {
public:
    explicit Decoder(wire::Value value) : value_(std::move(value)) {}

    const wire::Value& value() const { return value_; }
    std::string signature() const { return value_.type_string(); }

    template<DeserializableType T>
    Result<T> decode() const {
        return Deserializable<T>::deserialize(*this);
    }

    /**
     * @brief Present the value to @p visitor by its own classification
     *
     * The visitor's result type is taken from its bool overload and must be
     * constructible from Error.
     */
    template<typename Visitor>
    auto visit(Visitor&& visitor) const -> std::invoke_result_t<Visitor, bool>;

    // ------------------------------------------------------------------------
    // Typed helpers
    // ------------------------------------------------------------------------

    Result<bool> decode_bool() const;

    /// Any integer class, range-checked into I
    template<std::integral I>
        requires (!std::is_same_v<I, bool>)
    Result<I> decode_integer() const;

    Result<double> decode_double() const;

    /// Text of a string, object path or signature
    Result<std::string> decode_string() const;

    Result<char> decode_char() const;

    Result<MaybeAccess> decode_maybe() const;

    /// Array (including dictionaries) or tuple
    Result<SeqAccess> decode_seq() const;

    Result<MapAccess> decode_map() const;

    /// Tuple or dict entry with exactly @p length items
    Result<TupleAccess> decode_tuple(std::size_t length) const;

    Result<void> decode_unit() const;

    Result<BoxAccess> decode_box() const;

    Result<EnumAccess> decode_enum() const;

private:
    wire::Value value_;
};

// ============================================================================
// Implementation
// ============================================================================

inline Decoder MaybeAccess::value() const { return Decoder(value_.child(0)); }
inline Decoder SeqAccess::element(std::size_t index) const { return Decoder(value_.child(index)); }
inline Decoder MapAccess::key(std::size_t index) const { return Decoder(value_.child(index).child(0)); }
inline Decoder MapAccess::value(std::size_t index) const { return Decoder(value_.child(index).child(1)); }
inline Decoder TupleAccess::item(std::size_t index) const { return Decoder(value_.child(index)); }
inline Decoder BoxAccess::inner() const { return Decoder(inner_); }

template<typename F>
Result<void> MapAccess::for_each(F&& fn) const {
    for (std::size_t i = 0; i < size(); ++i) {
        wire::Value entry = value_.child(i);
        Result<void> result = fn(Decoder(entry.child(0)), Decoder(entry.child(1)));
        if (!result) {
            return result;
        }
    }
    return Result<void>::ok();
}

template<typename T>
Result<T> EnumAccess::read_payload() {
    auto decoder = payload();
    if (!decoder) {
        return std::move(decoder).error();
    }
    auto result = decoder->template decode<T>();
    state_ = State::Done;
    return result;
}

template<typename Visitor>
auto Decoder::visit(Visitor&& visitor) const -> std::invoke_result_t<Visitor, bool> {
    using R = std::invoke_result_t<Visitor, bool>;

    switch (value_.classify()) {
        case wire::ValueClass::Boolean:    return visitor(value_.get<bool>());
        case wire::ValueClass::Byte:       return visitor(value_.get<std::uint8_t>());
        case wire::ValueClass::Int16:      return visitor(value_.get<std::int16_t>());
        case wire::ValueClass::Uint16:     return visitor(value_.get<std::uint16_t>());
        case wire::ValueClass::Int32:      return visitor(value_.get<std::int32_t>());
        case wire::ValueClass::Uint32:     return visitor(value_.get<std::uint32_t>());
        case wire::ValueClass::Int64:      return visitor(value_.get<std::int64_t>());
        case wire::ValueClass::Uint64:     return visitor(value_.get<std::uint64_t>());
        case wire::ValueClass::Double:     return visitor(value_.get<double>());
        case wire::ValueClass::String:
        case wire::ValueClass::ObjectPath:
        case wire::ValueClass::Signature:  return visitor(value_.str());
        case wire::ValueClass::Variant:    return visitor(BoxAccess(value_));
        case wire::ValueClass::Maybe:      return visitor(MaybeAccess(value_));
        case wire::ValueClass::Array:
            if (wire::is_dict(value_.type_string())) {
                return visitor(MapAccess(value_));
            }
            return visitor(SeqAccess(value_));
        case wire::ValueClass::Tuple:
            if (value_.n_children() == 0) {
                return visitor(Unit{});
            }
            return visitor(TupleAccess(value_));
        case wire::ValueClass::DictEntry:  return visitor(TupleAccess(value_));
        case wire::ValueClass::Handle:
            break;
    }
    return R(Error::unsupported_type(value_.type_string()));
}

template<std::integral I>
    requires (!std::is_same_v<I, bool>)
Result<I> Decoder::decode_integer() const {
    return visit([this](auto&& x) -> Result<I> {
        using X = std::decay_t<decltype(x)>;
        if constexpr (std::is_integral_v<X> && !std::is_same_v<X, bool>) {
            if (!std::in_range<I>(x)) {
                return Error::overflow(get_type_name<I>());
            }
            return static_cast<I>(x);
        } else {
            return Error::type_mismatch("integer", value_.type_string());
        }
    });
}

} // namespace varserde
