/**
 * @file value.hpp
 * @brief Immutable, reference-counted, self-describing wire value
 *
 * Value is an RAII handle over a GLib GVariant. It always knows its own type
 * string and top-level class. Values are built bottom-up from fully
 * constructed children and never change after construction; copies share
 * the underlying GVariant through its reference count.
 *
 * Arrays whose element type is a fixed-width primitive are serialized as one
 * packed buffer regardless of which constructor built them, so a packed
 * build and an element-by-element build of the same data compare equal.
 *
 * Example:
 * @code
 * auto v = Value::tuple({Value::of<int32_t>(1), Value::string("Item")});
 * v.type_string();   // "(is)"
 * v.to_string();     // "(1, 'Item')"
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

typedef struct _GVariant GVariant;

namespace varserde::wire {

// ============================================================================
// Classification
// ============================================================================

enum class ValueClass {
    Boolean,
    Byte,
    Int16,
    Uint16,
    Int32,
    Uint32,
    Int64,
    Uint64,
    Handle,
    Double,
    String,
    ObjectPath,
    Signature,
    Variant,
    Maybe,
    Array,
    Tuple,
    DictEntry
};

constexpr const char* to_string(ValueClass cls) {
    switch (cls) {
        case ValueClass::Boolean:    return "boolean";
        case ValueClass::Byte:       return "byte";
        case ValueClass::Int16:      return "int16";
        case ValueClass::Uint16:     return "uint16";
        case ValueClass::Int32:      return "int32";
        case ValueClass::Uint32:     return "uint32";
        case ValueClass::Int64:      return "int64";
        case ValueClass::Uint64:     return "uint64";
        case ValueClass::Handle:     return "handle";
        case ValueClass::Double:     return "double";
        case ValueClass::String:     return "string";
        case ValueClass::ObjectPath: return "objectpath";
        case ValueClass::Signature:  return "signature";
        case ValueClass::Variant:    return "variant";
        case ValueClass::Maybe:      return "maybe";
        case ValueClass::Array:      return "array";
        case ValueClass::Tuple:      return "tuple";
        case ValueClass::DictEntry:  return "dict entry";
    }
    return "unknown";
}

// ============================================================================
// Fixed-width scalar mapping
// ============================================================================

template<typename T> struct scalar_code;
template<> struct scalar_code<bool>          { static constexpr char value = 'b'; };
template<> struct scalar_code<std::uint8_t>  { static constexpr char value = 'y'; };
template<> struct scalar_code<std::int16_t>  { static constexpr char value = 'n'; };
template<> struct scalar_code<std::uint16_t> { static constexpr char value = 'q'; };
template<> struct scalar_code<std::int32_t>  { static constexpr char value = 'i'; };
template<> struct scalar_code<std::uint32_t> { static constexpr char value = 'u'; };
template<> struct scalar_code<std::int64_t>  { static constexpr char value = 'x'; };
template<> struct scalar_code<std::uint64_t> { static constexpr char value = 't'; };
template<> struct scalar_code<double>        { static constexpr char value = 'd'; };

template<typename T>
inline constexpr char scalar_code_v = scalar_code<T>::value;

/// One of the nine C++ types with a fixed-width wire representation
template<typename T>
concept FixedScalar = requires { scalar_code<T>::value; };

// ============================================================================
// Value
// ============================================================================

class Value {
public:
    /// The unit value "()"
    Value();

    Value(const Value& other);
    Value(Value&& other) noexcept;
    Value& operator=(Value other) noexcept;
    ~Value();

    /**
     * @brief Take ownership of one reference to @p value
     *
     * A floating reference (fresh from g_variant_new_*) is sunk; a full
     * reference (g_variant_parse, g_variant_get_child_value) is adopted.
     * @throws std::invalid_argument if @p value is null
     */
    static Value take(GVariant* value);

    /// Borrowed pointer, valid while this Value lives
    GVariant* gvariant() const { return value_; }

    // ------------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------------

    template<FixedScalar T>
    static Value of(T scalar);

    static Value handle(std::int32_t index);

    /// @throws std::invalid_argument if @p text is not valid UTF-8 or contains NUL
    static Value string(std::string_view text);

    /// @throws std::invalid_argument if @p path is not a valid object path
    static Value object_path(std::string_view path);

    /// @throws std::invalid_argument if @p sig is not a valid signature
    static Value signature(std::string_view sig);

    /// Dynamic box holding @p inner ("v")
    static Value boxed(Value inner);

    /// "m<element_type>", present or absent
    /// @throws std::invalid_argument on an indefinite type or a child of another type
    static Value maybe(std::string_view element_type, std::optional<Value> child);

    /// "a<element_type>"; packs fixed-width elements
    /// @throws std::invalid_argument on an indefinite type or a child of another type
    static Value array(std::string_view element_type, std::vector<Value> children);

    /// Packed array built directly from a fixed-width buffer
    template<FixedScalar T>
    static Value packed_array(std::span<const T> elements);

    /// Packed array from raw little-endian-in-memory bytes of @p element_code
    /// @throws std::invalid_argument if the size is not a multiple of the width
    static Value packed_array(char element_code, std::vector<std::byte> bytes);

    static Value tuple(std::vector<Value> children);

    /// @throws std::invalid_argument if @p key is not of a basic type
    static Value dict_entry(Value key, Value value);

    // ------------------------------------------------------------------------
    // Self description
    // ------------------------------------------------------------------------

    std::string type_string() const;
    ValueClass classify() const;

    /// Maybe, array, tuple, dict entry or box
    bool is_container() const;

    /// Array whose storage is a packed fixed-width buffer
    bool is_packed() const;

    std::size_t n_children() const;

    /// @throws std::out_of_range if @p index >= n_children()
    Value child(std::size_t index) const;

    // ------------------------------------------------------------------------
    // Scalar access (class must match, else std::logic_error)
    // ------------------------------------------------------------------------

    template<FixedScalar T>
    T get() const;

    std::int32_t get_handle() const;

    /// Text of a string, object path or signature, valid while this Value lives
    std::string_view str() const;

    /// Content of a box
    Value unboxed() const;

    /// Zero-copy view of a packed array of T
    /// @throws std::logic_error if the element type is not T
    template<FixedScalar T>
    std::span<const T> fixed_array() const {
        std::size_t count = 0;
        const void* data = packed_data(scalar_code_v<T>, sizeof(T), count);
        return std::span<const T>(static_cast<const T*>(data), count);
    }

    // ------------------------------------------------------------------------
    // Comparison and text
    // ------------------------------------------------------------------------

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Canonical text; see text.hpp
    std::string print(bool type_annotate) const;
    std::string to_string() const { return print(false); }

private:
    explicit Value(GVariant* owned) noexcept : value_(owned) {}

    static Value make_packed(char element_code, const void* data, std::size_t count);
    const void* packed_data(char element_code, std::size_t width, std::size_t& count) const;

    GVariant* value_;
};

template<FixedScalar T>
Value Value::packed_array(std::span<const T> elements) {
    return make_packed(scalar_code_v<T>, elements.data(), elements.size());
}

} // namespace varserde::wire
