#include "varserde/wire/value.hpp"
#include "varserde/wire/signature.hpp"

#include <glib.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace varserde::wire {

namespace {

struct TypeFree {
    void operator()(GVariantType* type) const { g_variant_type_free(type); }
};

std::unique_ptr<GVariantType, TypeFree> make_type(std::string_view type) {
    return std::unique_ptr<GVariantType, TypeFree>(g_variant_type_new(std::string(type).c_str()));
}

std::vector<GVariant*> pointers_of(const std::vector<Value>& children) {
    std::vector<GVariant*> pointers;
    pointers.reserve(children.size());
    for (const auto& child : children) {
        pointers.push_back(child.gvariant());
    }
    return pointers;
}

} // namespace

// ============================================================================
// Ownership
// ============================================================================

Value::Value()
    : value_(g_variant_ref_sink(g_variant_new_tuple(nullptr, 0))) {}

Value::Value(const Value& other)
    : value_(g_variant_ref(other.value_)) {}

Value::Value(Value&& other) noexcept
    : value_(std::exchange(other.value_, nullptr)) {}

Value& Value::operator=(Value other) noexcept {
    std::swap(value_, other.value_);
    return *this;
}

Value::~Value() {
    if (value_ != nullptr) {
        g_variant_unref(value_);
    }
}

Value Value::take(GVariant* value) {
    if (value == nullptr) {
        throw std::invalid_argument("Null GVariant");
    }
    return Value(g_variant_take_ref(value));
}

// ============================================================================
// Construction
// ============================================================================

template<FixedScalar T>
Value Value::of(T scalar) {
    if constexpr (std::is_same_v<T, bool>) {
        return take(g_variant_new_boolean(scalar));
    } else if constexpr (std::is_same_v<T, std::uint8_t>) {
        return take(g_variant_new_byte(scalar));
    } else if constexpr (std::is_same_v<T, std::int16_t>) {
        return take(g_variant_new_int16(scalar));
    } else if constexpr (std::is_same_v<T, std::uint16_t>) {
        return take(g_variant_new_uint16(scalar));
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return take(g_variant_new_int32(scalar));
    } else if constexpr (std::is_same_v<T, std::uint32_t>) {
        return take(g_variant_new_uint32(scalar));
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return take(g_variant_new_int64(scalar));
    } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        return take(g_variant_new_uint64(scalar));
    } else {
        return take(g_variant_new_double(scalar));
    }
}

template Value Value::of<bool>(bool);
template Value Value::of<std::uint8_t>(std::uint8_t);
template Value Value::of<std::int16_t>(std::int16_t);
template Value Value::of<std::uint16_t>(std::uint16_t);
template Value Value::of<std::int32_t>(std::int32_t);
template Value Value::of<std::uint32_t>(std::uint32_t);
template Value Value::of<std::int64_t>(std::int64_t);
template Value Value::of<std::uint64_t>(std::uint64_t);
template Value Value::of<double>(double);

Value Value::handle(std::int32_t index) {
    return take(g_variant_new_handle(index));
}

Value Value::string(std::string_view text) {
    if (!is_valid_utf8(text)) {
        throw std::invalid_argument("String is not valid UTF-8");
    }
    return take(g_variant_new_string(std::string(text).c_str()));
}

Value Value::object_path(std::string_view path) {
    if (!is_valid_object_path(path)) {
        throw std::invalid_argument("Invalid object path: '" + std::string(path) + "'");
    }
    return take(g_variant_new_object_path(std::string(path).c_str()));
}

Value Value::signature(std::string_view sig) {
    if (!is_valid_signature(sig)) {
        throw std::invalid_argument("Invalid signature: '" + std::string(sig) + "'");
    }
    return take(g_variant_new_signature(std::string(sig).c_str()));
}

Value Value::boxed(Value inner) {
    return take(g_variant_new_variant(inner.value_));
}

Value Value::maybe(std::string_view element_type, std::optional<Value> child) {
    if (!is_valid_type(element_type) || is_dict_entry(element_type)) {
        throw std::invalid_argument("Invalid maybe element type: '" + std::string(element_type) + "'");
    }
    if (child && child->type_string() != element_type) {
        throw std::invalid_argument("Maybe child of type '" + child->type_string() +
                                    "' does not match '" + std::string(element_type) + "'");
    }
    auto type = make_type(element_type);
    return take(g_variant_new_maybe(type.get(), child ? child->value_ : nullptr));
}

Value Value::array(std::string_view element_type, std::vector<Value> children) {
    bool entry = is_dict_entry(element_type);
    if (!is_valid_type(element_type) || (entry && !is_valid_type("a" + std::string(element_type)))) {
        throw std::invalid_argument("Invalid array element type: '" + std::string(element_type) + "'");
    }
    for (const auto& child : children) {
        if (child.type_string() != element_type) {
            throw std::invalid_argument("Array element of type '" + child.type_string() +
                                        "' does not match '" + std::string(element_type) + "'");
        }
    }

    auto type = make_type(element_type);
    auto pointers = pointers_of(children);
    return take(g_variant_new_array(type.get(), pointers.data(), pointers.size()));
}

Value Value::packed_array(char element_code, std::vector<std::byte> bytes) {
    std::size_t width = fixed_size_of(element_code);
    if (width == 0 || bytes.size() % width != 0) {
        throw std::invalid_argument("Invalid packed array of '" + std::string(1, element_code) + "'");
    }
    if (element_code == code::BOOLEAN) {
        for (auto& b : bytes) {
            b = b == std::byte{0} ? std::byte{0} : std::byte{1};
        }
    }
    return make_packed(element_code, bytes.data(), bytes.size() / width);
}

Value Value::make_packed(char element_code, const void* data, std::size_t count) {
    auto type = make_type(std::string_view(&element_code, 1));
    if (count == 0) {
        return take(g_variant_new_array(type.get(), nullptr, 0));
    }
    return take(g_variant_new_fixed_array(type.get(), data, count, fixed_size_of(element_code)));
}

Value Value::tuple(std::vector<Value> children) {
    auto pointers = pointers_of(children);
    return take(g_variant_new_tuple(pointers.data(), pointers.size()));
}

Value Value::dict_entry(Value key, Value value) {
    std::string key_type = key.type_string();
    if (key_type.size() != 1 || !is_basic_code(key_type[0])) {
        throw std::invalid_argument("Dict entry key must be basic, got '" + key_type + "'");
    }
    return take(g_variant_new_dict_entry(key.value_, value.value_));
}

// ============================================================================
// Self description
// ============================================================================

std::string Value::type_string() const {
    return std::string(g_variant_get_type_string(value_));
}

ValueClass Value::classify() const {
    switch (g_variant_classify(value_)) {
        case G_VARIANT_CLASS_BOOLEAN:     return ValueClass::Boolean;
        case G_VARIANT_CLASS_BYTE:        return ValueClass::Byte;
        case G_VARIANT_CLASS_INT16:       return ValueClass::Int16;
        case G_VARIANT_CLASS_UINT16:      return ValueClass::Uint16;
        case G_VARIANT_CLASS_INT32:       return ValueClass::Int32;
        case G_VARIANT_CLASS_UINT32:      return ValueClass::Uint32;
        case G_VARIANT_CLASS_INT64:       return ValueClass::Int64;
        case G_VARIANT_CLASS_UINT64:      return ValueClass::Uint64;
        case G_VARIANT_CLASS_HANDLE:      return ValueClass::Handle;
        case G_VARIANT_CLASS_DOUBLE:      return ValueClass::Double;
        case G_VARIANT_CLASS_STRING:      return ValueClass::String;
        case G_VARIANT_CLASS_OBJECT_PATH: return ValueClass::ObjectPath;
        case G_VARIANT_CLASS_SIGNATURE:   return ValueClass::Signature;
        case G_VARIANT_CLASS_VARIANT:     return ValueClass::Variant;
        case G_VARIANT_CLASS_MAYBE:       return ValueClass::Maybe;
        case G_VARIANT_CLASS_ARRAY:       return ValueClass::Array;
        case G_VARIANT_CLASS_TUPLE:       return ValueClass::Tuple;
        case G_VARIANT_CLASS_DICT_ENTRY:  return ValueClass::DictEntry;
    }
    throw std::logic_error("Unknown class for '" + type_string() + "'");
}

bool Value::is_container() const {
    return g_variant_is_container(value_);
}

bool Value::is_packed() const {
    const gchar* type = g_variant_get_type_string(value_);
    return type[0] == code::ARRAY && is_fixed_code(type[1]) && type[2] == '\0';
}

std::size_t Value::n_children() const {
    return is_container() ? g_variant_n_children(value_) : 0;
}

Value Value::child(std::size_t index) const {
    if (index >= n_children()) {
        throw std::out_of_range("Child index " + std::to_string(index) + " out of range for '" +
                                type_string() + "'");
    }
    return take(g_variant_get_child_value(value_, index));
}

// ============================================================================
// Scalar access
// ============================================================================

template<FixedScalar T>
T Value::get() const {
    const gchar* type = g_variant_get_type_string(value_);
    if (type[0] != scalar_code_v<T> || type[1] != '\0') {
        throw std::logic_error("Value of type '" + type_string() + "' read as '" +
                               std::string(1, scalar_code_v<T>) + "'");
    }
    if constexpr (std::is_same_v<T, bool>) {
        return g_variant_get_boolean(value_);
    } else if constexpr (std::is_same_v<T, std::uint8_t>) {
        return g_variant_get_byte(value_);
    } else if constexpr (std::is_same_v<T, std::int16_t>) {
        return g_variant_get_int16(value_);
    } else if constexpr (std::is_same_v<T, std::uint16_t>) {
        return g_variant_get_uint16(value_);
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return g_variant_get_int32(value_);
    } else if constexpr (std::is_same_v<T, std::uint32_t>) {
        return g_variant_get_uint32(value_);
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return g_variant_get_int64(value_);
    } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        return g_variant_get_uint64(value_);
    } else {
        return g_variant_get_double(value_);
    }
}

template bool Value::get<bool>() const;
template std::uint8_t Value::get<std::uint8_t>() const;
template std::int16_t Value::get<std::int16_t>() const;
template std::uint16_t Value::get<std::uint16_t>() const;
template std::int32_t Value::get<std::int32_t>() const;
template std::uint32_t Value::get<std::uint32_t>() const;
template std::int64_t Value::get<std::int64_t>() const;
template std::uint64_t Value::get<std::uint64_t>() const;
template double Value::get<double>() const;

std::int32_t Value::get_handle() const {
    if (classify() != ValueClass::Handle) {
        throw std::logic_error("Value of type '" + type_string() + "' read as 'h'");
    }
    return g_variant_get_handle(value_);
}

std::string_view Value::str() const {
    switch (classify()) {
        case ValueClass::String:
        case ValueClass::ObjectPath:
        case ValueClass::Signature: {
            gsize length = 0;
            const gchar* text = g_variant_get_string(value_, &length);
            return std::string_view(text, length);
        }
        default:
            throw std::logic_error("Value of type '" + type_string() + "' read as a string");
    }
}

Value Value::unboxed() const {
    if (classify() != ValueClass::Variant) {
        throw std::logic_error("Value of type '" + type_string() + "' is not a box");
    }
    return take(g_variant_get_variant(value_));
}

const void* Value::packed_data(char element_code, std::size_t width, std::size_t& count) const {
    const gchar* type = g_variant_get_type_string(value_);
    if (!is_packed() || type[1] != element_code) {
        throw std::logic_error("Value of type '" + type_string() + "' is not a packed array of '" +
                               std::string(1, element_code) + "'");
    }
    gsize n = 0;
    const void* data = g_variant_get_fixed_array(value_, &n, width);
    count = n;
    return data;
}

// ============================================================================
// Comparison and text
// ============================================================================

bool Value::operator==(const Value& other) const {
    return value_ == other.value_ || g_variant_equal(value_, other.value_);
}

std::string Value::print(bool type_annotate) const {
    gchar* text = g_variant_print(value_, type_annotate);
    std::string result(text);
    g_free(text);
    return result;
}

} // namespace varserde::wire
