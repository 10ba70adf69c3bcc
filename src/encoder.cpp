#include "varserde/encoder.hpp"

namespace varserde {

namespace {

template<typename I>
Result<wire::Value> numeric_tag(const VariantTag& tag, std::string_view tag_type) {
    auto number = tag.number_as<I>();
    if (!number) {
        return Error::overflow(tag_type);
    }
    return wire::Value::of(*number);
}

} // namespace

Encoder::Encoder(TypeNodePtr node) : node_(std::move(node)) {
    if (!node_) {
        node_ = TypeNode::leaf(std::string(1, wire::code::ANY));
    }
}

Encoder Encoder::child(std::size_t index) const {
    return Encoder(node_->child_or_derived(index));
}

// ============================================================================
// Scalars
// ============================================================================

Result<wire::Value> Encoder::encode_bool(bool value) const {
    return wire::Value::of(value);
}

Result<wire::Value> Encoder::encode_double(double value) const {
    return wire::Value::of(value);
}

Result<wire::Value> Encoder::encode_char(char value) const {
    return encode_str(std::string_view(&value, 1));
}

Result<wire::Value> Encoder::encode_str(std::string_view value) const {
    const std::string& sig = node_->signature;
    if (sig.size() == 1) {
        switch (sig[0]) {
            case wire::code::STRING:
            case wire::code::ANY:
                if (!wire::is_valid_utf8(value)) {
                    return Error{ErrorCode::ValidationFailure, "String is not valid UTF-8"};
                }
                return wire::Value::string(value);
            case wire::code::OBJECT_PATH:
                if (!wire::is_valid_object_path(value)) {
                    return Error{ErrorCode::TypeMismatch,
                                 "Type mismatch: '" + std::string(value) + "' is not a valid object path"};
                }
                return wire::Value::object_path(value);
            case wire::code::SIGNATURE:
                if (!wire::is_valid_signature(value)) {
                    return Error{ErrorCode::TypeMismatch,
                                 "Type mismatch: '" + std::string(value) + "' is not a valid signature"};
                }
                return wire::Value::signature(value);
            default:
                break;
        }
    }
    return Error::str_mismatch(sig);
}

// ============================================================================
// Maybe, unit, box
// ============================================================================

Result<wire::Value> Encoder::encode_none() const {
    std::string element = element_signature();
    if (!wire::is_valid_type(element)) {
        return Error::type_mismatch("definite maybe element", node_->signature);
    }
    return wire::Value::maybe(element, std::nullopt);
}

Result<wire::Value> Encoder::encode_some(wire::Value inner) const {
    std::string element = element_signature();
    if (!wire::type_matches(inner.type_string(), element)) {
        return Error::type_mismatch(element, inner.type_string());
    }
    std::string element_type = inner.type_string();
    return wire::Value::maybe(element_type, std::move(inner));
}

Result<wire::Value> Encoder::encode_unit() const {
    return wire::Value();
}

Result<wire::Value> Encoder::encode_box(wire::Value inner) const {
    return wire::Value::boxed(std::move(inner));
}

Result<wire::Value> Encoder::encode_bool_seq(const std::vector<bool>& elements) const {
    std::string element = element_signature();
    if (wire::is_array(node_->signature) && element == "b") {
        std::vector<std::byte> bytes;
        bytes.reserve(elements.size());
        for (bool value : elements) {
            bytes.push_back(value ? std::byte{1} : std::byte{0});
        }
        return wire::Value::packed_array(wire::code::BOOLEAN, std::move(bytes));
    }

    Encoder element_encoder = child(0);
    std::vector<wire::Value> encoded;
    encoded.reserve(elements.size());
    for (bool value : elements) {
        auto item = element_encoder.encode_bool(value);
        if (!item) {
            return std::move(item).error();
        }
        encoded.push_back(std::move(*item));
    }
    return make_array(std::move(encoded));
}

// ============================================================================
// Arrays
// ============================================================================

std::string Encoder::element_signature() const {
    const std::string& sig = node_->signature;
    if (wire::is_array(sig) || wire::is_maybe(sig)) {
        return wire::element_of(sig);
    }
    if (!node_->children.empty()) {
        return node_->children.front()->signature;
    }
    return std::string(1, wire::code::ANY);
}

Result<wire::Value> Encoder::make_array(std::vector<wire::Value> elements) const {
    std::string element = element_signature();

    if (!wire::is_definite(element) || !wire::is_valid_pattern(element)) {
        if (elements.empty()) {
            return Error::type_mismatch("definite array element", node_->signature);
        }
        std::string inferred = elements.front().type_string();
        if (!wire::type_matches(inferred, element)) {
            return Error::type_mismatch(element, inferred);
        }
        element = std::move(inferred);
    }

    for (const auto& item : elements) {
        if (item.type_string() != element) {
            return Error::type_mismatch(element, item.type_string());
        }
    }
    return wire::Value::array(element, std::move(elements));
}

// ============================================================================
// Enum variants
// ============================================================================

std::string Encoder::tag_signature() const {
    const std::string& sig = node_->signature;
    if (wire::is_tuple(sig)) {
        return wire::item_of(sig, 0);
    }
    return sig;
}

Result<wire::Value> Encoder::encode_tag(const VariantTag& tag) const {
    const std::string& sig = node_->signature;
    if (wire::is_tuple(sig) && wire::tuple_items(sig).empty()) {
        return Error::unsupported_type(sig);
    }

    std::string tag_type = tag_signature();
    if (tag_type.size() != 1) {
        return Error::invalid_tag(tag_type);
    }

    char code = tag_type[0];
    if (code == wire::code::STRING) {
        if (!tag.has_name) {
            return Error::invalid_tag(tag_type);
        }
        return wire::Value::string(tag.name);
    }
    if (!wire::is_integer_code(code) || !tag.has_number) {
        return Error::invalid_tag(tag_type);
    }

    switch (code) {
        case wire::code::BYTE:   return numeric_tag<std::uint8_t>(tag, "uint8");
        case wire::code::INT16:  return numeric_tag<std::int16_t>(tag, "int16");
        case wire::code::UINT16: return numeric_tag<std::uint16_t>(tag, "uint16");
        case wire::code::INT32:  return numeric_tag<std::int32_t>(tag, "int32");
        case wire::code::UINT32: return numeric_tag<std::uint32_t>(tag, "uint32");
        case wire::code::INT64:  return numeric_tag<std::int64_t>(tag, "int64");
        case wire::code::UINT64: return numeric_tag<std::uint64_t>(tag, "uint64");
        default:
            return Error::invalid_tag(tag_type);
    }
}

Result<wire::Value> Encoder::encode_unit_variant(const VariantTag& tag) const {
    auto encoded_tag = encode_tag(tag);
    if (!encoded_tag) {
        return encoded_tag;
    }
    if (!has_payload_slot()) {
        return encoded_tag;
    }
    return wire::Value::tuple({std::move(*encoded_tag), wire::Value::boxed(wire::Value())});
}

Result<wire::Value> Encoder::encode_variant(const VariantTag& tag, wire::Value payload) const {
    if (!has_payload_slot()) {
        return Error::unsupported_type(node_->signature);
    }
    auto encoded_tag = encode_tag(tag);
    if (!encoded_tag) {
        return encoded_tag;
    }
    return wire::Value::tuple({std::move(*encoded_tag), wire::Value::boxed(std::move(payload))});
}

} // namespace varserde
