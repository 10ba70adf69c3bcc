/**
 * @file varserde.hpp
 * @brief VariantSerde - typed encoding to and from self-describing wire values
 *
 * Include this header for the complete library:
 *
 * @code
 * #include <varserde/varserde.hpp>
 *
 * struct Item { int32_t id; std::string name; };
 *
 * auto value = varserde::encode(Item{1, "Item"});
 * value->type_string();   // "(is)"
 * value->to_string();     // "(1, 'Item')"
 *
 * auto parsed = varserde::parse_value("(1, 'Item')");
 * auto item = varserde::decode<Item>(*parsed);
 * @endcode
 *
 * Every operation returns a Result; nothing here logs or throws for data
 * errors.
 */

#pragma once

// Core
#include "varserde/error.hpp"
#include "varserde/tag.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"
#include "varserde/enum_registry.hpp"
#include "varserde/encoder.hpp"
#include "varserde/decoder.hpp"

// Wire container
#include "varserde/wire/signature.hpp"
#include "varserde/wire/value.hpp"
#include "varserde/wire/text.hpp"

// Data model bindings
#include "varserde/bindings/scalars.hpp"
#include "varserde/bindings/containers.hpp"
#include "varserde/bindings/structs.hpp"
#include "varserde/bindings/enums.hpp"
#include "varserde/bindings/sum_types.hpp"

// Adapters
#include "varserde/adapters/object_path.hpp"
#include "varserde/adapters/signature_string.hpp"
#include "varserde/adapters/dynamic_value.hpp"
#include "varserde/adapters/enum_value.hpp"
#include "varserde/adapters/flags_value.hpp"
#include "varserde/adapters/variant_dict.hpp"

// Introspection
#include "varserde/introspection/type_schema.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace varserde {

// ============================================================================
// Entry points
// ============================================================================

/// Encode @p value with the cached node of T
template<typename T>
    requires HasVariantType<T> && SerializableType<T>
Result<wire::Value> encode(const T& value) {
    return Encoder(type_node_ptr_of<T>()).encode(value);
}

/// Decode @p value into T
template<typename T>
    requires DeserializableType<T>
Result<T> decode(const wire::Value& value) {
    return Decoder(value).decode<T>();
}

/// Parse the canonical text form, optionally against an expected type
inline Result<wire::Value> parse_value(std::string_view text,
                                       std::optional<std::string> expected_type = std::nullopt) {
    wire::ParseOptions options;
    options.expected_type = std::move(expected_type);
    return wire::parse(text, options);
}

/// Parse @p text as T's signature, then decode it
template<typename T>
    requires HasVariantType<T> && DeserializableType<T>
Result<T> decode_text(std::string_view text) {
    const TypeNode& node = type_node_of<T>();
    std::optional<std::string> expected;
    if (wire::is_valid_type(node.signature)) {
        expected = node.signature;
    }
    auto value = parse_value(text, std::move(expected));
    if (!value) {
        return std::move(value).error();
    }
    return decode<T>(*value);
}

} // namespace varserde
