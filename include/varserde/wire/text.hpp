/**
 * @file text.hpp
 * @brief Canonical text form of wire values (print and parse)
 *
 * Printing follows the GVariant text format: int32, double, boolean and
 * string values are written bare; other scalar types carry a keyword
 * ("uint32 8", "byte 0x06") when type annotation is requested. Boxes always
 * annotate their content, so "<uint16 54>" round-trips exactly.
 *
 * Parsing infers types the same way: integer literals default to int32,
 * float literals to double, string literals to string, unless an enclosing
 * annotation, sibling element or expected type says otherwise.
 *
 * Both directions are GLib's (g_variant_print, g_variant_parse). parse()
 * additionally rejects text that is not UTF-8, surrogate escapes and
 * nesting beyond ParseOptions::max_depth.
 */

#pragma once

#include "varserde/error.hpp"
#include "varserde/wire/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace varserde::wire {

constexpr std::uint32_t DEFAULT_MAX_PARSE_DEPTH = 128;

struct ParseOptions {
    std::optional<std::string> expected_type;       ///< Type the result must have
    std::uint32_t max_depth = DEFAULT_MAX_PARSE_DEPTH;  ///< Container nesting limit
};

/// Render @p value; @p type_annotate adds keywords where the type is not the default
std::string print(const Value& value, bool type_annotate = false);

/**
 * @brief Parse a value from its text form
 * @return Value, or ParseFailure with the offending position
 */
Result<Value> parse(std::string_view text, const ParseOptions& options = {});

/// Shorthand for parse() with only an expected type
Result<Value> parse(std::string_view text, std::string_view expected_type);

} // namespace varserde::wire
