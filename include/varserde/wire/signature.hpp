/**
 * @file signature.hpp
 * @brief Type-string algebra for the wire format
 *
 * A type string describes exactly one complete type ("i", "as", "a{sv}",
 * "(ii)", "mmi"). A signature is a sequence of zero or more complete types
 * and is what a 'g' value carries ("(istxa{ys}as)", "ss", "").
 *
 * Besides the concrete codes the helpers accept the indefinite code '*'
 * (any type) where noted; it appears only in derived child types of sparse
 * descriptors and never in a constructed value. GLib's other indefinite
 * codes, '?' (any basic type) and 'r' (any tuple), are accepted in patterns
 * as well. Validation and structure queries are answered by GLib's
 * GVariantType.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace varserde::wire {

// ============================================================================
// Type codes
// ============================================================================

namespace code {
    inline constexpr char BOOLEAN      = 'b';
    inline constexpr char BYTE         = 'y';
    inline constexpr char INT16        = 'n';
    inline constexpr char UINT16       = 'q';
    inline constexpr char INT32        = 'i';
    inline constexpr char UINT32       = 'u';
    inline constexpr char INT64        = 'x';
    inline constexpr char UINT64       = 't';
    inline constexpr char HANDLE       = 'h';
    inline constexpr char DOUBLE       = 'd';
    inline constexpr char STRING       = 's';
    inline constexpr char OBJECT_PATH  = 'o';
    inline constexpr char SIGNATURE    = 'g';
    inline constexpr char VARIANT      = 'v';
    inline constexpr char MAYBE        = 'm';
    inline constexpr char ARRAY        = 'a';
    inline constexpr char ANY          = '*';
} // namespace code

/// Scalar codes that may key a dictionary entry
constexpr bool is_basic_code(char c) {
    switch (c) {
        case 'b': case 'y': case 'n': case 'q': case 'i': case 'u':
        case 'x': case 't': case 'h': case 'd': case 's': case 'o': case 'g':
            return true;
        default:
            return false;
    }
}

/// The nine fixed-width primitives eligible for packed array storage
constexpr bool is_fixed_code(char c) {
    switch (c) {
        case 'y': case 'n': case 'q': case 'i': case 'u':
        case 'x': case 't': case 'd': case 'b':
            return true;
        default:
            return false;
    }
}

constexpr bool is_integer_code(char c) {
    switch (c) {
        case 'y': case 'n': case 'q': case 'i': case 'u': case 'x': case 't':
            return true;
        default:
            return false;
    }
}

constexpr bool is_string_code(char c) {
    return c == 's' || c == 'o' || c == 'g';
}

/// Byte width of a fixed-width primitive, 0 for anything else
constexpr std::size_t fixed_size_of(char c) {
    switch (c) {
        case 'y': case 'b': return 1;
        case 'n': case 'q': return 2;
        case 'i': case 'u': return 4;
        case 'x': case 't': case 'd': return 8;
        default: return 0;
    }
}

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Length of the complete type starting at @p pos
 * @param allow_any Accept '*' as a complete type
 * @return Number of characters consumed, or 0 if no complete type starts there
 */
std::size_t complete_type_length(std::string_view s, std::size_t pos = 0, bool allow_any = false);

/// Exactly one complete, definite type ("i", "a{sv}")
bool is_valid_type(std::string_view s);

/// Exactly one complete type, indefinite codes permitted
bool is_valid_pattern(std::string_view s);

/// Zero or more complete definite types (value of a 'g')
bool is_valid_signature(std::string_view s);

/// True if the type contains no indefinite code
bool is_definite(std::string_view s);

/// "/" or "/"-separated non-empty [A-Za-z0-9_] elements, no trailing slash
bool is_valid_object_path(std::string_view s);

/// Well-formed UTF-8 without embedded NUL (content of an 's')
bool is_valid_utf8(std::string_view s);

// ============================================================================
// Structure
// ============================================================================

/// True if @p s is one of the nine fixed-width primitive codes
bool is_fixed_primitive(std::string_view s);

bool is_array(std::string_view s);
bool is_maybe(std::string_view s);
bool is_tuple(std::string_view s);
bool is_dict_entry(std::string_view s);
bool is_dict(std::string_view s);   ///< array of dict entries

/// Element type of "a..." or "m...", "*" if @p s is neither
std::string element_of(std::string_view s);

/// Key type of "{..}" or "a{..}", "*" otherwise
std::string key_of(std::string_view s);

/// Value type of "{..}" or "a{..}", "*" otherwise
std::string value_of(std::string_view s);

/// Item types of a tuple "(...)"; empty for "()" and for non-tuples
std::vector<std::string> tuple_items(std::string_view s);

/// Item @p index of a tuple or dict entry, "*" if absent
std::string item_of(std::string_view s, std::size_t index);

/// Split a signature into its complete types
std::vector<std::string> split_signature(std::string_view s);

/// True if definite @p type is an instance of @p pattern ('*' matches any complete type)
bool type_matches(std::string_view type, std::string_view pattern);

} // namespace varserde::wire
