/**
 * @file tag.hpp
 * @brief Enum tag configuration and the transient tag value
 *
 * How an enum or sum type writes its discriminant is a property of the type,
 * configured by specializing TagTraits:
 *
 * @code
 * enum class Direction { North = 1, East, South, West };
 *
 * template<> struct varserde::TagTraits<Direction> {
 *     static constexpr TagMode tag_mode = TagMode::Index;   // "u" tag, declaration index
 * };
 * @endcode
 *
 * Without a specialization the tag is the variant name (TagMode::Name, "s").
 */

#pragma once

#include "varserde/error.hpp"

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace varserde {

enum class TagMode {
    Name,    ///< Variant name or nick, wire type 's'
    Index,   ///< 0-based declaration index, wire width from index_type (default uint32)
    Repr     ///< Declared discriminant, wire width from the representation type
};

constexpr const char* to_string(TagMode mode) {
    switch (mode) {
        case TagMode::Name:  return "name";
        case TagMode::Index: return "index";
        case TagMode::Repr:  return "repr";
    }
    return "unknown";
}

/**
 * @brief Per-type tag configuration (specialize for enums and sum types)
 *
 * Recognized members, all optional:
 * - `static constexpr TagMode tag_mode`
 * - `using index_type = <integer>` (TagMode::Index width)
 * - `using repr_type = <integer>` (TagMode::Repr width for std::variant sum types)
 * - `static constexpr std::array<std::pair<E, std::string_view>, N> nicks` (enums)
 * - `static constexpr std::array<E, N> order` (enums declared out of value order)
 */
template<typename T>
struct TagTraits {};

template<typename T>
constexpr TagMode tag_mode_v = [] {
    if constexpr (requires { TagTraits<T>::tag_mode; }) {
        return TagTraits<T>::tag_mode;
    } else {
        return TagMode::Name;
    }
}();

template<typename T>
struct tag_index_type { using type = std::uint32_t; };

template<typename T>
    requires requires { typename TagTraits<T>::index_type; }
struct tag_index_type<T> { using type = typename TagTraits<T>::index_type; };

template<typename T>
using tag_index_type_t = typename tag_index_type<T>::type;

/// Representation width of a sum type's discriminants (default int64)
template<typename T>
struct tag_repr_type { using type = std::int64_t; };

template<typename T>
    requires requires { typename TagTraits<T>::repr_type; }
struct tag_repr_type<T> { using type = typename TagTraits<T>::repr_type; };

template<typename T>
using tag_repr_type_t = typename tag_repr_type<T>::type;

// ============================================================================
// Tag width table
// ============================================================================

/**
 * @brief Wire code for an integer tag of type I
 *
 * 8-bit signed has no wire type of its own and is widened to 16-bit ('n').
 */
template<std::integral I>
    requires (!std::is_same_v<I, bool>)
constexpr char tag_code() {
    if constexpr (std::is_signed_v<I>) {
        if constexpr (sizeof(I) <= 2) return 'n';
        else if constexpr (sizeof(I) == 4) return 'i';
        else return 'x';
    } else {
        if constexpr (sizeof(I) == 1) return 'y';
        else if constexpr (sizeof(I) == 2) return 'q';
        else if constexpr (sizeof(I) == 4) return 'u';
        else return 't';
    }
}

static_assert(tag_code<std::int8_t>() == 'n');
static_assert(tag_code<std::int16_t>() == 'n');
static_assert(tag_code<std::int32_t>() == 'i');
static_assert(tag_code<std::int64_t>() == 'x');
static_assert(tag_code<std::uint8_t>() == 'y');
static_assert(tag_code<std::uint16_t>() == 'q');
static_assert(tag_code<std::uint32_t>() == 'u');
static_assert(tag_code<std::uint64_t>() == 't');

// ============================================================================
// VariantTag
// ============================================================================

/**
 * @brief Discriminant of one enum value, alive for a single encode or decode
 *
 * On encode both the name and the number are supplied and the node's tag
 * type picks which one is written. On decode exactly one of them is set,
 * depending on the wire tag's class.
 */
struct VariantTag {
    std::string name;
    std::variant<std::int64_t, std::uint64_t> number{std::int64_t{0}};
    bool has_name = false;
    bool has_number = false;

    static VariantTag from_name(std::string_view name) {
        VariantTag tag;
        tag.name = std::string(name);
        tag.has_name = true;
        return tag;
    }

    template<std::integral I>
    static VariantTag from_number(I number) {
        VariantTag tag;
        if constexpr (std::is_signed_v<I>) {
            tag.number = static_cast<std::int64_t>(number);
        } else {
            tag.number = static_cast<std::uint64_t>(number);
        }
        tag.has_number = true;
        return tag;
    }

    template<std::integral I>
    static VariantTag from(std::string_view name, I number) {
        VariantTag tag = from_number(number);
        tag.name = std::string(name);
        tag.has_name = true;
        return tag;
    }

    /// True if the numeric tag equals @p value (sign-aware)
    template<std::integral I>
    bool number_equals(I value) const {
        if (!has_number) {
            return false;
        }
        return std::visit([value](auto n) { return std::cmp_equal(n, value); }, number);
    }

    /// Numeric tag converted to I, if it fits
    template<std::integral I>
    std::optional<I> number_as() const {
        if (!has_number) {
            return std::nullopt;
        }
        return std::visit([](auto n) -> std::optional<I> {
            if (!std::in_range<I>(n)) {
                return std::nullopt;
            }
            return static_cast<I>(n);
        }, number);
    }

    std::string describe() const {
        if (has_name) {
            return "'" + name + "'";
        }
        return std::visit([](auto n) { return std::to_string(n); }, number);
    }
};

} // namespace varserde
