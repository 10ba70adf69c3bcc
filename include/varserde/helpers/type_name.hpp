/**
 * @file type_name.hpp
 * @brief Compile-time type and enumerator names using reflect-cpp
 *
 * Provides the names used as enum tags: enumerator names, their kebab-case
 * nicks ("ValWithCustomName" -> "val-with-custom-name") and unqualified
 * type names for std::variant alternatives.
 */

#pragma once

#include <rfl.hpp>
#include <sertial/containers/fixed_string.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

namespace varserde {

// ============================================================================
// Case conversion
// ============================================================================

namespace detail {

constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }
constexpr char to_lower(char c) { return is_upper(c) ? static_cast<char>(c - 'A' + 'a') : c; }

} // namespace detail

/**
 * @brief Append the kebab-case form of @p name to @p out
 *
 * A word boundary sits before an upper-case letter that follows a lower-case
 * letter or digit, and before the last capital of an acronym followed by a
 * lower-case letter ("HTTPServer" -> "http-server"). Underscores and spaces
 * become dashes.
 *
 * Works with any output providing push_back (std::string, sertial::fixed_string).
 */
template<typename Out>
constexpr void append_kebab_case(Out& out, std::string_view name) {
    bool pending_dash = false;
    bool wrote = false;
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '_' || c == '-' || c == ' ') {
            pending_dash = wrote;
            continue;
        }
        if (detail::is_upper(c) && i > 0) {
            char prev = name[i - 1];
            bool next_lower = i + 1 < name.size() && detail::is_lower(name[i + 1]);
            if (detail::is_lower(prev) || detail::is_digit(prev) || (detail::is_upper(prev) && next_lower)) {
                pending_dash = wrote;
            }
        }
        if (pending_dash) {
            out.push_back('-');
            pending_dash = false;
        }
        out.push_back(detail::to_lower(c));
        wrote = true;
    }
}

inline std::string kebab_case(std::string_view name) {
    std::string out;
    append_kebab_case(out, name);
    return out;
}

/// Strip namespaces and enclosing scopes ("ns::Outer::Inner" -> "Inner")
constexpr std::string_view unqualified_name(std::string_view name) {
    int template_depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '<') {
            ++template_depth;
        } else if (c == '>') {
            --template_depth;
        } else if (template_depth == 0 && c == ':' && i + 1 < name.size() && name[i + 1] == ':') {
            start = i + 2;
            ++i;
        }
    }
    return name.substr(start);
}

// ============================================================================
// Enumerator names
// ============================================================================

/**
 * @brief Enumerator names and nicks of an enum at compile time
 */
template<typename EnumType> requires std::is_enum_v<EnumType>
struct EnumName {
    static constexpr std::size_t max_size_v = []() -> std::size_t {
        constexpr auto enumerator_array = rfl::get_enumerator_array<EnumType>();
        std::size_t max_length = 0;

        for (const auto& enumerator : enumerator_array) {
            // +1 for null terminator
            max_length = std::max(max_length, 1 + enumerator.first.size());
        }

        return max_length;
    }();

    using value_t = sertial::fixed_string<max_size_v>;

    /// Every dash insertion needs at most one extra character per letter
    using nick_t = sertial::fixed_string<2 * max_size_v>;

    template<EnumType Value>
    static constexpr value_t value = []() -> value_t {
        constexpr auto enumerator_array = rfl::get_enumerator_array<EnumType>();

        for (const auto& [name, val] : enumerator_array) {
            if (val == Value) {
                return value_t(name);
            }
        }
        return value_t("");  // Not an enumerator
    }();

    template<EnumType Value>
    static constexpr nick_t nick = []() -> nick_t {
        nick_t result;
        append_kebab_case(result, std::string_view(value<Value>));
        return result;
    }();

    static constexpr std::size_t count = rfl::get_enumerator_array<EnumType>().size();
};

// ============================================================================
// Type names
// ============================================================================

/**
 * @brief Compile-time type name extraction
 *
 * @code
 * struct SensorData {};
 * constexpr auto name = TypeName<SensorData>::value;  // "SensorData"
 * @endcode
 */
template<typename T>
struct TypeName {
    static constexpr auto value = sertial::make_fixed(rfl::internal::get_type_name<T>());

    /// Name without namespaces or enclosing classes
    static constexpr std::string_view unqualified() {
        return unqualified_name(std::string_view(value));
    }
};

template<typename T>
constexpr std::string_view get_type_name() {
    return std::string_view(TypeName<T>::value);
}

} // namespace varserde
