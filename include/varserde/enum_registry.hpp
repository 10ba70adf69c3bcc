/**
 * @file enum_registry.hpp
 * @brief Runtime name/value table for enum and flags types
 *
 * Built once per enum type from rfl::get_enumerator_array. Enumerators are
 * listed in ascending value order, which is declaration order for the usual
 * enumerations with increasing values. Reflection cannot see declaration
 * order, so an enum declared out of value order states it with
 * TagTraits<E>::order; listed enumerators come first, in that order:
 *
 * @code
 * enum class Shuffled { B = 2, A = 1 };
 * template<> struct varserde::TagTraits<Shuffled> {
 *     static constexpr std::array order{Shuffled::B, Shuffled::A};
 * };
 * @endcode
 *
 * Each entry has its enumerator name and a nick. The nick is the kebab-case
 * form of the name (South -> "south", ValWithCustomName ->
 * "val-with-custom-name") unless TagTraits<E>::nicks overrides it:
 *
 * @code
 * template<> struct varserde::TagTraits<MyEnum> {
 *     static constexpr std::array nicks{
 *         std::pair{MyEnum::ValWithCustomName, std::string_view{"other"}}};
 * };
 * @endcode
 *
 * Flags types (enums defining operator|) only register their single-bit
 * members, so composite members such as AB = A | B are skipped.
 */

#pragma once

#include "varserde/helpers/type_name.hpp"
#include "varserde/tag.hpp"

#include <rfl.hpp>

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace varserde {

/// Enum with a bitwise-or operator, treated as a set of bit flags
template<typename E>
concept FlagsEnum = std::is_enum_v<E> && requires(E a, E b) {
    { a | b } -> std::convertible_to<E>;
};

template<typename E>
    requires std::is_enum_v<E>
class EnumRegistry {
public:
    using underlying_t = std::underlying_type_t<E>;

    struct Entry {
        E value;
        std::string name;
        std::string nick;
        std::size_t index;
    };

    static const EnumRegistry& instance() {
        static const EnumRegistry registry;
        return registry;
    }

    const std::vector<Entry>& entries() const { return entries_; }

    std::vector<E> all_values() const {
        std::vector<E> values;
        values.reserve(entries_.size());
        for (const auto& entry : entries_) {
            values.push_back(entry.value);
        }
        return values;
    }

    const Entry* find(E value) const {
        for (const auto& entry : entries_) {
            if (entry.value == value) {
                return &entry;
            }
        }
        return nullptr;
    }

    /// Nick of @p value, empty if not an enumerator
    std::string_view name_of(E value) const {
        const Entry* entry = find(value);
        return entry ? std::string_view(entry->nick) : std::string_view{};
    }

    /// Accepts the nick or the enumerator name
    std::optional<E> lookup_by_name(std::string_view name) const {
        for (const auto& entry : entries_) {
            if (entry.nick == name || entry.name == name) {
                return entry.value;
            }
        }
        return std::nullopt;
    }

    std::optional<E> lookup_by_value(underlying_t raw) const {
        for (const auto& entry : entries_) {
            if (static_cast<underlying_t>(entry.value) == raw) {
                return entry.value;
            }
        }
        return std::nullopt;
    }

    std::optional<std::size_t> index_of(E value) const {
        const Entry* entry = find(value);
        if (!entry) {
            return std::nullopt;
        }
        return entry->index;
    }

    std::optional<E> at_index(std::size_t index) const {
        if (index >= entries_.size()) {
            return std::nullopt;
        }
        return entries_[index].value;
    }

    std::size_t size() const { return entries_.size(); }

private:
    EnumRegistry() {
        constexpr auto enumerators = rfl::get_enumerator_array<E>();
        for (const auto& [name, value] : enumerators) {
            if constexpr (FlagsEnum<E>) {
                auto bits = static_cast<std::make_unsigned_t<underlying_t>>(value);
                if (!std::has_single_bit(bits)) {
                    continue;
                }
            }
            Entry entry{value, std::string(name), nick_for(value, name), entries_.size()};
            entries_.push_back(std::move(entry));
        }

        if constexpr (requires { TagTraits<E>::order; }) {
            std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
                return position_in_order(a.value) < position_in_order(b.value);
            });
            for (std::size_t i = 0; i < entries_.size(); ++i) {
                entries_[i].index = i;
            }
        }
    }

    // Unlisted enumerators sort after the listed ones
    static std::size_t position_in_order(E value) {
        std::size_t position = 0;
        for (const E listed : TagTraits<E>::order) {
            if (listed == value) {
                return position;
            }
            ++position;
        }
        return position;
    }

    static std::string nick_for(E value, std::string_view name) {
        if constexpr (requires { TagTraits<E>::nicks; }) {
            for (const auto& [overridden, nick] : TagTraits<E>::nicks) {
                if (overridden == value) {
                    return std::string(nick);
                }
            }
        }
        return kebab_case(name);
    }

    std::vector<Entry> entries_;
};

} // namespace varserde
