/**
 * @file flags_value.hpp
 * @brief Bit flag wrappers encoded through the enum registry
 *
 * - FlagsValue<F>:     '|'-joined nicks of the set bits in registry order,
 *                      "" for no bits, wire 's'            ('nick-a|b')
 * - FlagsReprValue<F>: the raw mask, wire 'u'
 */

#pragma once

#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/enum_registry.hpp"
#include "varserde/error.hpp"
#include "varserde/helpers/type_name.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace varserde {

namespace detail {

template<typename F>
Error invalid_flags_value() {
    return Error::custom("expected a valid flags value for " + std::string(TypeName<F>::unqualified()));
}

template<typename F>
using flags_mask_t = std::make_unsigned_t<std::underlying_type_t<F>>;

} // namespace detail

// ============================================================================
// FlagsValue (by nicks)
// ============================================================================

template<FlagsEnum F>
class FlagsValue {
public:
    using mask_t = detail::flags_mask_t<F>;

    FlagsValue() = default;
    FlagsValue(F value) : value_(value) {}

    F value() const { return value_; }
    mask_t mask() const { return static_cast<mask_t>(value_); }

    std::string to_string() const {
        std::string out;
        mask_t remaining = mask();
        for (const auto& entry : EnumRegistry<F>::instance().entries()) {
            auto bit = static_cast<mask_t>(entry.value);
            if ((remaining & bit) == bit) {
                remaining = static_cast<mask_t>(remaining & ~bit);
                if (!out.empty()) {
                    out.push_back('|');
                }
                out += entry.nick;
            }
        }
        return out;
    }

    static Result<FlagsValue> parse(std::string_view text) {
        mask_t mask = 0;
        if (text.empty()) {
            return FlagsValue(static_cast<F>(mask));
        }
        const auto& registry = EnumRegistry<F>::instance();
        std::size_t start = 0;
        while (true) {
            std::size_t bar = text.find('|', start);
            std::string_view token = text.substr(start, bar == std::string_view::npos ? std::string_view::npos : bar - start);
            auto found = registry.lookup_by_name(token);
            if (!found) {
                return detail::invalid_flags_value<F>();
            }
            mask = static_cast<mask_t>(mask | static_cast<mask_t>(*found));
            if (bar == std::string_view::npos) {
                break;
            }
            start = bar + 1;
        }
        return FlagsValue(static_cast<F>(mask));
    }

    bool operator==(const FlagsValue& other) const = default;

private:
    F value_{};
};

template<typename F>
struct VariantType<FlagsValue<F>> {
    static TypeNodePtr node() { return TypeNode::leaf("s"); }
};

template<typename F>
struct Serializable<FlagsValue<F>> {
    static Result<wire::Value> serialize(const FlagsValue<F>& value, const Encoder&) {
        return wire::Value::string(value.to_string());
    }
};

template<typename F>
struct Deserializable<FlagsValue<F>> {
    static Result<FlagsValue<F>> deserialize(const Decoder& decoder) {
        auto text = decoder.decode_string();
        if (!text) {
            return std::move(text).error();
        }
        return FlagsValue<F>::parse(*text);
    }
};

// ============================================================================
// FlagsReprValue (raw mask)
// ============================================================================

template<FlagsEnum F>
class FlagsReprValue {
public:
    using mask_t = detail::flags_mask_t<F>;

    FlagsReprValue() = default;
    FlagsReprValue(F value) : value_(value) {}

    F value() const { return value_; }
    mask_t mask() const { return static_cast<mask_t>(value_); }

    bool operator==(const FlagsReprValue& other) const = default;

private:
    F value_{};
};

template<typename F>
struct VariantType<FlagsReprValue<F>> {
    static TypeNodePtr node() { return TypeNode::leaf("u"); }
};

template<typename F>
struct Serializable<FlagsReprValue<F>> {
    static Result<wire::Value> serialize(const FlagsReprValue<F>& value, const Encoder&) {
        if (!std::in_range<std::uint32_t>(value.mask())) {
            return Error::overflow("uint32");
        }
        return wire::Value::of(static_cast<std::uint32_t>(value.mask()));
    }
};

template<typename F>
struct Deserializable<FlagsReprValue<F>> {
    static Result<FlagsReprValue<F>> deserialize(const Decoder& decoder) {
        using mask_t = typename FlagsReprValue<F>::mask_t;
        auto mask = decoder.decode_integer<mask_t>();
        if (!mask) {
            return std::move(mask).error();
        }
        return FlagsReprValue<F>(static_cast<F>(*mask));
    }
};

} // namespace varserde
