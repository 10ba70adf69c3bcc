/**
 * @file structs.hpp
 * @brief Bindings for aggregate structs, reflected with reflect-cpp
 *
 * Fields are visited in declaration order through rfl::to_view:
 * - no fields:  "()"
 * - one field:  transparent, exactly the field's own encoding
 * - N fields:   tuple of the field encodings
 *
 * @code
 * struct Item { int32_t id; std::string name; };   // "(is)"
 * struct Meters { double value; };                 // "d"
 * struct Ping {};                                  // "()"
 * @endcode
 */

#pragma once

#include "varserde/bindings/containers.hpp"
#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"

#include <rfl.hpp>

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace varserde {

/// Aggregate struct eligible for field-by-field reflection
template<typename T>
concept ReflectedStruct = std::is_class_v<T> && std::is_aggregate_v<T> &&
                          !detail::is_std_array<T>::value &&
                          !std::is_same_v<T, std::monostate>;

namespace detail {

template<typename T>
using view_t = decltype(rfl::to_view(std::declval<T&>()));

template<typename T>
constexpr std::size_t field_count_v = view_t<T>::size();

/// Type of field I of T
template<typename T, std::size_t I>
using field_t = std::remove_cvref_t<decltype(*rfl::get<I>(std::declval<view_t<T>&>()))>;

template<typename T, std::size_t... Is>
TypeNodePtr struct_node(std::index_sequence<Is...>) {
    if constexpr (sizeof...(Is) == 0) {
        return TypeNode::unit();
    } else if constexpr (sizeof...(Is) == 1) {
        return type_node_ptr_of<field_t<T, 0>>();
    } else {
        return TypeNode::tuple({type_node_ptr_of<field_t<T, Is>>()...});
    }
}

} // namespace detail

template<typename T>
    requires ReflectedStruct<T>
struct VariantType<T> {
    static TypeNodePtr node() {
        return detail::struct_node<T>(std::make_index_sequence<detail::field_count_v<T>>{});
    }
};

template<typename T>
    requires ReflectedStruct<T>
struct Serializable<T> {
    static constexpr std::size_t field_count = detail::field_count_v<T>;

    static Result<wire::Value> serialize(const T& value, const Encoder& encoder) {
        auto view = rfl::to_view(value);

        if constexpr (field_count == 0) {
            return encoder.encode_unit();
        } else if constexpr (field_count == 1) {
            return encoder.encode(*rfl::get<0>(view));
        } else {
            return serialize_fields(view, encoder, std::make_index_sequence<field_count>{});
        }
    }

private:
    template<typename View, std::size_t... Is>
    static Result<wire::Value> serialize_fields(View& view, const Encoder& encoder, std::index_sequence<Is...>) {
        auto tuple = encoder.begin_tuple();
        std::optional<Error> failure;
        ((failure ? void() : [&] {
            auto added = tuple.element(*rfl::get<Is>(view));
            if (!added) {
                failure = added.error();
            }
        }()), ...);
        if (failure) {
            return std::move(*failure);
        }
        return tuple.end();
    }
};

template<typename T>
    requires ReflectedStruct<T>
struct Deserializable<T> {
    static constexpr std::size_t field_count = detail::field_count_v<T>;

    static Result<T> deserialize(const Decoder& decoder) {
        T out{};
        auto view = rfl::to_view(out);

        if constexpr (field_count == 0) {
            auto unit = decoder.decode_unit();
            if (!unit) {
                return unit.error();
            }
        } else if constexpr (field_count == 1) {
            using F = detail::field_t<T, 0>;
            auto field = decoder.decode<F>();
            if (!field) {
                return std::move(field).error();
            }
            *rfl::get<0>(view) = std::move(*field);
        } else {
            auto access = decoder.decode_tuple(field_count);
            if (!access) {
                return std::move(access).error();
            }
            auto filled = deserialize_fields(*access, view, std::make_index_sequence<field_count>{});
            if (!filled) {
                return filled.error();
            }
        }
        return out;
    }

private:
    template<typename View, std::size_t... Is>
    static Result<void> deserialize_fields(const TupleAccess& access, View& view, std::index_sequence<Is...>) {
        std::optional<Error> failure;
        ((failure ? void() : [&] {
            using F = detail::field_t<T, Is>;
            auto field = access.item(Is).template decode<F>();
            if (!field) {
                failure = std::move(field).error();
            } else {
                *rfl::get<Is>(view) = std::move(*field);
            }
        }()), ...);
        if (failure) {
            return std::move(*failure);
        }
        return Result<void>::ok();
    }
};

} // namespace varserde
