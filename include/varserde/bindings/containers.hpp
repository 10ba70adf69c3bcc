/**
 * @file containers.hpp
 * @brief Bindings for optional, sequences, maps, pairs and tuples
 *
 * Sequences of fixed-width arithmetic types use the packed fast path in both
 * directions: one buffer write on encode, one span copy on decode.
 */

#pragma once

#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace varserde {

namespace detail {

template<typename T>
struct is_std_array : std::false_type {};

template<typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

/// Decode every element of @p access into @p out
template<typename T, typename Out>
Result<void> decode_elements(const SeqAccess& access, Out& out) {
    if constexpr (wire::FixedScalar<T>) {
        if (access.is_fixed<T>()) {
            auto span = access.fixed<T>();
            std::copy(span.begin(), span.end(), std::begin(out));
            return Result<void>::ok();
        }
    }
    for (std::size_t i = 0; i < access.size(); ++i) {
        auto element = access.element(i).template decode<T>();
        if (!element) {
            return std::move(element).error();
        }
        out[i] = std::move(*element);
    }
    return Result<void>::ok();
}

template<typename T, typename Range>
Result<wire::Value> encode_range(const Range& range, const Encoder& encoder) {
    if constexpr (std::is_same_v<T, bool>) {
        return encoder.encode_bool_seq(std::vector<bool>(std::begin(range), std::end(range)));
    } else if constexpr (WireArithmetic<T>) {
        return encoder.encode_fixed_seq(std::span<const T>(std::data(range), std::size(range)));
    } else {
        auto seq = encoder.begin_seq();
        seq.reserve(std::size(range));
        for (const auto& element : range) {
            auto added = seq.element(element);
            if (!added) {
                return added.error();
            }
        }
        return seq.end();
    }
}

} // namespace detail

// ============================================================================
// std::optional
// ============================================================================

template<typename T>
struct VariantType<std::optional<T>> {
    static TypeNodePtr node() { return TypeNode::maybe(type_node_ptr_of<T>()); }
};

template<typename T>
struct Serializable<std::optional<T>> {
    static Result<wire::Value> serialize(const std::optional<T>& value, const Encoder& encoder) {
        if (!value) {
            return encoder.encode_none();
        }
        return encoder.encode_some(*value);
    }
};

template<typename T>
struct Deserializable<std::optional<T>> {
    static Result<std::optional<T>> deserialize(const Decoder& decoder) {
        auto maybe = decoder.decode_maybe();
        if (!maybe) {
            return std::move(maybe).error();
        }
        if (!maybe->has_value()) {
            return std::optional<T>{};
        }
        auto inner = maybe->value().template decode<T>();
        if (!inner) {
            return std::move(inner).error();
        }
        return std::optional<T>(std::move(*inner));
    }
};

// ============================================================================
// std::vector
// ============================================================================

template<typename T, typename Alloc>
struct VariantType<std::vector<T, Alloc>> {
    static TypeNodePtr node() { return TypeNode::array(type_node_ptr_of<T>()); }
};

template<typename T, typename Alloc>
struct Serializable<std::vector<T, Alloc>> {
    static Result<wire::Value> serialize(const std::vector<T, Alloc>& value, const Encoder& encoder) {
        return detail::encode_range<T>(value, encoder);
    }
};

template<typename T, typename Alloc>
struct Deserializable<std::vector<T, Alloc>> {
    static Result<std::vector<T, Alloc>> deserialize(const Decoder& decoder) {
        auto seq = decoder.decode_seq();
        if (!seq) {
            return std::move(seq).error();
        }
        std::vector<T, Alloc> out;
        if constexpr (wire::FixedScalar<T> && !std::is_same_v<T, bool>) {
            if (seq->template is_fixed<T>()) {
                auto span = seq->template fixed<T>();
                out.assign(span.begin(), span.end());
                return out;
            }
        }
        out.reserve(seq->size());
        for (std::size_t i = 0; i < seq->size(); ++i) {
            auto element = seq->element(i).template decode<T>();
            if (!element) {
                return std::move(element).error();
            }
            out.push_back(std::move(*element));
        }
        return out;
    }
};

// ============================================================================
// std::array
// ============================================================================

template<typename T, std::size_t N>
struct VariantType<std::array<T, N>> {
    static TypeNodePtr node() { return TypeNode::array(type_node_ptr_of<T>()); }
};

template<typename T, std::size_t N>
struct Serializable<std::array<T, N>> {
    static Result<wire::Value> serialize(const std::array<T, N>& value, const Encoder& encoder) {
        return detail::encode_range<T>(value, encoder);
    }
};

template<typename T, std::size_t N>
struct Deserializable<std::array<T, N>> {
    static Result<std::array<T, N>> deserialize(const Decoder& decoder) {
        auto seq = decoder.decode_seq();
        if (!seq) {
            return std::move(seq).error();
        }
        if (seq->size() != N) {
            return Error::length_mismatch(seq->size(), N);
        }
        std::array<T, N> out{};
        auto filled = detail::decode_elements<T>(*seq, out);
        if (!filled) {
            return filled.error();
        }
        return out;
    }
};

// ============================================================================
// Maps
// ============================================================================

namespace detail {

template<typename Map>
struct MapBinding {
    using key_type = typename Map::key_type;
    using mapped_type = typename Map::mapped_type;

    static TypeNodePtr node() {
        return TypeNode::dict(type_node_ptr_of<key_type>(), type_node_ptr_of<mapped_type>());
    }

    static Result<wire::Value> serialize(const Map& value, const Encoder& encoder) {
        auto map = encoder.begin_map();
        for (const auto& [key, mapped] : value) {
            auto added = map.entry(key, mapped);
            if (!added) {
                return added.error();
            }
        }
        return map.end();
    }

    static Result<Map> deserialize(const Decoder& decoder) {
        auto access = decoder.decode_map();
        if (!access) {
            return std::move(access).error();
        }
        Map out;
        auto filled = access->for_each([&out](const Decoder& key, const Decoder& mapped) -> Result<void> {
            auto k = key.decode<key_type>();
            if (!k) {
                return std::move(k).error();
            }
            auto v = mapped.decode<mapped_type>();
            if (!v) {
                return std::move(v).error();
            }
            out.insert_or_assign(std::move(*k), std::move(*v));
            return Result<void>::ok();
        });
        if (!filled) {
            return filled.error();
        }
        return out;
    }
};

} // namespace detail

template<typename K, typename V, typename Compare, typename Alloc>
struct VariantType<std::map<K, V, Compare, Alloc>>
    : detail::MapBinding<std::map<K, V, Compare, Alloc>> {};

template<typename K, typename V, typename Compare, typename Alloc>
struct Serializable<std::map<K, V, Compare, Alloc>>
    : detail::MapBinding<std::map<K, V, Compare, Alloc>> {};

template<typename K, typename V, typename Compare, typename Alloc>
struct Deserializable<std::map<K, V, Compare, Alloc>>
    : detail::MapBinding<std::map<K, V, Compare, Alloc>> {};

template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct VariantType<std::unordered_map<K, V, Hash, Eq, Alloc>>
    : detail::MapBinding<std::unordered_map<K, V, Hash, Eq, Alloc>> {};

template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct Serializable<std::unordered_map<K, V, Hash, Eq, Alloc>>
    : detail::MapBinding<std::unordered_map<K, V, Hash, Eq, Alloc>> {};

template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct Deserializable<std::unordered_map<K, V, Hash, Eq, Alloc>>
    : detail::MapBinding<std::unordered_map<K, V, Hash, Eq, Alloc>> {};

// ============================================================================
// std::pair and std::tuple
// ============================================================================

namespace detail {

template<typename Tuple>
struct TupleBinding;

template<template<typename...> class Tuple, typename... Ts>
struct TupleBinding<Tuple<Ts...>> {
    static constexpr std::size_t size = sizeof...(Ts);

    static TypeNodePtr node() {
        return TypeNode::tuple({type_node_ptr_of<Ts>()...});
    }

    static Result<wire::Value> serialize(const Tuple<Ts...>& value, const Encoder& encoder) {
        auto tuple = encoder.begin_tuple();
        std::optional<Error> failure;
        std::apply([&](const auto&... items) {
            ((failure ? void() : [&] {
                auto added = tuple.element(items);
                if (!added) {
                    failure = added.error();
                }
            }()), ...);
        }, value);
        if (failure) {
            return std::move(*failure);
        }
        return tuple.end();
    }

    static Result<Tuple<Ts...>> deserialize(const Decoder& decoder) {
        auto access = decoder.decode_tuple(size);
        if (!access) {
            return std::move(access).error();
        }
        return decode_items(*access, std::index_sequence_for<Ts...>{});
    }

private:
    template<std::size_t... Is>
    static Result<Tuple<Ts...>> decode_items(const TupleAccess& access, std::index_sequence<Is...>) {
        std::tuple<std::optional<Ts>...> items;
        std::optional<Error> failure;
        ((failure ? void() : [&] {
            auto item = access.item(Is).template decode<Ts>();
            if (!item) {
                failure = std::move(item).error();
            } else {
                std::get<Is>(items).emplace(std::move(*item));
            }
        }()), ...);
        if (failure) {
            return std::move(*failure);
        }
        return Tuple<Ts...>(std::move(*std::get<Is>(items))...);
    }
};

} // namespace detail

template<typename A, typename B>
struct VariantType<std::pair<A, B>> : detail::TupleBinding<std::pair<A, B>> {};

template<typename A, typename B>
struct Serializable<std::pair<A, B>> : detail::TupleBinding<std::pair<A, B>> {};

template<typename A, typename B>
struct Deserializable<std::pair<A, B>> : detail::TupleBinding<std::pair<A, B>> {};

template<typename... Ts>
struct VariantType<std::tuple<Ts...>> : detail::TupleBinding<std::tuple<Ts...>> {};

template<typename... Ts>
struct Serializable<std::tuple<Ts...>> : detail::TupleBinding<std::tuple<Ts...>> {};

template<typename... Ts>
struct Deserializable<std::tuple<Ts...>> : detail::TupleBinding<std::tuple<Ts...>> {};

} // namespace varserde
