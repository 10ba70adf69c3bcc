/**
 * @file variant_dict.hpp
 * @brief String-keyed dictionary of dynamic values, wire type "a{sv}"
 *
 * Entries are kept in key order and encoded in that order.
 *
 * @code
 * VariantDict dict;
 * dict.insert("a", 200);
 * dict.insert("b", std::tuple<int64_t, double>{300, 400.5});
 * encode(dict)->to_string();   // "{'a': <200>, 'b': <(int64 300, 400.5)>}"
 * @endcode
 */

#pragma once

#include "varserde/adapters/dynamic_value.hpp"
#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/error.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"
#include "varserde/wire/value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace varserde {

class VariantDict {
public:
    using map_t = std::map<std::string, DynamicValue, std::less<>>;

    VariantDict() = default;

    /// Encode @p value with its own node and store it under @p key
    template<SerializableType T>
    Result<void> insert(std::string_view key, const T& value) {
        auto dynamic = DynamicValue::from(value);
        if (!dynamic) {
            return std::move(dynamic).error();
        }
        entries_.insert_or_assign(std::string(key), std::move(*dynamic));
        return Result<void>::ok();
    }

    void insert_value(std::string_view key, wire::Value value) {
        entries_.insert_or_assign(std::string(key), DynamicValue(std::move(value)));
    }

    std::optional<wire::Value> lookup_value(std::string_view key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.value();
    }

    /// Decode the entry under @p key as T; an absent key is an empty optional
    template<DeserializableType T>
    Result<std::optional<T>> lookup(std::string_view key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::optional<T>{};
        }
        auto value = it->second.template get<T>();
        if (!value) {
            return std::move(value).error();
        }
        return std::optional<T>(std::move(*value));
    }

    bool contains(std::string_view key) const { return entries_.find(key) != entries_.end(); }

    /// True if an entry was removed
    bool remove(std::string_view key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    const map_t& entries() const { return entries_; }

    bool operator==(const VariantDict& other) const { return entries_ == other.entries_; }

private:
    map_t entries_;
};

template<>
struct VariantType<VariantDict> {
    static TypeNodePtr node() { return TypeNode::dict(TypeNode::leaf("s"), TypeNode::leaf("v")); }
};

template<>
struct Serializable<VariantDict> {
    static Result<wire::Value> serialize(const VariantDict& value, const Encoder& encoder) {
        auto map = encoder.begin_map();
        for (const auto& [key, dynamic] : value.entries()) {
            auto added = map.entry(key, dynamic);
            if (!added) {
                return added.error();
            }
        }
        return map.end();
    }
};

template<>
struct Deserializable<VariantDict> {
    static Result<VariantDict> deserialize(const Decoder& decoder) {
        auto access = decoder.decode_map();
        if (!access) {
            return std::move(access).error();
        }
        VariantDict out;
        auto filled = access->for_each([&out](const Decoder& key, const Decoder& value) -> Result<void> {
            auto k = key.decode_string();
            if (!k) {
                return std::move(k).error();
            }
            auto v = value.decode<DynamicValue>();
            if (!v) {
                return std::move(v).error();
            }
            out.insert_value(*k, v->value());
            return Result<void>::ok();
        });
        if (!filled) {
            return filled.error();
        }
        return out;
    }
};

} // namespace varserde
