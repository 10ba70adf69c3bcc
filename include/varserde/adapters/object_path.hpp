/**
 * @file object_path.hpp
 * @brief Validated object path string, wire type 'o'
 */

#pragma once

#include "varserde/decoder.hpp"
#include "varserde/encoder.hpp"
#include "varserde/error.hpp"
#include "varserde/traits.hpp"
#include "varserde/type_node.hpp"
#include "varserde/wire/signature.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace varserde {

class ObjectPath {
public:
    /// The root path "/"
    ObjectPath() : path_("/") {}

    /// @throws std::invalid_argument if @p path is not a valid object path
    explicit ObjectPath(std::string path) : path_(std::move(path)) {
        if (!wire::is_valid_object_path(path_)) {
            throw std::invalid_argument("Invalid object path: '" + path_ + "'");
        }
    }

    static Result<ObjectPath> create(std::string_view path) {
        if (!wire::is_valid_object_path(path)) {
            return Error{ErrorCode::ValidationFailure, "Invalid object path: '" + std::string(path) + "'"};
        }
        return ObjectPath(std::string(path));
    }

    const std::string& str() const { return path_; }

    bool operator==(const ObjectPath& other) const = default;

private:
    std::string path_;
};

template<>
struct VariantType<ObjectPath> {
    static TypeNodePtr node() { return TypeNode::leaf("o"); }
};

template<>
struct Serializable<ObjectPath> {
    static Result<wire::Value> serialize(const ObjectPath& value, const Encoder&) {
        // Always 'o', whatever the enclosing node says
        return Encoder(type_node_ptr_of<ObjectPath>()).encode_str(value.str());
    }
};

template<>
struct Deserializable<ObjectPath> {
    static Result<ObjectPath> deserialize(const Decoder& decoder) {
        auto text = decoder.decode_string();
        if (!text) {
            return std::move(text).error();
        }
        return ObjectPath::create(*text);
    }
};

} // namespace varserde
