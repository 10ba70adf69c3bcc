/**
 * @file signature_string.hpp
 * @brief Validated type signature string, wire type 'g'
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
#include <vector>

namespace varserde {

class SignatureString {
public:
    /// The empty signature
    SignatureString() = default;

    /// @throws std::invalid_argument if @p sig is not a valid signature
    explicit SignatureString(std::string sig) : sig_(std::move(sig)) {
        if (!wire::is_valid_signature(sig_)) {
            throw std::invalid_argument("Invalid signature: '" + sig_ + "'");
        }
    }

    static Result<SignatureString> create(std::string_view sig) {
        if (!wire::is_valid_signature(sig)) {
            return Error{ErrorCode::ValidationFailure, "Invalid signature: '" + std::string(sig) + "'"};
        }
        return SignatureString(std::string(sig));
    }

    const std::string& str() const { return sig_; }

    /// The complete types making up the signature
    std::vector<std::string> types() const { return wire::split_signature(sig_); }

    bool operator==(const SignatureString& other) const = default;

private:
    std::string sig_;
};

template<>
struct VariantType<SignatureString> {
    static TypeNodePtr node() { return TypeNode::leaf("g"); }
};

template<>
struct Serializable<SignatureString> {
    static Result<wire::Value> serialize(const SignatureString& value, const Encoder&) {
        return Encoder(type_node_ptr_of<SignatureString>()).encode_str(value.str());
    }
};

template<>
struct Deserializable<SignatureString> {
    static Result<SignatureString> deserialize(const Decoder& decoder) {
        auto text = decoder.decode_string();
        if (!text) {
            return std::move(text).error();
        }
        return SignatureString::create(*text);
    }
};

} // namespace varserde
