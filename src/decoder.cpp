#include "varserde/decoder.hpp"

namespace varserde {

namespace {

constexpr const char* to_string(EnumAccess::State state) {
    switch (state) {
        case EnumAccess::State::Start:          return "Start";
        case EnumAccess::State::ReadTag:        return "ReadTag";
        case EnumAccess::State::UnitVariant:    return "UnitVariant";
        case EnumAccess::State::NonUnitVariant: return "NonUnitVariant";
        case EnumAccess::State::ReadPayload:    return "ReadPayload";
        case EnumAccess::State::Done:           return "Done";
    }
    return "Unknown";
}

} // namespace

// ============================================================================
// Scalars
// ============================================================================

Result<bool> Decoder::decode_bool() const {
    return visit([this](auto&& x) -> Result<bool> {
        if constexpr (std::is_same_v<std::decay_t<decltype(x)>, bool>) {
            return x;
        } else {
            return Error::type_mismatch("b", value_.type_string());
        }
    });
}

Result<double> Decoder::decode_double() const {
    return visit([this](auto&& x) -> Result<double> {
        if constexpr (std::is_same_v<std::decay_t<decltype(x)>, double>) {
            return x;
        } else {
            return Error::type_mismatch("d", value_.type_string());
        }
    });
}

Result<std::string> Decoder::decode_string() const {
    return visit([this](auto&& x) -> Result<std::string> {
        if constexpr (std::is_same_v<std::decay_t<decltype(x)>, std::string_view>) {
            return std::string(x);
        } else {
            return Error::str_mismatch(value_.type_string());
        }
    });
}

Result<char> Decoder::decode_char() const {
    auto text = decode_string();
    if (!text) {
        return std::move(text).error();
    }
    if (text->size() != 1) {
        return Error::expected_char(*text);
    }
    return (*text)[0];
}

// ============================================================================
// Containers
// ============================================================================

Result<MaybeAccess> Decoder::decode_maybe() const {
    return visit([this](auto&& x) -> Result<MaybeAccess> {
        if constexpr (std::is_same_v<std::decay_t<decltype(x)>, MaybeAccess>) {
            return std::move(x);
        } else {
            return Error::type_mismatch("m*", value_.type_string());
        }
    });
}

Result<SeqAccess> Decoder::decode_seq() const {
    return visit([this](auto&& x) -> Result<SeqAccess> {
        using X = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<X, SeqAccess>) {
            return std::move(x);
        } else if constexpr (std::is_same_v<X, MapAccess> || std::is_same_v<X, TupleAccess>) {
            return SeqAccess(value_);
        } else if constexpr (std::is_same_v<X, Unit>) {
            return SeqAccess(value_);
        } else {
            return Error::type_mismatch("a*", value_.type_string());
        }
    });
}

Result<MapAccess> Decoder::decode_map() const {
    return visit([this](auto&& x) -> Result<MapAccess> {
        if constexpr (std::is_same_v<std::decay_t<decltype(x)>, MapAccess>) {
            return std::move(x);
        } else {
            return Error::type_mismatch("a{**}", value_.type_string());
        }
    });
}

Result<TupleAccess> Decoder::decode_tuple(std::size_t length) const {
    auto access = visit([this](auto&& x) -> Result<TupleAccess> {
        using X = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<X, TupleAccess>) {
            return std::move(x);
        } else if constexpr (std::is_same_v<X, Unit>) {
            return TupleAccess(value_);
        } else {
            return Error::type_mismatch("r", value_.type_string());
        }
    });
    if (!access) {
        return access;
    }
    if (access->size() != length) {
        return Error::length_mismatch(access->size(), length);
    }
    return access;
}

Result<void> Decoder::decode_unit() const {
    if (value_.type_string() != "()") {
        return Error::type_mismatch("()", value_.type_string());
    }
    return Result<void>::ok();
}

Result<BoxAccess> Decoder::decode_box() const {
    return visit([this](auto&& x) -> Result<BoxAccess> {
        if constexpr (std::is_same_v<std::decay_t<decltype(x)>, BoxAccess>) {
            return std::move(x);
        } else {
            return Error::type_mismatch("v", value_.type_string());
        }
    });
}

Result<EnumAccess> Decoder::decode_enum() const {
    return EnumAccess(value_);
}

// ============================================================================
// EnumAccess
// ============================================================================

void EnumAccess::require(State expected, const char* step) const {
    if (state_ != expected) {
        throw std::logic_error(std::string("EnumAccess::") + step + " called in state " +
                               to_string(state_) + ", expected " + to_string(expected));
    }
}

Result<VariantTag> EnumAccess::tag() {
    require(State::Start, "tag");

    wire::Value tag_value = value_;
    if (value_.is_container()) {
        if (value_.classify() != wire::ValueClass::Tuple || value_.n_children() != 2) {
            return Error::unsupported_type(value_.type_string());
        }
        tag_value = value_.child(0);
    }
    state_ = State::ReadTag;

    Decoder decoder(tag_value);
    return decoder.visit([&tag_value](auto&& x) -> Result<VariantTag> {
        using X = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<X, std::string_view>) {
            if (tag_value.classify() != wire::ValueClass::String) {
                return Error::invalid_tag(tag_value.type_string());
            }
            return VariantTag::from_name(x);
        } else if constexpr (std::is_integral_v<X> && !std::is_same_v<X, bool>) {
            return VariantTag::from_number(x);
        } else {
            return Error::invalid_tag(tag_value.type_string());
        }
    });
}

Result<void> EnumAccess::unit_variant() {
    require(State::ReadTag, "unit_variant");
    state_ = State::UnitVariant;

    if (value_.is_container()) {
        wire::Value boxed = value_.child(1);
        if (boxed.classify() != wire::ValueClass::Variant) {
            state_ = State::Done;
            return Error::unsupported_type(value_.type_string());
        }
        Decoder payload(boxed.unboxed());
        auto unit = payload.decode_unit();
        if (!unit) {
            state_ = State::Done;
            return unit;
        }
    }
    state_ = State::Done;
    return Result<void>::ok();
}

Result<Decoder> EnumAccess::payload() {
    require(State::ReadTag, "payload");
    state_ = State::NonUnitVariant;

    if (!value_.is_container()) {
        state_ = State::Done;
        return Error::unsupported_type(value_.type_string());
    }
    wire::Value boxed = value_.child(1);
    if (boxed.classify() != wire::ValueClass::Variant) {
        state_ = State::Done;
        return Error::unsupported_type(value_.type_string());
    }
    state_ = State::ReadPayload;
    return Decoder(boxed.unboxed());
}

} // namespace varserde
