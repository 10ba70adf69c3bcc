/**
 * @file test_decoder.cpp
 * @brief Decoding of wire values into the data model
 *
 * Validates:
 * - Reference scenarios and round trips
 * - Integer range checks across wire widths
 * - Dynamic boxes nested in arrays, maps and tuples
 * - The enum access state machine
 * - Decode errors
 */

#include "varserde/varserde.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

using namespace varserde;

struct Item {
    int32_t id;
    std::string name;

    bool operator==(const Item&) const = default;
};

struct Celsius {
    double value;

    bool operator==(const Celsius&) const = default;
};

struct Reading {
    std::string sensor;
    std::vector<Celsius> values;
    std::optional<uint8_t> quality;
    std::map<std::string, int64_t> counters;
    std::array<int16_t, 2> range;
    std::pair<bool, char> flag;

    bool operator==(const Reading&) const = default;
};

struct A {
    bool operator==(const A&) const = default;
};
struct B {
    int32_t value;
    bool operator==(const B&) const = default;
};
struct C {
    std::string first;
    std::string second;
    bool operator==(const C&) const = default;
};
struct D {
    int32_t x;
    int32_t y;
    int32_t z;
    bool operator==(const D&) const = default;
};
using Letters = std::variant<A, B, C, D>;

template<>
struct varserde::TagTraits<Letters> {
    static constexpr TagMode tag_mode = TagMode::Index;
};

namespace {

wire::Value text(std::string_view source) {
    auto value = parse_value(source);
    if (!value) {
        std::cerr << "[test] parse failed: " << value.error().message << "\n";
    }
    assert(value);
    return *value;
}

template<typename T>
T decoded(std::string_view source) {
    auto result = decode<T>(text(source));
    if (!result) {
        std::cerr << "[test] decode of '" << source << "' failed: " << result.error().message << "\n";
    }
    assert(result);
    return *result;
}

template<typename T>
Error decode_error(std::string_view source) {
    auto result = decode<T>(text(source));
    assert(!result);
    return result.error();
}

template<typename T>
void round_trip(const T& value) {
    auto encoded = encode(value);
    assert(encoded);
    auto back = decode<T>(*encoded);
    assert(back);
    assert(*back == value);

    // The printed form parses back to the same wire value
    auto reparsed = parse_value(encoded->to_string(), encoded->type_string());
    assert(reparsed);
    assert(*reparsed == *encoded);
}

} // namespace

int main() {
    std::cout << "=== Decoder Tests ===\n\n";

    // Test 1: Reference scenarios
    {
        std::cout << "Test 1: Reference scenarios\n";

        assert(decoded<bool>("true"));
        assert((decoded<Item>("(1, 'Item')") == Item{1, "Item"}));

        auto by_type = decode_text<std::map<uint64_t, std::string>>("{2: 'World'}");
        assert(by_type);
        assert(by_type->size() == 1);
        assert(by_type->at(2) == "World");

        // Inferred as a{is}, range-checked into each target
        auto wide = decoded<std::map<uint64_t, std::string>>("{2: 'World'}");
        assert(wide.at(2) == "World");
        auto narrow = decoded<std::map<int32_t, std::string>>("{2: 'World'}");
        assert(narrow.at(2) == "World");

        auto none = decode_text<std::optional<std::string>>("nothing");
        assert(none);
        assert(!none->has_value());
        assert(decode_text<std::optional<std::string>>("'Hello'")->value() == "Hello");

        assert((decoded<Letters>("(1, <2>)") == Letters{B{2}}));

        std::cout << "  ✓ Scenario values decode to the original data\n";
    }

    // Test 2: Round trips
    {
        std::cout << "\nTest 2: Round trips\n";

        round_trip(true);
        round_trip(uint8_t{200});
        round_trip(int8_t{-100});
        round_trip(int64_t{-9000000000});
        round_trip(uint64_t{18000000000000000000ull});
        round_trip(2.25);
        round_trip('z');
        round_trip(std::string("multi\nline 'quoted'"));
        round_trip(std::vector<uint32_t>{1, 2, 3});
        round_trip(std::vector<bool>{true, false, true});
        round_trip(std::vector<std::string>{});
        round_trip(std::optional<std::optional<int32_t>>{std::optional<int32_t>{}});
        round_trip(std::tuple<uint16_t, std::string, double>{7, "t", -0.5});
        round_trip(std::unordered_map<std::string, uint32_t>{{"a", 1}, {"b", 2}});
        round_trip(Item{1, "Item"});
        round_trip(Celsius{21.5});
        round_trip(Reading{"s1", {{1.5}, {2.5}}, uint8_t{3}, {{"hits", 9}}, {-1, 1}, {true, 'y'}});
        round_trip(Reading{"", {}, std::nullopt, {}, {0, 0}, {false, 'n'}});
        round_trip(Letters{A{}});
        round_trip(Letters{B{-4}});
        round_trip(Letters{C{"one", "two"}});
        round_trip(Letters{D{5, 6, 7}});

        std::cout << "  ✓ decode(encode(v)) == v\n";
    }

    // Test 3: Integers across widths
    {
        std::cout << "\nTest 3: Integer range checks\n";

        assert(decoded<uint8_t>("255") == 255);
        assert(decoded<int64_t>("uint64 42") == 42);
        assert(decoded<uint16_t>("byte 0x10") == 16);
        assert(decoded<int8_t>("int16 -128") == -128);

        Error overflow = decode_error<uint8_t>("256");
        assert(overflow.code == ErrorCode::IntegerOverflow);

        Error negative = decode_error<uint32_t>("-1");
        assert(negative.code == ErrorCode::IntegerOverflow);

        Error big = decode_error<int32_t>("uint64 4294967296");
        assert(big.code == ErrorCode::IntegerOverflow);

        auto elements = decode<std::vector<uint8_t>>(text("[1, 300]"));
        assert(!elements);
        assert(elements.error().code == ErrorCode::IntegerOverflow);

        // Packed buffer of the target type takes the copy path
        auto packed = decoded<std::vector<uint32_t>>("[uint32 4, 5, 6]");
        assert((packed == std::vector<uint32_t>{4, 5, 6}));

        // Other widths go element by element
        auto widened = decoded<std::vector<int64_t>>("[1, 2]");
        assert((widened == std::vector<int64_t>{1, 2}));

        std::cout << "  ✓ Any integer width accepted within range\n";
    }

    // Test 4: Doubles and strings
    {
        std::cout << "\nTest 4: Doubles and strings\n";

        assert(decoded<double>("1.5") == 1.5);
        assert(decoded<float>("0.25") == 0.25f);
        assert(decoded<std::string>("objectpath '/a/b'") == "/a/b");
        assert(decoded<std::string>("signature 'as'") == "as");

        Error not_double = decode_error<double>("1");
        assert(not_double.code == ErrorCode::TypeMismatch);

        Error not_bool = decode_error<bool>("1.0");
        assert(not_bool.code == ErrorCode::TypeMismatch);
        assert(not_bool.message == "Type mismatch: Expected 'b', got 'd'");

        Error not_string = decode_error<std::string>("5");
        assert(not_string.message == "Type mismatch: Expected 's', 'o', or 'g', got 'i'");

        Error long_char = decode_error<char>("'ab'");
        assert(long_char.code == ErrorCode::ExpectedChar);
        assert(long_char.message == "Type mismatch: Expected string with length 1, got 'ab'");

        std::cout << "  ✓ Scalar classes checked\n";
    }

    // Test 5: Tuples and structs
    {
        std::cout << "\nTest 5: Tuples and structs\n";

        Error arity = decode_error<Item>("(1, 'Item', 3)");
        assert(arity.code == ErrorCode::LengthMismatch);
        assert(arity.message == "Struct/tuple length mismatch: Expected 2, got 3");

        Error short_array = decode_error<std::array<int32_t, 3>>("[1, 2]");
        assert(short_array.code == ErrorCode::LengthMismatch);

        Error not_tuple = decode_error<Item>("[1, 2]");
        assert(not_tuple.code == ErrorCode::TypeMismatch);

        // Dict entries decode as pairs
        auto entry = decoded<std::pair<std::string, int32_t>>("{'k', 1}");
        assert(entry.first == "k" && entry.second == 1);

        // Tuples decode as sequences
        auto items = decoded<std::vector<int32_t>>("(1, 2, 3)");
        assert(items.size() == 3);

        assert(decoded<std::vector<int32_t>>("()").empty());
        assert(decode<std::monostate>(text("()")));
        assert(!decode<std::monostate>(text("(1,)")));

        std::cout << "  ✓ Arity enforced\n";
    }

    // Test 6: Boxes at any depth
    {
        std::cout << "\nTest 6: Nested dynamic values\n";

        auto boxes = decoded<std::vector<DynamicValue>>("[<1>, <'x'>, <[uint32 1, 2]>]");
        assert(boxes.size() == 3);
        assert(boxes[0].signature() == "i");
        assert(boxes[1].signature() == "s");
        assert(boxes[2].signature() == "au");
        assert(*boxes[1].get<std::string>() == "x");
        assert((*boxes[2].get<std::vector<uint32_t>>() == std::vector<uint32_t>{1, 2}));

        auto dict = decoded<std::map<std::string, DynamicValue>>("{'a': <200>, 'b': <(int64 300, 400.5)>}");
        assert(dict.size() == 2);
        assert(*dict.at("a").get<int32_t>() == 200);
        auto pair = dict.at("b").get<std::tuple<int64_t, double>>();
        assert(pair);
        assert(std::get<0>(*pair) == 300);
        assert(std::get<1>(*pair) == 400.5);

        auto nested = decoded<std::tuple<std::string, DynamicValue>>("('outer', <<uint16 5>>)");
        assert(std::get<1>(nested).signature() == "v");
        auto inner = std::get<1>(nested).get<DynamicValue>();
        assert(inner);
        assert(inner->signature() == "q");

        std::cout << "  ✓ Boxes decoded inside arrays, maps and tuples\n";
    }

    // Test 7: Visitor dispatch
    {
        std::cout << "\nTest 7: Visitor dispatch\n";

        auto kind = [](const wire::Value& value) {
            return Decoder(value).visit([](auto&& x) -> Result<std::string> {
                using X = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<X, bool>) return std::string("bool");
                else if constexpr (std::is_same_v<X, double>) return std::string("double");
                else if constexpr (std::is_integral_v<X>) return std::string("integer");
                else if constexpr (std::is_same_v<X, std::string_view>) return std::string("string");
                else if constexpr (std::is_same_v<X, MaybeAccess>) return std::string("maybe");
                else if constexpr (std::is_same_v<X, SeqAccess>) return std::string("seq");
                else if constexpr (std::is_same_v<X, MapAccess>) return std::string("map");
                else if constexpr (std::is_same_v<X, Unit>) return std::string("unit");
                else if constexpr (std::is_same_v<X, TupleAccess>) return std::string("tuple");
                else return std::string("box");
            });
        };

        assert(*kind(text("true")) == "bool");
        assert(*kind(text("1.5")) == "double");
        assert(*kind(text("byte 1")) == "integer");
        assert(*kind(text("'s'")) == "string");
        assert(*kind(text("just 1")) == "maybe");
        assert(*kind(text("[1]")) == "seq");
        assert(*kind(text("{1: 2}")) == "map");
        assert(*kind(text("()")) == "unit");
        assert(*kind(text("(1, 2)")) == "tuple");
        assert(*kind(text("{1, 2}")) == "tuple");
        assert(*kind(text("<1>")) == "box");

        // Handles have no mapping
        auto handle = kind(wire::Value::handle(3));
        assert(!handle);
        assert(handle.error().code == ErrorCode::UnsupportedType);
        assert(handle.error().message == "Type not supported: 'h'");

        auto as_int = decode<int32_t>(wire::Value::handle(3));
        assert(!as_int);
        assert(as_int.error().code == ErrorCode::UnsupportedType);

        std::cout << "  ✓ Each wire class reaches its visitor overload\n";
    }

    // Test 8: Enum access
    {
        std::cout << "\nTest 8: Enum access state machine\n";

        EnumAccess unit(text("(0, <()>)"));
        assert(unit.state() == EnumAccess::State::Start);
        assert(unit.has_payload());
        auto tag = unit.tag();
        assert(tag);
        assert(tag->number_equals(0));
        assert(unit.state() == EnumAccess::State::ReadTag);
        assert(unit.unit_variant());
        assert(unit.state() == EnumAccess::State::Done);

        EnumAccess payload(text("(uint32 3, <(5, 6, 7)>)"));
        assert(payload.tag());
        auto d = payload.read_payload<D>();
        assert(d);
        assert((*d == D{5, 6, 7}));
        assert(payload.state() == EnumAccess::State::Done);

        assert((decoded<Letters>("(uint32 3, <(5, 6, 7)>)") == Letters{D{5, 6, 7}}));
        assert((decoded<Letters>("('C', <('a', 'b')>)") == Letters{C{"a", "b"}}));

        // Steps out of order
        EnumAccess early(text("(1, <2>)"));
        bool threw = false;
        try {
            (void)early.payload();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        EnumAccess twice(text("'north'"));
        assert(!twice.has_payload());
        assert(twice.tag());
        threw = false;
        try {
            (void)twice.tag();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        // A bare tag has no payload to read
        EnumAccess bare(text("'north'"));
        assert(bare.tag());
        auto missing = bare.payload();
        assert(!missing);
        assert(missing.error().code == ErrorCode::UnsupportedType);

        std::cout << "  ✓ Tag, then unit or payload, then done\n";
    }

    // Test 9: Sum type errors
    {
        std::cout << "\nTest 9: Sum type errors\n";

        Error unknown = decode_error<Letters>("(9, <1>)");
        assert(unknown.code == ErrorCode::InvalidTag);

        Error bad_tag_type = decode_error<Letters>("(1.5, <1>)");
        assert(bad_tag_type.code == ErrorCode::InvalidTag);
        assert(bad_tag_type.message == "Invalid enum tag type: 'd'");

        Error bool_tag = decode_error<Letters>("true");
        assert(bool_tag.code == ErrorCode::InvalidTag);

        Error wide = decode_error<Letters>("(1, 2, 3)");
        assert(wide.code == ErrorCode::UnsupportedType);

        Error unboxed = decode_error<Letters>("(0, 2)");
        assert(unboxed.code == ErrorCode::UnsupportedType);

        // Unit variant carrying a payload
        Error not_unit = decode_error<Letters>("(0, <5>)");
        assert(not_unit.code == ErrorCode::TypeMismatch);

        // Payload of the wrong shape
        Error wrong_payload = decode_error<Letters>("(3, <(1, 2)>)");
        assert(wrong_payload.code == ErrorCode::LengthMismatch);

        std::cout << "  ✓ Malformed tagged values rejected\n";
    }

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
