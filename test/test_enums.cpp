/**
 * @file test_enums.cpp
 * @brief Enum tag modes, the enum registry and tagged sum types
 */

#include "varserde/varserde.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string_view>
#include <utility>
#include <variant>

using namespace varserde;

// Default: tags are nicks
enum class Direction { North, East, South, West };

// Declaration index as the tag
enum class Heading { North, East, South, West };
template<>
struct varserde::TagTraits<Heading> {
    static constexpr TagMode tag_mode = TagMode::Index;
};

// Declared out of value order
enum class Shuffled { B = 2, A = 1 };
template<>
struct varserde::TagTraits<Shuffled> {
    static constexpr TagMode tag_mode = TagMode::Index;
    static constexpr std::array order{Shuffled::B, Shuffled::A};
};

enum class Compact { Off, On };
template<>
struct varserde::TagTraits<Compact> {
    static constexpr TagMode tag_mode = TagMode::Index;
    using index_type = uint8_t;
};

// Raw values at the width of the underlying type
enum class Level : uint16_t { Low = 5, High = 100 };
template<>
struct varserde::TagTraits<Level> {
    static constexpr TagMode tag_mode = TagMode::Repr;
};

enum class Tiny : int8_t { A = 1 };
template<>
struct varserde::TagTraits<Tiny> {
    static constexpr TagMode tag_mode = TagMode::Repr;
};

enum class Wide : int64_t { A = 1 };
template<>
struct varserde::TagTraits<Wide> {
    static constexpr TagMode tag_mode = TagMode::Repr;
};

enum class Mode { ValWithCustomName, Plain };
template<>
struct varserde::TagTraits<Mode> {
    static constexpr std::array nicks{
        std::pair{Mode::ValWithCustomName, std::string_view{"other"}}};
};

enum class Perm : uint32_t { NickA = 1, B = 2, AB = 3, C = 4 };
constexpr Perm operator|(Perm a, Perm b) {
    return static_cast<Perm>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

// Sum type with declared discriminants
struct Ping {
    static constexpr int64_t discriminant = 10;
};
struct Pong {
    static constexpr int64_t discriminant = 20;
    int32_t seq;
    bool operator==(const Pong&) const = default;
};
using Packet = std::variant<Ping, Pong>;
template<>
struct varserde::TagTraits<Packet> {
    static constexpr TagMode tag_mode = TagMode::Repr;
    using repr_type = int16_t;
};

namespace {

void expect(const auto& value, const char* signature, const char* text) {
    auto v = encode(value);
    if (!v) {
        std::cerr << "[test] encode failed: " << v.error().message << "\n";
    }
    assert(v);
    if (v->type_string() != signature || v->to_string() != text) {
        std::cerr << "[test] got " << v->type_string() << " " << v->to_string()
                  << ", expected " << signature << " " << text << "\n";
    }
    assert(v->type_string() == signature);
    assert(v->to_string() == text);
}

template<typename T>
T decoded(std::string_view source) {
    auto value = parse_value(source);
    assert(value);
    auto result = decode<T>(*value);
    if (!result) {
        std::cerr << "[test] decode of '" << source << "' failed: " << result.error().message << "\n";
    }
    assert(result);
    return *result;
}

template<typename T>
Error decode_error(std::string_view source) {
    auto value = parse_value(source);
    assert(value);
    auto result = decode<T>(*value);
    assert(!result);
    return result.error();
}

} // namespace

int test_name_mode() {
    expect(Direction::South, "s", "'south'");
    expect(Direction::North, "s", "'north'");

    assert(decoded<Direction>("'south'") == Direction::South);
    // Enumerator names are accepted too
    assert(decoded<Direction>("'West'") == Direction::West);
    // A number is a declaration index
    assert(decoded<Direction>("uint32 3") == Direction::West);

    Error unknown = decode_error<Direction>("'up'");
    assert(unknown.code == ErrorCode::InvalidTag);
    assert(unknown.message == "Unknown enum tag 'up' for 'Direction'");

    Error past_end = decode_error<Direction>("7");
    assert(past_end.code == ErrorCode::InvalidTag);

    auto bad = encode(static_cast<Direction>(42));
    assert(!bad);
    assert(bad.error().code == ErrorCode::InvalidTag);

    std::cout << "  name mode checked\n";
    return 0;
}

int test_index_mode() {
    expect(Heading::North, "u", "0");
    expect(Heading::West, "u", "3");
    assert(decoded<Heading>("uint32 3") == Heading::West);
    assert(decoded<Heading>("'east'") == Heading::East);

    expect(Compact::On, "y", "0x01");
    assert(decoded<Compact>("byte 0x00") == Compact::Off);

    // Explicit order replaces value order
    expect(Shuffled::B, "u", "0");
    expect(Shuffled::A, "u", "1");
    assert(decoded<Shuffled>("uint32 0") == Shuffled::B);
    assert(decoded<Shuffled>("uint32 1") == Shuffled::A);
    const auto& shuffled = EnumRegistry<Shuffled>::instance();
    assert(shuffled.entries()[0].name == "B");
    assert(shuffled.index_of(Shuffled::A) == 1u);

    std::cout << "  index mode checked\n";
    return 0;
}

int test_repr_mode() {
    expect(Level::High, "q", "100");
    assert(decoded<Level>("uint16 5") == Level::Low);
    assert(decoded<Level>("100") == Level::High);
    assert(decoded<Level>("'low'") == Level::Low);

    Error missing = decode_error<Level>("6");
    assert(missing.code == ErrorCode::InvalidTag);

    // Wire width follows the underlying type
    assert(type_node_of<Tiny>().signature == "n");
    assert(type_node_of<Wide>().signature == "x");
    expect(Tiny::A, "n", "1");
    expect(Wide::A, "x", "1");

    std::cout << "  repr mode checked\n";
    return 0;
}

int test_registry() {
    const auto& directions = EnumRegistry<Direction>::instance();
    assert(directions.size() == 4);
    assert(directions.name_of(Direction::East) == "east");
    assert(directions.index_of(Direction::South) == 2u);
    assert(directions.at_index(3) == Direction::West);
    assert(!directions.at_index(4));
    assert(directions.lookup_by_value(1) == Direction::East);
    assert(directions.entries()[0].name == "North");
    assert(&directions == &EnumRegistry<Direction>::instance());

    const auto& modes = EnumRegistry<Mode>::instance();
    assert(modes.name_of(Mode::ValWithCustomName) == "other");
    assert(modes.name_of(Mode::Plain) == "plain");
    expect(Mode::ValWithCustomName, "s", "'other'");
    assert(decoded<Mode>("'other'") == Mode::ValWithCustomName);
    assert(decoded<Mode>("'ValWithCustomName'") == Mode::ValWithCustomName);

    // Composite flag members are skipped
    const auto& perms = EnumRegistry<Perm>::instance();
    assert(perms.size() == 3);
    assert(!perms.find(Perm::AB));
    assert(perms.name_of(Perm::NickA) == "nick-a");
    assert(perms.name_of(Perm::C) == "c");

    std::cout << "  registry checked\n";
    return 0;
}

int test_sum_type_discriminants() {
    assert(type_node_of<Packet>().signature == "(nv)");
    expect(Packet{Ping{}}, "(nv)", "(10, <()>)");
    expect(Packet{Pong{7}}, "(nv)", "(20, <7>)");

    auto ping = decoded<Packet>("(int16 10, <()>)");
    assert(std::holds_alternative<Ping>(ping));
    auto pong = decoded<Packet>("(int16 20, <9>)");
    assert(std::get<Pong>(pong) == Pong{9});
    // Name tags are always accepted
    assert(std::holds_alternative<Pong>(decoded<Packet>("('Pong', <1>)")));

    Error unknown = decode_error<Packet>("(int16 11, <()>)");
    assert(unknown.code == ErrorCode::InvalidTag);

    std::cout << "  sum type discriminants checked\n";
    return 0;
}

int test_variant_tag() {
    VariantTag negative = VariantTag::from_number(int64_t{-1});
    assert(negative.number_equals(-1));
    assert(!negative.number_equals(uint64_t{18446744073709551615ull}));
    assert(!negative.number_as<uint32_t>());
    assert(negative.describe() == "-1");

    VariantTag big = VariantTag::from_number(uint32_t{300});
    assert(!big.number_as<uint8_t>());
    assert(big.number_as<uint16_t>() == 300);

    VariantTag named = VariantTag::from("South", 2);
    assert(named.has_name && named.has_number);
    assert(named.describe() == "'South'");

    VariantTag plain = VariantTag::from_name("x");
    assert(!plain.number_equals(0));
    assert(!plain.number_as<int>());

    assert(std::string_view(to_string(TagMode::Repr)) == "repr");

    std::cout << "  variant tag checked\n";
    return 0;
}

int main() {
    std::cout << "=== Enum Tests ===\n\n";

    std::cout << "Running test_name_mode...\n";
    test_name_mode();

    std::cout << "Running test_index_mode...\n";
    test_index_mode();

    std::cout << "Running test_repr_mode...\n";
    test_repr_mode();

    std::cout << "Running test_registry...\n";
    test_registry();

    std::cout << "Running test_sum_type_discriminants...\n";
    test_sum_type_discriminants();

    std::cout << "Running test_variant_tag...\n";
    test_variant_tag();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
