/**
 * @file test_encoder.cpp
 * @brief Type-directed encoding of the data model
 *
 * Validates:
 * - Signatures and canonical text for scalars, containers and structs
 * - Newtype transparency and the packed fast path
 * - Sum types with unit and payload variants
 * - String policies for 's', 'o' and 'g' targets
 * - Encode errors
 */

#include "varserde/varserde.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

using namespace varserde;

struct Item {
    int32_t id;
    std::string name;
};

struct UserId {
    uint32_t value;
};

struct Wrapped {
    Item inner;
};

struct Marker {};

struct Record {
    std::string label;
    std::vector<uint16_t> samples;
    std::optional<int64_t> offset;
    std::map<std::string, bool> flags;
};

// Sum type from the reference scenario: one unit and one newtype variant
struct A {};
struct B { int32_t value; };
using AB = std::variant<A, B>;

template<>
struct varserde::TagTraits<AB> {
    static constexpr TagMode tag_mode = TagMode::Index;
};

struct Circle { double radius; };
struct Rect { double width; double height; };
using Shape = std::variant<Marker, Circle, Rect>;

namespace {

wire::Value encoded(const auto& value) {
    auto result = encode(value);
    if (!result) {
        std::cerr << "[test] encode failed: " << result.error().message << "\n";
    }
    assert(result);
    return *result;
}

void expect(const auto& value, const char* signature, const char* text) {
    wire::Value v = encoded(value);
    if (v.type_string() != signature || v.to_string() != text) {
        std::cerr << "[test] got " << v.type_string() << " " << v.to_string()
                  << ", expected " << signature << " " << text << "\n";
    }
    assert(v.type_string() == signature);
    assert(v.to_string() == text);
}

} // namespace

int main() {
    std::cout << "=== Encoder Tests ===\n\n";

    // Test 1: Reference scenarios
    {
        std::cout << "Test 1: Reference scenarios\n";

        expect(true, "b", "true");
        expect(Item{1, "Item"}, "(is)", "(1, 'Item')");
        expect(std::optional<std::string>{}, "ms", "nothing");
        expect(std::optional<std::string>{"Hello"}, "ms", "'Hello'");
        expect(AB{B{2}}, "(uv)", "(1, <2>)");

        std::cout << "  ✓ Scenarios produce the documented values\n";
    }

    // Test 2: Scalars
    {
        std::cout << "\nTest 2: Scalars\n";

        expect(uint8_t{6}, "y", "0x06");
        expect(int8_t{-3}, "n", "-3");
        expect(int16_t{-300}, "n", "-300");
        expect(uint16_t{54}, "q", "54");
        expect(int32_t{-7}, "i", "-7");
        expect(uint32_t{7}, "u", "7");
        expect(int64_t{1} << 40, "x", "1099511627776");
        expect(uint64_t{18446744073709551615ull}, "t", "18446744073709551615");
        expect(1.5f, "d", "1.5");
        expect(3.0, "d", "3.0");
        expect('x', "s", "'x'");
        expect(std::string("it's"), "s", "\"it's\"");
        expect(std::monostate{}, "()", "()");

        std::cout << "  ✓ Scalars use their natural wire types\n";
    }

    // Test 3: Containers
    {
        std::cout << "\nTest 3: Containers\n";

        expect(std::vector<uint32_t>{1, 2, 3}, "au", "[1, 2, 3]");
        expect(std::vector<int8_t>{-1, 2}, "an", "[-1, 2]");
        expect(std::vector<float>{0.5f}, "ad", "[0.5]");
        expect(std::vector<bool>{true, false}, "ab", "[true, false]");
        expect(std::array<uint8_t, 3>{1, 2, 3}, "ay", "[0x01, 0x02, 0x03]");
        expect(std::vector<std::string>{"a", "b"}, "as", "['a', 'b']");
        expect(std::vector<std::string>{}, "as", "[]");
        expect(std::vector<Item>{{1, "x"}, {2, "y"}}, "a(is)", "[(1, 'x'), (2, 'y')]");
        expect(std::map<uint64_t, std::string>{{2, "World"}}, "a{ts}", "{2: 'World'}");
        expect(std::map<std::string, int32_t>{}, "a{si}", "[]");
        expect(std::pair<int32_t, bool>{4, false}, "(ib)", "(4, false)");
        expect(std::tuple<int64_t, double>{300, 400.5}, "(xd)", "(300, 400.5)");
        expect(std::tuple<int32_t>{9}, "(i)", "(9,)");
        expect(std::optional<std::optional<int32_t>>{std::optional<int32_t>{}}, "mmi", "just nothing");
        expect(std::optional<std::vector<uint32_t>>{std::vector<uint32_t>{5}}, "mau", "[5]");

        std::cout << "  ✓ Containers encode with derived element types\n";
    }

    // Test 4: Structs
    {
        std::cout << "\nTest 4: Structs\n";

        expect(Record{"r", {1, 2}, std::nullopt, {{"on", true}}},
               "(saqmxa{sb})", "('r', [1, 2], nothing, {'on': true})");
        expect(Marker{}, "()", "()");

        // Newtype transparency: the wrapper encodes exactly like its field
        assert(encoded(UserId{42}) == encoded(uint32_t{42}));
        assert(encoded(Wrapped{Item{1, "Item"}}) == encoded(Item{1, "Item"}));
        assert(encoded(std::vector<UserId>{{1}, {2}}) == encoded(std::vector<uint32_t>{1, 2}));

        std::cout << "  ✓ Structs encode as tuples, newtypes transparently\n";
    }

    // Test 5: Fast path equivalence
    {
        std::cout << "\nTest 5: Fast path equivalence\n";

        std::vector<uint32_t> data{1, 2, 3};

        Encoder packed(TypeNode::array(TypeNode::leaf("u")));
        auto fast = packed.encode_fixed_seq(std::span<const uint32_t>(data));
        assert(fast);

        // Indefinite element: every value goes through the element encoder
        Encoder generic(TypeNode::leaf("a*"));
        auto slow = generic.encode_fixed_seq(std::span<const uint32_t>(data));
        assert(slow);

        auto seq = packed.begin_seq();
        for (uint32_t value : data) {
            assert(seq.element(value));
        }
        auto built = seq.end();
        assert(built);

        assert(*fast == *slow);
        assert(*fast == *built);
        assert(fast->type_string() == "au");
        assert(fast->is_packed() && built->is_packed());

        std::cout << "  ✓ Packed and per-element encodes are identical\n";
    }

    // Test 6: Sum types
    {
        std::cout << "\nTest 6: Sum types\n";

        expect(AB{A{}}, "(uv)", "(0, <()>)");
        expect(Shape{Marker{}}, "(sv)", "('Marker', <()>)");
        expect(Shape{Circle{1.5}}, "(sv)", "('Circle', <1.5>)");
        expect(Shape{Rect{2.0, 3.0}}, "(sv)", "('Rect', <(2.0, 3.0)>)");

        // The signature is fixed whatever the active variant
        assert(encoded(Shape{Circle{1.0}}).type_string() == encoded(Shape{Rect{}}).type_string());

        std::cout << "  ✓ Variants encode as (tag, <payload>)\n";
    }

    // Test 7: String targets
    {
        std::cout << "\nTest 7: String policies\n";

        Encoder path(TypeNode::leaf("o"));
        auto good_path = path.encode(std::string("/com/org/Test"));
        assert(good_path);
        assert(good_path->type_string() == "o");

        auto bad_path = path.encode(std::string("com/org"));
        assert(!bad_path);
        assert(bad_path.error().code == ErrorCode::TypeMismatch);
        assert(bad_path.error().message == "Type mismatch: 'com/org' is not a valid object path");

        Encoder sig(TypeNode::leaf("g"));
        auto good_sig = sig.encode(std::string("a{sv}"));
        assert(good_sig);
        assert(good_sig->type_string() == "g");
        assert(!sig.encode(std::string("a{")));

        Encoder number(TypeNode::leaf("i"));
        auto mismatch = number.encode(std::string("x"));
        assert(!mismatch);
        assert(mismatch.error().code == ErrorCode::TypeMismatch);
        assert(mismatch.error().message == "Type mismatch: Expected 's', 'o', or 'g', got 'i'");

        // 's' content must be UTF-8
        Encoder text(TypeNode::leaf("s"));
        auto bad_utf8 = text.encode_str("\xff\xfe");
        assert(!bad_utf8);
        assert(bad_utf8.error().code == ErrorCode::ValidationFailure);
        assert(!encode(std::string("ok\xc3")));
        assert(!encode(std::string("nul\0inside", 10)));
        assert(encode(std::string("gr\xc3\xbc\xc3\x9f")));
        auto high_char = encode('\xe9');
        assert(!high_char);
        assert(high_char.error().code == ErrorCode::ValidationFailure);

        std::cout << "  ✓ 'o' and 'g' validated, other targets rejected\n";
    }

    // Test 8: Encode errors
    {
        std::cout << "\nTest 8: Encode errors\n";

        // Payload variant on a node without a payload slot
        Encoder bare(TypeNode::leaf("s"));
        auto no_slot = bare.encode_variant(VariantTag::from("B", 1), wire::Value::of<int32_t>(2));
        assert(!no_slot);
        assert(no_slot.error().code == ErrorCode::UnsupportedType);

        // Tag wider than its wire type
        Encoder narrow(TypeNode::leaf("y"));
        auto overflow = narrow.encode_tag(VariantTag::from_number(300));
        assert(!overflow);
        assert(overflow.error().code == ErrorCode::IntegerOverflow);

        // Numeric tag on a node that wants a name
        auto unnamed = bare.encode_tag(VariantTag::from_number(1));
        assert(!unnamed);
        assert(unnamed.error().code == ErrorCode::InvalidTag);

        // Tag type that is not an integer or a string
        Encoder floating(TypeNode::leaf("d"));
        auto bad_tag = floating.encode_tag(VariantTag::from("X", 0));
        assert(!bad_tag);
        assert(bad_tag.error().code == ErrorCode::InvalidTag);
        assert(bad_tag.error().message == "Invalid enum tag type: 'd'");

        // Empty tuple cannot carry a tag
        Encoder empty(TypeNode::unit());
        auto unit_tag = empty.encode_tag(VariantTag::from("X", 0));
        assert(!unit_tag);
        assert(unit_tag.error().code == ErrorCode::UnsupportedType);

        // Array of an indefinite element with nothing to infer from
        Encoder indefinite(TypeNode::leaf("a*"));
        auto empty_array = indefinite.begin_seq().end();
        assert(!empty_array);
        assert(empty_array.error().code == ErrorCode::TypeMismatch);

        // Dictionary keys must be basic
        using PairKeyed = std::map<std::pair<int32_t, int32_t>, int32_t>;
        auto bad_key = encode(PairKeyed{{{1, 2}, 3}});
        assert(!bad_key);
        assert(bad_key.error().code == ErrorCode::TypeMismatch);

        // Elements of differing types under an indefinite element type
        auto mixed = indefinite.begin_seq();
        assert(mixed.element(int32_t{1}));
        assert(mixed.element(std::string("x")));
        auto wrong_element = mixed.end();
        assert(!wrong_element);
        assert(wrong_element.error().message == "Type mismatch: Expected 'i', got 's'");

        std::cout << "  ✓ Failures reported with the right codes\n";
    }

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
