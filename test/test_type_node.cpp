/**
 * @file test_type_node.cpp
 * @brief Node construction for the data model and sparse child derivation
 */

#include "varserde/varserde.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
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
};

struct Meters {
    double value;
};

struct Empty {};

struct Nested {
    Item item;
    std::vector<Meters> distances;
    std::optional<std::map<std::string, uint16_t>> labels;
};

enum class Direction { North, East, South, West };

enum class Small : uint8_t { A, B };
template<>
struct varserde::TagTraits<Small> {
    static constexpr TagMode tag_mode = TagMode::Repr;
};

struct Idle {};
struct Speed { int32_t value; };
struct Point { int32_t x; int32_t y; };
using Motion = std::variant<Idle, Speed, Point>;

using Flat = std::variant<Idle, Empty>;

int test_scalar_nodes() {
    assert(type_node_of<bool>().signature == "b");
    assert(type_node_of<uint8_t>().signature == "y");
    assert(type_node_of<int8_t>().signature == "n");
    assert(type_node_of<int16_t>().signature == "n");
    assert(type_node_of<uint16_t>().signature == "q");
    assert(type_node_of<int32_t>().signature == "i");
    assert(type_node_of<uint32_t>().signature == "u");
    assert(type_node_of<int64_t>().signature == "x");
    assert(type_node_of<uint64_t>().signature == "t");
    assert(type_node_of<float>().signature == "d");
    assert(type_node_of<double>().signature == "d");
    assert(type_node_of<char>().signature == "s");
    assert(type_node_of<std::string>().signature == "s");
    assert(type_node_of<std::monostate>().signature == "()");

    std::cout << "  scalar signatures checked\n";
    return 0;
}

int test_container_nodes() {
    assert(type_node_of<std::optional<std::string>>().signature == "ms");
    assert(type_node_of<std::vector<uint32_t>>().signature == "au");
    assert((type_node_of<std::array<int16_t, 3>>().signature == "an"));
    assert((type_node_of<std::map<uint64_t, std::string>>().signature == "a{ts}"));
    assert((type_node_of<std::unordered_map<std::string, double>>().signature == "a{sd}"));
    assert((type_node_of<std::pair<int32_t, bool>>().signature == "(ib)"));
    assert((type_node_of<std::tuple<uint8_t, std::string, std::vector<int64_t>>>().signature == "(ysax)"));
    assert(type_node_of<std::vector<std::optional<bool>>>().signature == "amb");

    const TypeNode& dict = type_node_of<std::map<std::string, uint32_t>>();
    assert(dict.children.size() == 2);
    assert(dict.children[0]->signature == "s");
    assert(dict.children[1]->signature == "u");

    std::cout << "  container signatures checked\n";
    return 0;
}

int test_struct_nodes() {
    assert(type_node_of<Item>().signature == "(is)");
    assert(type_node_of<Item>().children.size() == 2);

    // One field is transparent
    assert(type_node_of<Meters>().signature == "d");
    assert(type_node_of<Empty>().signature == "()");

    assert(type_node_of<Nested>().signature == "((is)adma{sq})");

    std::cout << "  struct signatures checked\n";
    return 0;
}

int test_enum_and_sum_nodes() {
    assert(type_node_of<Direction>().signature == "s");
    assert(type_node_of<Small>().signature == "y");

    // Every variant a unit: bare tag
    assert(type_node_of<Flat>().signature == "s");

    // Payload variants: (tag, box) with one payload node per alternative
    const TypeNode& motion = type_node_of<Motion>();
    assert(motion.signature == "(sv)");
    assert(motion.children.size() == 3);
    assert(motion.children[0]->signature == "()");
    assert(motion.children[1]->signature == "i");
    assert(motion.children[2]->signature == "(ii)");

    std::cout << "  enum and sum type signatures checked\n";
    return 0;
}

int test_caching_and_determinism() {
    const TypeNode& first = type_node_of<Nested>();
    const TypeNode& second = type_node_of<Nested>();
    assert(&first == &second);
    assert(type_node_ptr_of<Nested>() == type_node_ptr_of<Nested>());

    // A fresh build yields the same signature
    auto rebuilt = VariantType<Nested>::node();
    assert(rebuilt->signature == first.signature);
    assert(rebuilt.get() != &first);

    std::cout << "  node cache returns one stable descriptor\n";
    return 0;
}

int test_sparse_children() {
    auto array = TypeNode::leaf("a(is)");
    assert(array->child_or_derived(0)->signature == "(is)");
    assert(array->child_or_derived(1)->signature == "*");
    assert(array->structural_arity() == 1);

    auto dict = TypeNode::leaf("a{sv}");
    assert(dict->child_or_derived(0)->signature == "s");
    assert(dict->child_or_derived(1)->signature == "v");
    assert(dict->structural_arity() == 2);

    auto maybe = TypeNode::leaf("mas");
    assert(maybe->child_or_derived(0)->signature == "as");

    auto tuple = TypeNode::leaf("(ixs)");
    assert(tuple->child_or_derived(1)->signature == "x");
    assert(tuple->child_or_derived(3)->signature == "*");
    assert(tuple->structural_arity() == 3);

    assert(TypeNode::leaf("u")->child_or_derived(0)->signature == "*");

    // Declared children win over derivation
    auto declared = TypeNode::make("(sv)", {TypeNode::unit(), TypeNode::leaf("i")});
    assert(declared->child_or_derived(1)->signature == "i");
    assert(declared->child_or_derived(2)->signature == "*");

    std::cout << "  sparse child derivation checked\n";
    return 0;
}

int main() {
    std::cout << "=== TypeNode Tests ===\n\n";

    std::cout << "Running test_scalar_nodes...\n";
    test_scalar_nodes();

    std::cout << "Running test_container_nodes...\n";
    test_container_nodes();

    std::cout << "Running test_struct_nodes...\n";
    test_struct_nodes();

    std::cout << "Running test_enum_and_sum_nodes...\n";
    test_enum_and_sum_nodes();

    std::cout << "Running test_caching_and_determinism...\n";
    test_caching_and_determinism();

    std::cout << "Running test_sparse_children...\n";
    test_sparse_children();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
