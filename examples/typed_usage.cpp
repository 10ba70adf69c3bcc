/**
 * @file typed_usage.cpp
 * @brief Encoding and decoding application types
 *
 * Shows how to:
 * 1. Encode structs, enums and sum types
 * 2. Decode values back from canonical text
 * 3. Carry dynamically typed values in a VariantDict
 * 4. Export type schemas
 */

#include <varserde/varserde.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Item {
    int32_t id;
    std::string name;
};

enum class Direction { North, East, South, West };

struct Stop {};
struct Move { int32_t distance; };
struct Turn { Direction direction; uint8_t degrees; };

using Command = std::variant<Stop, Move, Turn>;

template<>
struct varserde::TagTraits<Command> {
    static constexpr TagMode tag_mode = TagMode::Index;
};

namespace {

template<typename T>
void show(const char* label, const T& value) {
    auto encoded = varserde::encode(value);
    if (!encoded) {
        std::cerr << "[varserde] " << label << ": " << encoded.error().message << "\n";
        return;
    }
    std::cout << "  " << label << ": " << encoded->type_string() << "  " << encoded->to_string() << "\n";
}

} // namespace

int main() {
    std::cout << "=== VariantSerde Typed Usage ===\n\n";

    // ========================================================================
    // 1. Encoding
    // ========================================================================
    std::cout << "1. Encoding:\n";
    show("bool", true);
    show("struct", Item{1, "Item"});
    show("enum", Direction::South);
    show("optional", std::optional<std::string>{});
    show("map", std::map<uint64_t, std::string>{{2, "World"}});
    show("sum type", Command{Move{2}});
    show("sum type", Command{Turn{Direction::West, 90}});
    std::cout << "\n";

    // ========================================================================
    // 2. Decoding from text
    // ========================================================================
    std::cout << "2. Decoding:\n";
    auto item = varserde::decode_text<Item>("(7, 'Seven')");
    if (item) {
        std::cout << "  Item{" << item->id << ", " << item->name << "}\n";
    }

    auto bad = varserde::decode_text<std::pair<int32_t, int32_t>>("(1, 2, 3)");
    if (!bad) {
        std::cout << "  rejected: " << bad.error().message << "\n";
    }
    std::cout << "\n";

    // ========================================================================
    // 3. Dynamic values
    // ========================================================================
    std::cout << "3. VariantDict:\n";
    varserde::VariantDict dict;
    for (auto inserted : {dict.insert("count", uint32_t{3}),
                          dict.insert("path", varserde::ObjectPath("/com/org/Test")),
                          dict.insert("values", std::vector<double>{1.5, 2.5})}) {
        if (!inserted) {
            std::cerr << "[varserde] insert failed: " << inserted.error().message << "\n";
            return 1;
        }
    }
    show("dict", dict);

    auto count = dict.lookup<uint32_t>("count");
    if (count && *count) {
        std::cout << "  count = " << **count << "\n";
    }
    std::cout << "\n";

    // ========================================================================
    // 4. Schema export
    // ========================================================================
    std::cout << "4. Schemas:\n";
    std::cout << varserde::IntrospectionHelper::export_as<Item>() << "\n";
    std::cout << varserde::IntrospectionHelper::export_all<Direction, Command>() << "\n";

    return 0;
}
