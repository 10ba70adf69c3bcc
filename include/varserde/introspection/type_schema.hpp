/**
 * @file type_schema.hpp
 * @brief Exportable description of a type's wire mapping
 *
 * TypeSchema<T> is rfl-reflectable and combines the C++ type name, the
 * wire signature and the full TypeNode tree, plus field names for
 * reflected aggregates.
 *
 * @code
 * auto json = varserde::IntrospectionHelper::export_as<Item>();
 * // {"type_name":"Item","signature":"(is)","node":{...},"fields":["id","name"]}
 * @endcode
 */

#pragma once

#include "varserde/bindings/structs.hpp"
#include "varserde/type_node.hpp"

#include <rfl.hpp>
#include <rfl/json.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace varserde {

/// One node of the type tree
struct NodeSchema {
    std::string signature;
    std::vector<NodeSchema> children;

    static NodeSchema from(const TypeNode& node) {
        NodeSchema out{node.signature, {}};
        out.children.reserve(node.children.size());
        for (const auto& child : node.children) {
            if (child) {
                out.children.push_back(from(*child));
            }
        }
        return out;
    }
};

namespace detail {

template<typename T>
std::vector<std::string> field_names_of() {
    std::vector<std::string> names;
    if constexpr (ReflectedStruct<T>) {
        for (const auto& field : rfl::fields<T>()) {
            names.push_back(field.name());
        }
    }
    return names;
}

} // namespace detail

template<typename T>
struct TypeSchema {
    std::string type_name = rfl::type_name_t<T>().str();
    std::string signature = type_node_of<T>().signature;
    NodeSchema node = NodeSchema::from(type_node_of<T>());

    // Empty unless T is a reflected aggregate
    std::vector<std::string> fields = detail::field_names_of<T>();
};

struct IntrospectionHelper {
    template<typename T>
    static std::string export_as() {
        return rfl::json::write(TypeSchema<T>{});
    }

    /// JSON array with one schema per type
    template<typename... Ts>
    static std::string export_all() {
        auto all_schemas = std::make_tuple(TypeSchema<Ts>{}...);
        return rfl::json::write(all_schemas);
    }

    template<typename... Ts>
    static void write_to_file(const std::string& filename) {
        auto data = export_all<Ts...>();
        std::ofstream file(filename);
        if (!file) {
            throw std::runtime_error("Failed to open file: " + filename);
        }
        file << data;
    }
};

} // namespace varserde
