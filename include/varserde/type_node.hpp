/**
 * @file type_node.hpp
 * @brief Immutable type-description tree driving the encoder
 *
 * A TypeNode carries the wire signature of a data type plus, for every
 * position the signature alone cannot describe (tuple slot, array/maybe
 * element, dict key/value, sum-type variant payload), the child node for
 * that position.
 *
 * Nodes are built once per C++ type by VariantType<T>::node() and cached by
 * type_node_of<T>() for the lifetime of the process.
 *
 * Example:
 * @code
 * struct Item { int32_t id; std::string name; };
 * const TypeNode& node = type_node_of<Item>();
 * node.signature;         // "(is)"
 * node.children.size();   // 2
 * @endcode
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace varserde {

struct TypeNode;
using TypeNodePtr = std::shared_ptr<const TypeNode>;

struct TypeNode {
    std::string signature;
    std::vector<TypeNodePtr> children;

    /// Scalar or string node without children
    static TypeNodePtr leaf(std::string signature);

    static TypeNodePtr make(std::string signature, std::vector<TypeNodePtr> children);

    /// "()" with no children
    static TypeNodePtr unit();

    /// "m<element>"
    static TypeNodePtr maybe(TypeNodePtr element);

    /// "a<element>"
    static TypeNodePtr array(TypeNodePtr element);

    /// "a{<key><value>}"
    static TypeNodePtr dict(TypeNodePtr key, TypeNodePtr value);

    /// "(<item0><item1>...)"
    static TypeNodePtr tuple(std::vector<TypeNodePtr> items);

    /**
     * @brief Child node for a structural position
     *
     * Returns the declared child when present. Otherwise the child is derived
     * from the signature alone: element of an array or maybe (index 0), key
     * and value of a dictionary (indices 0 and 1), item N of a tuple. Anything
     * else yields the indefinite type "*".
     */
    TypeNodePtr child_or_derived(std::size_t index) const;

    /// Number of children the signature's top-level constructor implies
    std::size_t structural_arity() const;
};

/**
 * @brief Node construction for a C++ type
 *
 * Specializations provide `static TypeNodePtr node()`. The data model
 * bindings under varserde/bindings/ cover the standard types, reflected
 * aggregates, enums and std::variant sum types.
 */
template<typename T>
struct VariantType;

/// Type usable with type_node_of / encode / decode
template<typename T>
concept HasVariantType = requires {
    { VariantType<T>::node() };
};

/**
 * @brief Cached node for T
 *
 * Built on first use; initialization of the function-local static is
 * exactly-once under concurrent first use and read-only afterwards.
 */
template<typename T>
const TypeNode& type_node_of() {
    static const TypeNodePtr node = VariantType<T>::node();
    return *node;
}

/// Shared handle to the cached node for T
template<typename T>
TypeNodePtr type_node_ptr_of() {
    static const TypeNodePtr node = VariantType<T>::node();
    return node;
}

} // namespace varserde
