#include "varserde/type_node.hpp"
#include "varserde/wire/signature.hpp"

namespace varserde {

TypeNodePtr TypeNode::leaf(std::string signature) {
    return std::make_shared<const TypeNode>(TypeNode{std::move(signature), {}});
}

TypeNodePtr TypeNode::make(std::string signature, std::vector<TypeNodePtr> children) {
    return std::make_shared<const TypeNode>(TypeNode{std::move(signature), std::move(children)});
}

TypeNodePtr TypeNode::unit() {
    static const TypeNodePtr node = leaf("()");
    return node;
}

TypeNodePtr TypeNode::maybe(TypeNodePtr element) {
    std::string signature = "m" + element->signature;
    return make(std::move(signature), {std::move(element)});
}

TypeNodePtr TypeNode::array(TypeNodePtr element) {
    std::string signature = "a" + element->signature;
    return make(std::move(signature), {std::move(element)});
}

TypeNodePtr TypeNode::dict(TypeNodePtr key, TypeNodePtr value) {
    std::string signature = "a{" + key->signature + value->signature + "}";
    return make(std::move(signature), {std::move(key), std::move(value)});
}

TypeNodePtr TypeNode::tuple(std::vector<TypeNodePtr> items) {
    std::string signature = "(";
    for (const auto& item : items) {
        signature += item->signature;
    }
    signature += ")";
    return make(std::move(signature), std::move(items));
}

TypeNodePtr TypeNode::child_or_derived(std::size_t index) const {
    if (index < children.size()) {
        return children[index];
    }

    if (wire::is_array(signature) || wire::is_maybe(signature)) {
        std::string element = wire::element_of(signature);
        if (wire::is_dict_entry(element)) {
            if (index == 0) return leaf(wire::key_of(element));
            if (index == 1) return leaf(wire::value_of(element));
        } else if (index == 0) {
            return leaf(std::move(element));
        }
    } else if (wire::is_tuple(signature)) {
        auto items = wire::tuple_items(signature);
        if (index < items.size()) {
            return leaf(std::move(items[index]));
        }
    }

    return leaf(std::string(1, wire::code::ANY));
}

std::size_t TypeNode::structural_arity() const {
    if (wire::is_dict(signature)) {
        return 2;
    }
    if (wire::is_array(signature) || wire::is_maybe(signature)) {
        return 1;
    }
    if (wire::is_tuple(signature) || wire::is_dict_entry(signature)) {
        return wire::tuple_items(signature).size();
    }
    return 0;
}

} // namespace varserde
