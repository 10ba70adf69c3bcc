#include "varserde/wire/signature.hpp"

#include <glib.h>

#include <memory>

namespace varserde::wire {

namespace {

struct TypeFree {
    void operator()(GVariantType* type) const { g_variant_type_free(type); }
};

using TypePtr = std::unique_ptr<GVariantType, TypeFree>;

// Length of the complete GLib type string at the start of @p s, 0 if none
std::size_t scan(std::string_view s) {
    if (s.empty()) {
        return 0;
    }
    const gchar* end = nullptr;
    if (!g_variant_type_string_scan(s.data(), s.data() + s.size(), &end)) {
        return 0;
    }
    return static_cast<std::size_t>(end - s.data());
}

// Owned GVariantType for a complete pattern, null if @p s is not one
TypePtr type_of(std::string_view s) {
    if (s.empty() || scan(s) != s.size()) {
        return nullptr;
    }
    return TypePtr(g_variant_type_new(std::string(s).c_str()));
}

std::string string_of(const GVariantType* type) {
    return std::string(g_variant_type_peek_string(type), g_variant_type_get_string_length(type));
}

// Dict entries may only appear directly inside an array
bool dict_entries_placed(std::string_view s) {
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '{' && (i == 0 || s[i - 1] != code::ARRAY)) {
            return false;
        }
    }
    return true;
}

std::string any() {
    return std::string(1, code::ANY);
}

} // namespace

std::size_t complete_type_length(std::string_view s, std::size_t pos, bool allow_any) {
    if (pos >= s.size()) {
        return 0;
    }
    std::string_view rest = s.substr(pos);
    std::size_t len = scan(rest);
    if (len == 0 || (!allow_any && !is_definite(rest.substr(0, len)))) {
        return 0;
    }
    return len;
}

bool is_valid_type(std::string_view s) {
    if (!is_valid_pattern(s) || !is_definite(s)) {
        return false;
    }
    // A bare dict entry is a valid type on its own
    return s[0] == '{' ? dict_entries_placed(s.substr(1)) : dict_entries_placed(s);
}

bool is_valid_pattern(std::string_view s) {
    return !s.empty() && scan(s) == s.size();
}

bool is_valid_signature(std::string_view s) {
    if (s.find('\0') != std::string_view::npos) {
        return false;
    }
    return g_variant_is_signature(std::string(s).c_str()) && dict_entries_placed(s);
}

bool is_definite(std::string_view s) {
    TypePtr type = type_of(s);
    if (type) {
        return g_variant_type_is_definite(type.get());
    }
    return s.find_first_of("*?r") == std::string_view::npos;
}

bool is_valid_object_path(std::string_view s) {
    if (s.find('\0') != std::string_view::npos) {
        return false;
    }
    return g_variant_is_object_path(std::string(s).c_str());
}

bool is_valid_utf8(std::string_view s) {
    return s.empty() || g_utf8_validate(s.data(), static_cast<gssize>(s.size()), nullptr);
}

bool is_fixed_primitive(std::string_view s) {
    return s.size() == 1 && is_fixed_code(s[0]);
}

bool is_array(std::string_view s) {
    TypePtr type = type_of(s);
    return type && g_variant_type_is_array(type.get());
}

bool is_maybe(std::string_view s) {
    TypePtr type = type_of(s);
    return type && g_variant_type_is_maybe(type.get());
}

bool is_tuple(std::string_view s) {
    TypePtr type = type_of(s);
    return type && g_variant_type_is_tuple(type.get());
}

bool is_dict_entry(std::string_view s) {
    TypePtr type = type_of(s);
    return type && g_variant_type_is_dict_entry(type.get());
}

bool is_dict(std::string_view s) {
    TypePtr type = type_of(s);
    return type && g_variant_type_is_array(type.get()) &&
           g_variant_type_is_dict_entry(g_variant_type_element(type.get()));
}

std::string element_of(std::string_view s) {
    TypePtr type = type_of(s);
    if (type && (g_variant_type_is_array(type.get()) || g_variant_type_is_maybe(type.get()))) {
        return string_of(g_variant_type_element(type.get()));
    }
    return any();
}

std::string key_of(std::string_view s) {
    if (is_array(s)) {
        s = s.substr(1);
    }
    return is_dict_entry(s) ? item_of(s, 0) : any();
}

std::string value_of(std::string_view s) {
    if (is_array(s)) {
        s = s.substr(1);
    }
    return is_dict_entry(s) ? item_of(s, 1) : any();
}

std::vector<std::string> tuple_items(std::string_view s) {
    std::vector<std::string> items;
    TypePtr type = type_of(s);
    if (!type || s[0] == 'r' ||
        (!g_variant_type_is_tuple(type.get()) && !g_variant_type_is_dict_entry(type.get()))) {
        return items;
    }

    for (const GVariantType* item = g_variant_type_first(type.get()); item != nullptr;
         item = g_variant_type_next(item)) {
        items.push_back(string_of(item));
    }
    return items;
}

std::string item_of(std::string_view s, std::size_t index) {
    auto items = tuple_items(s);
    if (index < items.size()) {
        return items[index];
    }
    return any();
}

std::vector<std::string> split_signature(std::string_view s) {
    std::vector<std::string> types;
    std::size_t cursor = 0;
    while (cursor < s.size()) {
        std::size_t len = complete_type_length(s, cursor, true);
        if (len == 0) {
            break;
        }
        types.emplace_back(s.substr(cursor, len));
        cursor += len;
    }
    return types;
}

bool type_matches(std::string_view type, std::string_view pattern) {
    TypePtr concrete = type_of(type);
    TypePtr wanted = type_of(pattern);
    if (!concrete || !wanted) {
        return false;
    }
    return g_variant_type_is_subtype_of(concrete.get(), wanted.get());
}

} // namespace varserde::wire
