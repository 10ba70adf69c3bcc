#include "varserde/wire/text.hpp"
#include "varserde/wire/signature.hpp"

#include <glib.h>

#include <charconv>
#include <memory>
#include <optional>
#include <string>

namespace varserde::wire {

namespace {

struct Rejection {
    std::size_t offset;
    std::string message;
};

Error make_error(const Rejection& r) {
    return {ErrorCode::ParseFailure, "Parse error at position " + std::to_string(r.offset) + ": " + r.message};
}

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/**
 * Checks g_variant_parse() leaves to its caller: the text must be UTF-8,
 * \u and \U escapes must name Unicode scalar values (no surrogates), and
 * container nesting must stay within @p max_depth. Brackets inside string
 * literals and inside "@type" annotations do not count.
 */
std::optional<Rejection> screen(std::string_view text, std::uint32_t max_depth) {
    const gchar* invalid = nullptr;
    if (!g_utf8_validate(text.data(), static_cast<gssize>(text.size()), &invalid)) {
        std::size_t offset = static_cast<std::size_t>(invalid - text.data());
        return Rejection{offset, offset < text.size() && text[offset] == '\0' ? "embedded NUL" : "invalid UTF-8"};
    }

    std::uint32_t depth = 0;
    char quote = '\0';
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (c == '\\' && i + 1 < text.size()) {
                char kind = text[i + 1];
                std::size_t digits = kind == 'u' ? 4 : kind == 'U' ? 8 : 0;
                if (digits != 0 && i + 2 + digits <= text.size()) {
                    std::string_view hex = text.substr(i + 2, digits);
                    std::uint32_t code_point = 0;
                    bool all_hex = true;
                    for (char h : hex) {
                        all_hex = all_hex && is_hex(h);
                    }
                    if (all_hex &&
                        std::from_chars(hex.data(), hex.data() + hex.size(), code_point, 16).ec == std::errc()) {
                        if (!g_unichar_validate(code_point)) {
                            return Rejection{i, "invalid Unicode escape '" + std::string(text.substr(i, digits + 2)) + "'"};
                        }
                    }
                }
                ++i;
            }
            ++i;
            continue;
        }

        switch (c) {
            case '\'':
            case '"':
                quote = c;
                break;
            case '@': {
                const gchar* end = nullptr;
                if (i + 1 < text.size() &&
                    g_variant_type_string_scan(text.data() + i + 1, text.data() + text.size(), &end)) {
                    i = static_cast<std::size_t>(end - text.data());
                    continue;
                }
                break;
            }
            case '(':
            case '[':
            case '{':
            case '<':
                if (++depth > max_depth) {
                    return Rejection{i, "maximum nesting depth of " + std::to_string(max_depth) + " exceeded"};
                }
                break;
            case ')':
            case ']':
            case '}':
            case '>':
                if (depth > 0) {
                    --depth;
                }
                break;
            default:
                break;
        }
        ++i;
    }
    return std::nullopt;
}

// GLib reports "start[-end][,start[-end]]:message"
Rejection from_gerror(const GError& error) {
    std::string_view message(error.message);
    std::size_t offset = 0;
    auto position = std::from_chars(message.data(), message.data() + message.size(), offset);
    std::size_t colon = message.find(':');
    if (position.ec != std::errc() || colon == std::string_view::npos) {
        return Rejection{0, std::string(message)};
    }
    return Rejection{offset, std::string(message.substr(colon + 1))};
}

struct ErrorFree {
    void operator()(GError* error) const { g_error_free(error); }
};

struct TypeFree {
    void operator()(GVariantType* type) const { g_variant_type_free(type); }
};

} // namespace

std::string print(const Value& value, bool type_annotate) {
    return value.print(type_annotate);
}

Result<Value> parse(std::string_view text, const ParseOptions& options) {
    std::unique_ptr<GVariantType, TypeFree> type;
    if (options.expected_type) {
        if (!is_valid_type(*options.expected_type)) {
            return Error{ErrorCode::ParseFailure, "Invalid expected type '" + *options.expected_type + "'"};
        }
        type.reset(g_variant_type_new(options.expected_type->c_str()));
    }

    if (text.empty()) {
        text = std::string_view("", 0);
    }
    if (auto rejected = screen(text, options.max_depth)) {
        return make_error(*rejected);
    }

    GError* raw_error = nullptr;
    GVariant* parsed = g_variant_parse(type.get(), text.data(), text.data() + text.size(), nullptr, &raw_error);
    std::unique_ptr<GError, ErrorFree> error(raw_error);
    if (parsed == nullptr) {
        if (!error) {
            return Error{ErrorCode::ParseFailure, "Parse error at position 0: unknown failure"};
        }
        return make_error(from_gerror(*error));
    }
    return Value::take(parsed);
}

Result<Value> parse(std::string_view text, std::string_view expected_type) {
    ParseOptions options;
    options.expected_type = std::string(expected_type);
    return parse(text, options);
}

} // namespace varserde::wire
