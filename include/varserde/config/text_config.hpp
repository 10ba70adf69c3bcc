#pragma once

#include "varserde/wire/text.hpp"

#include <rfl.hpp>
#include <rfl/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace varserde {

// ============================================================================
// Text Configuration
// ============================================================================

/// Printing and parsing options for the canonical text form
struct TextConfig {
    rfl::DefaultVal<bool> type_annotate = false;
    rfl::DefaultVal<uint32_t> max_depth = wire::DEFAULT_MAX_PARSE_DEPTH;

    // Parse every input against this type instead of inferring it
    std::optional<std::string> expected_type;
};

inline wire::ParseOptions to_parse_options(const TextConfig& config) {
    wire::ParseOptions options;
    options.expected_type = config.expected_type;
    options.max_depth = config.max_depth.value();
    return options;
}

// ============================================================================
// Input Source (TaggedUnion)
// ============================================================================

/// One value per line on standard input
struct StdinSource {};

/// Values listed in the configuration itself
struct InlineSource {
    std::vector<std::string> lines;
};

using InputSource = rfl::TaggedUnion<"source", StdinSource, InlineSource>;

// ============================================================================
// Tool Configuration
// ============================================================================

struct ToolConfig {
    std::string name;
    TextConfig text;
    InputSource input = StdinSource{};
    rfl::DefaultVal<bool> show_signature = true;
};

/// @throws std::runtime_error if the file is missing or malformed
inline ToolConfig load_tool_config(const std::string& filename) {
    return rfl::json::load<ToolConfig>(filename).value();
}

/// @throws std::runtime_error if @p json is malformed
inline ToolConfig read_tool_config(const std::string& json) {
    return rfl::json::read<ToolConfig>(json).value();
}

} // namespace varserde
