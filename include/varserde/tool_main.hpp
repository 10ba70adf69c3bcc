/**
 * @file tool_main.hpp
 * @brief Line-oriented text converter driven by a JSON ToolConfig
 *
 * Reads lines from stdin or from the config's inline list, parses each one
 * with the configured ParseOptions and writes its signature and canonical
 * text. Shared by the varserde_print example and the config tests.
 */

#pragma once

#include "varserde/config/text_config.hpp"
#include "varserde/wire/text.hpp"

#include <rfl.hpp>

#include <cstddef>
#include <exception>
#include <iostream>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace varserde {

/**
 * @brief Convert each input line to its signature and canonical text
 *
 * Every line is parsed independently. A line that fails to parse is
 * reported on @p err and the remaining lines are still processed.
 *
 * Output per line: "<signature>\t<text>" (signature only with
 * show_signature).
 *
 * @return Number of lines that failed
 */
inline std::size_t run_tool(const ToolConfig& config, std::istream& in, std::ostream& out, std::ostream& err) {
    std::vector<std::string> lines;
    if (const auto* inline_source = rfl::get_if<InlineSource>(&config.input.variant())) {
        lines = inline_source->lines;
    } else {
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
    }

    wire::ParseOptions options = to_parse_options(config.text);
    bool annotate = config.text.type_annotate.value();
    std::size_t failures = 0;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].empty()) {
            continue;
        }
        auto value = wire::parse(lines[i], options);
        if (!value) {
            err << "[" << config.name << "] line " << (i + 1) << ": " << value.error().message << "\n";
            ++failures;
            continue;
        }
        if (config.show_signature.value()) {
            out << value->type_string() << "\t";
        }
        out << wire::print(*value, annotate) << "\n";
    }
    return failures;
}

/**
 * @brief Main entry point for the conversion tool
 *
 * Requires exactly one argument, a JSON configuration file:
 * @code
 * {"name": "varserde-tool", "text": {"type_annotate": true},
 *  "input": {"source": "InlineSource", "lines": ["[1, 2]", "<uint16 5>"]}}
 * @endcode
 *
 * @return 0 if every line converted, 1 otherwise
 */
inline int tool_main(int argc, char** argv) {
    try {
        if (argc != 2) {
            std::cerr << "[varserde-tool] ERROR: Configuration file required\n";
            std::cerr << "Usage: " << argv[0] << " <config.json>\n";
            return 1;
        }

        std::string filename = argv[1];
        if (!filename.ends_with(".json")) {
            std::cerr << "[varserde-tool] ERROR: Only JSON config files supported (got: " << filename << ")\n";
            std::cerr << "Usage: " << argv[0] << " <config.json>\n";
            return 1;
        }

        ToolConfig config = load_tool_config(filename);
        std::cout << "[" << config.name << "] Converting values\n";

        std::size_t failures = run_tool(config, std::cin, std::cout, std::cerr);
        if (failures > 0) {
            std::cerr << "[" << config.name << "] " << failures << " line(s) failed\n";
            return 1;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[varserde-tool] Fatal error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace varserde

/**
 * @brief Generates main() calling varserde::tool_main(argc, argv)
 */
#define VARSERDE_TOOL_MAIN() \
    int main(int argc, char** argv) { \
        return varserde::tool_main(argc, argv); \
    }
