/**
 * @file varserde_print.cpp
 * @brief Converts values in text form to their signature and canonical text
 *
 * Run:
 *   ./varserde_print config/varserde_print.json
 *   echo "[1, 2, 3]" | ./varserde_print config/stdin.json
 */

#include <varserde/tool_main.hpp>

VARSERDE_TOOL_MAIN()
