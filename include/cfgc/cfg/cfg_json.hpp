// cfgc/cfg/cfg_json.hpp - JSON form of a pruned program
#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

#include "cfgc/cfg/cfg.hpp"

namespace cfgc
{

/**
 * Serialize a pruned program.
 *
 * ```json
 * {
 *   "program": "input.c",
 *   "globals": "    int g ; \n",
 *   "functions": [{
 *     "name": "main", "ret_type": "int ", "args": "",
 *     "blocks": [{
 *       "label": "main_B0", "text": "...",
 *       "then": "main_B1", "else": "main_B2", "loop_end": null,
 *       "predecessors": ["main_entry"], "successors": ["main_B1", "main_B2"]
 *     }]
 *   }]
 * }
 * ```
 *
 * Blocks appear in render order: entry, live numbered blocks, exit.
 * Annotation keys are null when the block has no such target.
 */
[[nodiscard]] nlohmann::json to_json(const Program & program, std::string_view input_name);

/// One function graph, in the shape of an element of "functions".
[[nodiscard]] nlohmann::json to_json(const Cfg & cfg);

}  // namespace cfgc
