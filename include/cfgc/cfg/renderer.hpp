// cfgc/cfg/renderer.hpp - Canonical text form of a pruned program
#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "cfgc/cfg/cfg.hpp"

namespace cfgc
{

/**
 * Write the whole program: the `program: <input>` banner comment, the
 * `@Globals` stanza when there are globals, then per function its entry
 * stanza, the live numbered blocks and the exit stanza.
 *
 * Every stanza is followed by its `Predecessors:` and `Successors:` lines
 * and a blank line. Dead blocks are not printed.
 */
void render_program(std::ostream & os, const Program & program, std::string_view input_name);

/// render_program() into a string.
[[nodiscard]] std::string render_program_text(const Program & program, std::string_view input_name);

/// Entry, live body blocks and exit of one function.
void render_cfg(std::ostream & os, const Cfg & cfg);

/// A single block stanza including its predecessor/successor lines.
void render_block(std::ostream & os, const Cfg & cfg, BlockId id);

}  // namespace cfgc
