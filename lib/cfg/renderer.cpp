// cfgc/cfg/renderer.cpp - Canonical text form of a pruned program
#include "cfgc/cfg/renderer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <sstream>
#include <string>
#include <vector>

namespace cfgc
{

namespace
{

constexpr std::string_view k_annotation_indent = "    ";

std::string join_labels(const std::vector<std::string> & labels)
{
  if (labels.empty()) {
    return "-";
  }
  std::string out;
  for (size_t i = 0; i < labels.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += labels[i];
  }
  return out;
}

void render_edges(std::ostream & os, const Cfg & cfg, const Block & b)
{
  fmt::print(os, "Predecessors: {}\n", join_labels(cfg.sorted_labels(b.preds)));
  fmt::print(os, "Successors: {}\n\n", join_labels(cfg.sorted_labels(b.succs)));
}

bool is_live_target(const Cfg & cfg, BlockId target)
{
  return target.is_valid() && cfg.block(target).is_alive();
}

std::string join_tokens(const std::vector<std::string> & tokens)
{
  std::string out;
  for (const auto & t : tokens) {
    out += t;
  }
  return out;
}

void render_entry(std::ostream & os, const Cfg & cfg)
{
  const Block & entry = cfg.block(cfg.entry());
  fmt::print(os, "@{} {{\n", cfg.label(entry.id));
  fmt::print(os, "   name: {}\n", cfg.name());
  fmt::print(os, "   ret_type: {}\n", join_tokens(cfg.return_type));
  fmt::print(os, "   args: {}\n", cfg.params.empty() ? std::string("-") : join_tokens(cfg.params));
  fmt::print(os, "}}\n");
  render_edges(os, cfg, entry);
}

}  // namespace

// ============================================================================
// Block stanza
// ============================================================================

void render_block(std::ostream & os, const Cfg & cfg, BlockId id)
{
  const Block & b = cfg.block(id);
  if (b.dead) {
    return;
  }

  const bool has_then = is_live_target(cfg, b.then_target);
  const bool has_loop_exit = is_live_target(cfg, b.loop_exit);

  fmt::print(os, "@{} {{\n", cfg.label(id));

  // The annotation belongs to the last control keyword of the block. Its
  // width is measured from that keyword to the end of the block.
  size_t keywords_left = 0;
  for (const auto & f : b.fragments) {
    if (f.is_keyword()) {
      ++keywords_left;
    }
  }

  size_t width = k_annotation_indent.size();
  bool in_last_stmt = false;
  bool pending_placeholder = false;
  for (const auto & f : b.fragments) {
    if (f.is_keyword()) {
      --keywords_left;
      if (keywords_left == 0) {
        in_last_stmt = (f.keyword == ControlKeyword::If) ? has_then : true;
      }
    }

    // An `if` without a live then-target shows an empty body.
    if (f.keyword == ControlKeyword::If && !in_last_stmt) {
      pending_placeholder = true;
    }
    if (pending_placeholder && f.is_stmt_start()) {
      fmt::print(os, "{{ }}\n");
      pending_placeholder = false;
    }

    os << f.text;
    if (in_last_stmt) {
      width += f.size();
    }
  }
  if (pending_placeholder) {
    fmt::print(os, "{{ }}\n");
  }

  if (has_then) {
    width += k_annotation_indent.size();
    fmt::print(os, "{}# then: {}\n", k_annotation_indent, cfg.label(b.then_target));
    const std::string else_label =
      b.else_target.is_valid() ? cfg.label(b.else_target) : std::string("-");
    fmt::print(os, "{}# else: {}\n", std::string(width, ' '), else_label);
  } else if (has_loop_exit) {
    fmt::print(os, "{}# loop_end: {}\n", k_annotation_indent, cfg.label(b.loop_exit));
  }

  fmt::print(os, "}}\n");
  render_edges(os, cfg, b);
}

// ============================================================================
// Functions and program
// ============================================================================

void render_cfg(std::ostream & os, const Cfg & cfg)
{
  render_entry(os, cfg);
  for (const BlockId id : cfg.numbered_blocks()) {
    render_block(os, cfg, id);
  }
  render_block(os, cfg, cfg.exit());
}

void render_program(std::ostream & os, const Program & program, std::string_view input_name)
{
  fmt::print(os, "/*--- program: {} ---*/\n", input_name);

  if (!program.globals.empty()) {
    fmt::print(os, "@Globals {{\n");
    os << join_fragments(program.globals.fragments);
    fmt::print(os, "}}\n");
    fmt::print(os, "Predecessors: -\n");
    fmt::print(os, "Successors: -\n\n");
  }

  for (const auto & cfg : program.functions) {
    render_cfg(os, cfg);
  }
}

std::string render_program_text(const Program & program, std::string_view input_name)
{
  std::ostringstream os;
  render_program(os, program, input_name);
  return os.str();
}

}  // namespace cfgc
