// cfgc/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// One-call parse (and optionally lower + prune) pipeline over an in-memory
// source. Ownership stays explicit: the unit owns the registry, arena and bag.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "cfgc/ast/ast_context.hpp"
#include "cfgc/basic/diagnostic.hpp"
#include "cfgc/basic/source_manager.hpp"
#include "cfgc/cfg/cfg.hpp"
#include "cfgc/cfg/cfg_lowering.hpp"
#include "cfgc/cfg/pruner.hpp"
#include "cfgc/cfg/renderer.hpp"
#include "cfgc/syntax/frontend.hpp"

namespace cfgc::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  TranslationUnit * unit = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.c")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();
  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.unit = parsed.unit;
  return out;
}

/// Lower a parsed unit and prune every function graph.
[[nodiscard]] inline Program build_pruned(const TestParseUnit & parsed)
{
  Program program = lower_translation_unit(*parsed.unit);
  for (auto & cfg : program.functions) {
    prune(cfg);
  }
  return program;
}

/// Full pipeline on an in-memory source. Returns "" if parsing failed.
[[nodiscard]] inline std::string render_source(
  std::string src, const std::string & input_name = "test.c")
{
  const TestParseUnit parsed = parse(std::move(src));
  if (parsed.diags.has_errors()) {
    return "";
  }
  return render_program_text(build_pruned(parsed), input_name);
}

}  // namespace cfgc::test_support
