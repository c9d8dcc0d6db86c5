// cfgc/driver/compiler.cpp - Compiler driver implementation
//
#include "cfgc/driver/compiler.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

#include "cfgc/ast/ast_context.hpp"
#include "cfgc/cfg/cfg_json.hpp"
#include "cfgc/cfg/cfg_lowering.hpp"
#include "cfgc/cfg/pruner.hpp"
#include "cfgc/cfg/renderer.hpp"
#include "cfgc/syntax/frontend.hpp"

namespace cfgc
{

namespace fs = std::filesystem;

namespace
{

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

fs::path Compiler::output_file_name(const fs::path & input, EmitFormat format)
{
  const char * ext = format == EmitFormat::Json ? ".cfg.json" : ".cfg.txt";
  return fs::path(input.stem().string() + ext);
}

bool Compiler::compile_file(
  const fs::path & file, const std::string & display_name, const CompileOptions & options,
  EmitFormat format, const std::optional<fs::path> & output_dir, CompileResult & result)
{
  if (!fs::exists(file)) {
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return false;
  }

  auto text = read_file(file);
  if (!text) {
    result.diagnostics.report_error(SourceRange{}, "failed to read file: " + file.string());
    return false;
  }

  if (options.verbose) {
    fmt::print(stderr, "parsing {}\n", file.string());
  }

  DiagnosticBag diags;
  AstContext ast;
  const ParseOutput parsed = parse_source(result.sources, file, std::move(*text), ast, diags);
  const bool ok = !diags.has_errors() && parsed.unit != nullptr;
  result.diagnostics.merge(std::move(diags));
  if (!ok || options.mode == CompileMode::Check) {
    return ok;
  }

  Program program = lower_translation_unit(*parsed.unit);
  for (auto & cfg : program.functions) {
    const size_t built = cfg.numbered_blocks().size();
    const PruneStats stats = prune(cfg);
    if (options.verbose) {
      fmt::print(
        stderr, "function {}: {} blocks built, {} after pruning\n", cfg.name(), built,
        stats.remaining);
    }
  }

  CompileOutput output;
  output.input = file;
  output.format = format;
  if (format == EmitFormat::Json) {
    output.content = to_json(program, display_name).dump(2) + "\n";
  } else {
    output.content = render_program_text(program, display_name);
  }

  if (output_dir && !write_output(output, *output_dir, result, options.verbose)) {
    return false;
  }
  result.outputs.push_back(std::move(output));
  return true;
}

bool Compiler::write_output(
  const CompileOutput & output, const fs::path & output_dir, CompileResult & result,
  bool verbose)
{
  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    result.diagnostics.report_error(
      SourceRange{}, "cannot create output directory " + output_dir.string() + ": " + ec.message());
    return false;
  }

  const fs::path path = output_dir / output_file_name(output.input, output.format);
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    result.diagnostics.report_error(SourceRange{}, "failed to open output file: " + path.string());
    return false;
  }
  out << output.content;
  out.close();
  if (!out) {
    result.diagnostics.report_error(SourceRange{}, "failed to write output file: " + path.string());
    return false;
  }

  if (verbose) {
    fmt::print(stderr, "wrote {}\n", path.string());
  }
  result.generated_files.push_back(path);
  return true;
}

CompileResult Compiler::compile_single_file(
  const fs::path & file, const CompileOptions & options)
{
  CompileResult result;
  const EmitFormat format = options.emit.value_or(EmitFormat::Text);
  compile_file(file, file.string(), options, format, options.output_dir, result);
  result.success = !result.diagnostics.has_errors();
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;

  if (config.compiler.entry_points.empty()) {
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  const fs::path output_dir =
    options.output_dir.value_or(config.project_root / config.compiler.output_dir);
  const EmitFormat format = options.emit.value_or(config.compiler.emit);

  if (options.verbose) {
    fmt::print(
      stderr, "project {} ({} entry points)\n", config.package.name,
      config.compiler.entry_points.size());
  }

  // Keep going after a failing entry point to collect all diagnostics.
  for (const auto & entry_rel : config.compiler.entry_points) {
    const fs::path entry_path = config.project_root / entry_rel;
    compile_file(entry_path, entry_rel.string(), options, format, output_dir, result);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace cfgc
