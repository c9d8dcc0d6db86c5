// cfgc/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and by the integration tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cfgc/basic/diagnostic.hpp"
#include "cfgc/basic/source_manager.hpp"
#include "cfgc/project/project_config.hpp"

namespace cfgc
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Lex and parse only
  Build,  ///< Parse, lower, prune and render
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output format (overrides project config; defaults to text)
  std::optional<EmitFormat> emit;

  /// Directory to write rendered files into (overrides project config).
  /// Single-file builds without it only return the rendered text.
  std::optional<std::filesystem::path> output_dir;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

/// Rendered form of one input file.
struct CompileOutput
{
  std::filesystem::path input;
  EmitFormat format = EmitFormat::Text;
  std::string content;
};

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  DiagnosticBag diagnostics;

  /// Every file read during the compile, for printing diagnostics
  SourceRegistry sources;

  /// One entry per successfully built input (Build mode only)
  std::vector<CompileOutput> outputs;

  /// Files written to an output directory
  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full pipeline.
 *
 * 1. Read the file and register it in the SourceRegistry
 * 2. Lex and parse
 * 3. Lower each function to a CFG (Build mode only)
 * 4. Prune every graph
 * 5. Render as text or JSON, optionally writing `<stem>.cfg.txt|json`
 */
class Compiler
{
public:
  /**
   * Compile a single source file.
   *
   * @param file Path to the .c source file. Its spelling is used verbatim in
   *             the `program:` banner.
   * @param options Compile options
   */
  [[nodiscard]] static CompileResult compile_single_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile all entry points of a project.
   *
   * @param config Project configuration (from cfgc.yaml)
   * @param options Compile options (may override config settings)
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

  /// File name of the rendered output for `input`.
  [[nodiscard]] static std::filesystem::path output_file_name(
    const std::filesystem::path & input, EmitFormat format);

private:
  /// Run the pipeline on one file and append to `result`.
  /// Returns false if the file produced errors.
  static bool compile_file(
    const std::filesystem::path & file, const std::string & display_name,
    const CompileOptions & options, EmitFormat format,
    const std::optional<std::filesystem::path> & output_dir, CompileResult & result);

  static bool write_output(
    const CompileOutput & output, const std::filesystem::path & output_dir,
    CompileResult & result, bool verbose);
};

}  // namespace cfgc
