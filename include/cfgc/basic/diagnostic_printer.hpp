// cfgc/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
// Output shape:
//
//   error: expected ';' after statement
//     --> demo.c:5:12
//         |
//       5 | x = y + 1
//         |          ^ expected ';'
//         |
//      help: add ';' here
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "cfgc/basic/diagnostic.hpp"
#include "cfgc/basic/source_manager.hpp"

namespace cfgc
{

class DiagnosticPrinter
{
public:
  /**
   * @param os        destination stream (usually std::cerr)
   * @param use_color colorize with rang; forced off when false
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic of the bag ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// True when `os` is std::cerr/std::cout attached to a terminal.
  [[nodiscard]] static bool stream_is_terminal(const std::ostream & os);

private:
  void print_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, const SourceRegistry & sources);
  void print_label(const Label & label, const SourceRegistry & sources);
  void print_fixit(const FixIt & fixit, const SourceRegistry & sources);
  void print_trailer(std::string_view kind, std::string_view message);

  void print_line_number(uint32_t line_num);

  std::ostream & os_;
  bool use_color_;
};

/// Expand tabs to four spaces and drop CR/LF.
[[nodiscard]] std::string expand_tabs(std::string_view line);

}  // namespace cfgc
