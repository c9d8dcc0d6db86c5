// cfgc/basic/diagnostic_printer.cpp - Diagnostic output with source excerpts
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "cfgc/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace cfgc
{

namespace
{

constexpr std::string_view k_gutter = "        |";

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Note:
      return rang::fg::cyan;
  }
  return rang::fg::reset;
}

std::string display_path(const fs::path & path)
{
  std::error_code ec;
  const auto rel = fs::relative(path, fs::current_path(), ec);
  return (ec || rel.empty()) ? path.string() : rel.string();
}

}  // namespace

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

bool DiagnosticPrinter::stream_is_terminal(const std::ostream & os)
{
  if (&os == &std::cerr) {
    return rang::rang_implementation::isTerminal(std::cerr.rdbuf());
  }
  if (&os == &std::cout) {
    return rang::rang_implementation::isTerminal(std::cout.rdbuf());
  }
  return false;
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  print_header(diag);
  // Driver-level problems (missing files, I/O) carry no source location.
  if (!diag.primary_range().is_valid()) {
    if (diag.help_message) {
      print_trailer("help", *diag.help_message);
    }
    return;
  }
  print_location(diag, sources);
  fmt::print(os_, "{}\n", k_gutter);

  for (const auto & label : diag.labels) {
    print_label(label, sources);
  }
  for (const auto & f : diag.fixits) {
    print_fixit(f, sources);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const auto * d : ordered) {
    print(*d, sources);
  }
}

// ============================================================================
// Private helpers
// ============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string tag =
    diag.code.empty() ? std::string(to_string(diag.severity))
                      : fmt::format("{}[{}]", to_string(diag.severity), diag.code);

  os_ << rang::style::bold << severity_color(diag.severity) << tag << rang::fg::reset;
  fmt::print(os_, ": {}", diag.message);
  os_ << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange range = diag.primary_range();
  const std::string filename =
    range.file_id().is_valid() ? display_path(sources.get_path(range.file_id())) : "<unknown>";
  const FullSourceRange fr = sources.get_full_range(range);

  os_ << rang::fg::cyan << "  -->" << rang::fg::reset;
  if (fr.is_valid()) {
    fmt::print(os_, " {}:{}:{}\n", filename, fr.start_line, fr.start_column);
  } else {
    fmt::print(os_, " {}\n", filename);
  }
}

void DiagnosticPrinter::print_line_number(uint32_t line_num)
{
  os_ << rang::fg::cyan;
  fmt::print(os_, " {:>6} ", line_num);
  os_ << rang::fg::reset << "| ";
}

void DiagnosticPrinter::print_label(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (source == nullptr || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const std::string_view raw_line = source->get_line(fr.start_line - 1);
  print_line_number(fr.start_line);
  fmt::print(os_, "{}\n", expand_tabs(raw_line));

  // Columns are byte based; a tab before the marker widens the prefix.
  std::string prefix;
  for (uint32_t i = 0; i + 1 < fr.start_column && i < raw_line.size(); ++i) {
    prefix += raw_line[i] == '\t' ? "    " : " ";
  }
  const uint32_t width = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                           ? fr.end_column - fr.start_column
                           : 1;
  const char marker = label.style == LabelStyle::Primary ? '^' : '-';

  fmt::print(os_, "{} {}", k_gutter, prefix);
  os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
      << rang::style::bold << std::string(width, marker);
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  os_ << rang::style::reset << rang::fg::reset << "\n";
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceRegistry & sources)
{
  const SourceFile * source = sources.get_file(fixit.range.file_id());
  const FullSourceRange fr = sources.get_full_range(fixit.range);

  fmt::print(os_, "{}\n", k_gutter);
  os_ << rang::fg::green << rang::style::bold << "     help" << rang::style::reset
      << rang::fg::reset;
  fmt::print(os_, ": add '{}' here\n", fixit.replacement_text);
  if (source == nullptr || !fr.is_valid()) {
    return;
  }

  // Suggested edit: the line cut at the insertion point with the text spliced in.
  const std::string_view raw_line = source->get_line(fr.start_line - 1);
  const size_t cut = std::min<size_t>(fr.start_column - 1, raw_line.size());
  const std::string head = expand_tabs(raw_line.substr(0, cut));
  const std::string tail = expand_tabs(raw_line.substr(cut));

  print_line_number(fr.start_line);
  fmt::print(os_, "{}{}{}\n", head, fixit.replacement_text, tail);
  fmt::print(os_, "{} {}", k_gutter, std::string(head.size(), ' '));
  os_ << rang::fg::green << rang::style::bold << std::string(fixit.replacement_text.size(), '+')
      << rang::style::reset << rang::fg::reset << "\n";
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", k_gutter);
  os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
      << rang::fg::reset;
  fmt::print(os_, "{}: {}\n", kind, message);
}

}  // namespace cfgc
