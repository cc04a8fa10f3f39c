// pg_sema/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "pg_sema/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace pg_sema
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

std::string display_path(const fs::path & abs_path)
{
  std::error_code ec;
  const auto rel = fs::relative(abs_path, fs::current_path(), ec);
  if (ec || rel.empty()) {
    return abs_path.string();
  }
  return rel.string();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const FileId file_id = primary_range.file_id();

  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (file_id.is_valid()) {
    const std::string filename = display_path(sources.get_path(file_id));
    const FullSourceRange fr = sources.get_full_range(primary_range);
    if (fr.is_valid()) {
      fmt::print(
        os_, "{} {}:{}:{}\n", gutter_arrow(), filename, fr.start_line, fr.start_column);
    } else {
      fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
    }
    fmt::print(os_, "{}\n", gutter_pipe());

    for (const auto & label : diag.labels) {
      print_label_context(label, sources);
    }
  }

  if (diag.object) {
    print_trailer("note", "in " + *diag.object);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? "" : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << name << code << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  if (label.range.is_invalid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const SourceFile * source = sources.get_file(label.range.file_id());
  if (source == nullptr) {
    return;
  }

  const FullSourceRange fr = source->get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  // Multi-line spans are underlined on their first line only.
  uint32_t end_col = fr.start_column + 1;
  if (fr.end_line == fr.start_line && fr.end_column > fr.start_column) {
    end_col = fr.end_column;
  } else if (fr.end_line > fr.start_line) {
    end_col = static_cast<uint32_t>(source->get_line(fr.start_line - 1).size()) + 1;
  }

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  // Tabs are expanded to 4 spaces in both the source line and the marker line.
  std::string cleaned_line;
  std::string marker_prefix;
  cleaned_line.reserve(line.size());
  for (size_t i = 0; i < line.size(); ++i) {
    const bool before_marker = i + 1 < start_col;
    if (line[i] == '\t') {
      cleaned_line += "    ";
      if (before_marker) marker_prefix += "    ";
    } else {
      cleaned_line += line[i];
      if (before_marker) marker_prefix += ' ';
    }
  }

  const uint32_t line_num = line_index + 1;
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} {}", gutter_pipe_only(), marker_prefix);

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", kind, message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? "\033[1;36m  -->\033[0m" : "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? "\033[1;36m      |\033[0m" : "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  return use_color_ ? "\033[1;36m|\033[0m" : "|";
}

}  // namespace pg_sema
