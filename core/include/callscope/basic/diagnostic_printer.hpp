// callscope/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their location, notes and help messages in a
// Rust-style layout.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "callscope/basic/diagnostic.hpp"

namespace callscope
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E001]: program location does not exist
 *     --> build/classes
 *      |
 *      = note: ...
 *      = help: pass the directory holding the program manifests
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location(std::string_view location);
  void print_note(std::string_view message);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace callscope
