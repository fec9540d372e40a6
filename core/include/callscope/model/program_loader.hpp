// callscope/model/program_loader.hpp - Load a Program from program manifests
//
// A program location is either a single JSON manifest or a directory; for a
// directory, every *.json file below it is loaded in sorted path order.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "callscope/basic/diagnostic.hpp"
#include "callscope/model/program_model.hpp"

namespace callscope
{

/**
 * Loads program manifests into a Program.
 *
 * Any unreadable file, JSON syntax error, schema violation or duplicate
 * class fails the whole load; problems are reported to the DiagnosticBag.
 */
class ProgramLoader
{
public:
  /**
   * @param diags DiagnosticBag for error reporting (may be nullptr)
   */
  explicit ProgramLoader(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Load every manifest at `location`.
   *
   * @return the loaded program, or nullptr on failure
   */
  [[nodiscard]] std::unique_ptr<Program> load(const std::filesystem::path & location);

  /**
   * Load a manifest held in memory. `origin` names it in diagnostics.
   *
   * @return the loaded program, or nullptr on failure
   */
  [[nodiscard]] std::unique_ptr<Program> load_from_string(
    std::string_view text, std::string_view origin = "<memory>");

  /**
   * Manifest files below a directory, sorted by path.
   *
   * Sets `ec` and returns an empty list when the directory or one of its
   * *.json entries cannot be read.
   */
  [[nodiscard]] static std::vector<std::filesystem::path> collect_manifests(
    const std::filesystem::path & dir, std::error_code & ec);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }

private:
  bool load_file(Program & program, const std::filesystem::path & file);
  bool load_text(Program & program, std::string_view text, const std::string & origin);
  bool load_document(Program & program, const nlohmann::json & doc, const std::string & origin);

  void report(const char * code, std::string message, const std::string & origin);

  DiagnosticBag * diags_ = nullptr;
  bool has_errors_ = false;
};

}  // namespace callscope
