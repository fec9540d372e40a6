// callscope/model/program_loader.cpp - Program manifest loading
//
#include "callscope/model/program_loader.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <system_error>

namespace callscope
{

namespace fs = std::filesystem;

namespace
{

using nlohmann::json;

/// Read an optional array of strings; nullopt if present but malformed
std::optional<std::vector<std::string>> string_list(const json & obj, const char * key)
{
  std::vector<std::string> out;
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return out;
  }
  if (!it->is_array()) {
    return std::nullopt;
  }
  out.reserve(it->size());
  for (const auto & item : *it) {
    if (!item.is_string()) {
      return std::nullopt;
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

}  // namespace

std::unique_ptr<Program> ProgramLoader::load(const fs::path & location)
{
  has_errors_ = false;
  const std::string origin = location.string();

  std::error_code ec;
  if (!fs::exists(location, ec)) {
    report(
      diag_code::k_program_location,
      ec ? fmt::format("cannot access program location: {}", ec.message())
         : std::string("program location does not exist"),
      origin);
    return nullptr;
  }

  const bool is_dir = fs::is_directory(location, ec);
  if (ec) {
    report(
      diag_code::k_program_location,
      fmt::format("cannot access program location: {}", ec.message()), origin);
    return nullptr;
  }

  auto program = std::make_unique<Program>();

  if (is_dir) {
    const auto files = collect_manifests(location, ec);
    if (ec) {
      report(
        diag_code::k_program_location,
        fmt::format("cannot read program location: {}", ec.message()), origin);
      return nullptr;
    }
    if (files.empty()) {
      report(
        diag_code::k_program_location, "program location contains no *.json manifests", origin);
      return nullptr;
    }
    for (const auto & file : files) {
      if (!load_file(*program, file)) {
        return nullptr;
      }
    }
  } else if (!load_file(*program, location)) {
    return nullptr;
  }

  return program;
}

std::unique_ptr<Program> ProgramLoader::load_from_string(
  std::string_view text, std::string_view origin)
{
  has_errors_ = false;
  auto program = std::make_unique<Program>();
  if (!load_text(*program, text, std::string(origin))) {
    return nullptr;
  }
  return program;
}

std::vector<fs::path> ProgramLoader::collect_manifests(const fs::path & dir, std::error_code & ec)
{
  ec.clear();
  std::vector<fs::path> files;
  fs::recursive_directory_iterator it(dir, ec);
  for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() != ".json") {
      continue;
    }
    // A *.json entry whose status cannot be read (dangling link, no permission) fails the scan
    const bool regular = it->is_regular_file(ec);
    if (ec) {
      break;
    }
    if (regular) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return {};
  }
  std::sort(files.begin(), files.end());
  return files;
}

bool ProgramLoader::load_file(Program & program, const fs::path & file)
{
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    report(diag_code::k_program_location, "failed to open manifest", file.string());
    return false;
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return load_text(program, ss.str(), file.string());
}

bool ProgramLoader::load_text(Program & program, std::string_view text, const std::string & origin)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    report(diag_code::k_manifest_parse, fmt::format("invalid JSON: {}", e.what()), origin);
    return false;
  }
  return load_document(program, doc, origin);
}

bool ProgramLoader::load_document(Program & program, const json & doc, const std::string & origin)
{
  if (!doc.is_object() || !doc.contains("classes") || !doc["classes"].is_array()) {
    report(diag_code::k_manifest_schema, "manifest must be an object with a 'classes' list", origin);
    return false;
  }

  for (const auto & cls_node : doc["classes"]) {
    if (!cls_node.is_object()) {
      report(diag_code::k_manifest_schema, "class entry must be an object", origin);
      return false;
    }

    const auto name_it = cls_node.find("name");
    if (name_it == cls_node.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
      report(diag_code::k_manifest_schema, "class entry requires a non-empty 'name'", origin);
      return false;
    }

    auto cls = std::make_unique<ClassDescriptor>(name_it->get<std::string>());

    const auto methods_it = cls_node.find("methods");
    if (methods_it != cls_node.end() && !methods_it->is_null()) {
      if (!methods_it->is_array()) {
        report(
          diag_code::k_manifest_schema,
          fmt::format("class '{}': 'methods' must be a list", cls->name()), origin);
        return false;
      }

      for (const auto & m : *methods_it) {
        if (!m.is_object() || !m.contains("name") || !m["name"].is_string()) {
          report(
            diag_code::k_manifest_schema,
            fmt::format("class '{}': method entry requires a 'name'", cls->name()), origin);
          return false;
        }
        const std::string method_name = m["name"].get<std::string>();

        auto params = string_list(m, "parameters");
        auto calls = string_list(m, "invocations");
        if (!params || !calls) {
          report(
            diag_code::k_manifest_schema,
            fmt::format(
              "method '{}.{}': 'parameters' and 'invocations' must be lists of strings",
              cls->name(), method_name),
            origin);
          return false;
        }

        std::string return_type = "void";
        if (m.contains("return_type")) {
          if (!m["return_type"].is_string()) {
            report(
              diag_code::k_manifest_schema,
              fmt::format("method '{}.{}': 'return_type' must be a string", cls->name(), method_name),
              origin);
            return false;
          }
          return_type = m["return_type"].get<std::string>();
        }

        std::vector<InvocationSite> sites;
        sites.reserve(calls->size());
        for (auto & target : *calls) {
          sites.push_back(InvocationSite{std::move(target)});
        }

        cls->add_method(method_name, std::move(*params), std::move(return_type), std::move(sites));
      }
    }

    const std::string class_name = cls->name();
    if (!program.add_class(std::move(cls))) {
      report(diag_code::k_manifest_schema, fmt::format("duplicate class '{}'", class_name), origin);
      return false;
    }
  }

  return true;
}

void ProgramLoader::report(const char * code, std::string message, const std::string & origin)
{
  has_errors_ = true;
  if (diags_) {
    diags_->report_error(std::move(message)).with_code(code).with_location(origin);
  }
}

}  // namespace callscope
